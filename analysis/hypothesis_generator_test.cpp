#include "analysis/hypothesis_generator.h"

#include "gtest/gtest.h"

namespace geneflow {
namespace {

AnalysisResult Analyze(const std::string& seq) {
  SequenceAnalyzer analyzer;
  auto result = analyzer.Analyze(seq);
  EXPECT_TRUE(result.ok()) << result.status();
  return result.ok() ? *result : AnalysisResult{};
}

TEST(HypothesisGeneratorTest, FallsBackToGeneralHypothesis) {
  HypothesisGenerator generator;
  auto hypotheses = generator.Generate(Analyze("GGGGCCCC"), {});
  ASSERT_EQ(hypotheses.size(), 1);
  EXPECT_DOUBLE_EQ(hypotheses[0].confidence, 0.60);
  EXPECT_EQ(hypotheses[0].suggested_experiments.size(), 3);
}

TEST(HypothesisGeneratorTest, PromoterAndOrfRules) {
  HypothesisGenerator generator;
  auto hypotheses = generator.Generate(Analyze("GGTATAAAGGATGAAATAA"), {});
  ASSERT_EQ(hypotheses.size(), 2);
  EXPECT_DOUBLE_EQ(hypotheses[0].confidence, 0.85);
  EXPECT_NE(hypotheses[0].evidence.find("TATA_box@2"), std::string::npos);
  EXPECT_DOUBLE_EQ(hypotheses[1].confidence, 0.75);
  EXPECT_NE(hypotheses[1].evidence.find("ORF_10_19"), std::string::npos);
}

TEST(HypothesisGeneratorTest, SignalPeptideRule) {
  HypothesisGenerator generator;
  ProteinProfile protein;
  protein.orf_id = "ORF_0_9";
  protein.signal_peptide = true;
  auto hypotheses = generator.Generate(Analyze("ATGAAATAA"), {protein});
  ASSERT_EQ(hypotheses.size(), 2);
  EXPECT_DOUBLE_EQ(hypotheses[0].confidence, 0.78);
  EXPECT_NE(hypotheses[0].evidence.find("ORF_0_9"), std::string::npos);
}

TEST(HypothesisGeneratorTest, HighHomologyRule) {
  HypothesisGenerator generator;
  ComparisonResult comparison;
  comparison.homology = "high homology";
  comparison.similarity_percent = 95.0;
  auto hypotheses = generator.Generate(Analyze("GGGGCCCC"), {}, comparison);
  ASSERT_EQ(hypotheses.size(), 1);
  EXPECT_DOUBLE_EQ(hypotheses[0].confidence, 0.7);
}

TEST(HypothesisGeneratorTest, MinConfidenceFilters) {
  HypothesisOptions options;
  options.min_confidence = 0.8;
  HypothesisGenerator generator(options);
  auto hypotheses = generator.Generate(Analyze("GGTATAAAGGATGAAATAA"), {});
  ASSERT_EQ(hypotheses.size(), 1);
  EXPECT_DOUBLE_EQ(hypotheses[0].confidence, 0.85);

  EXPECT_TRUE(generator.Generate(Analyze("GGGGCCCC"), {}).empty());
}

}  // namespace
}  // namespace geneflow
