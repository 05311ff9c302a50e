#include "analysis/sequence_comparator.h"

#include "gtest/gtest.h"

#include "core/errors.h"

namespace geneflow {
namespace {

TEST(SequenceComparatorTest, IdenticalSequences) {
  SequenceComparator comparator;
  auto result = comparator.Compare("ACGTACGT", "acgt acgt");
  ASSERT_TRUE(result.ok()) << result.status();
  EXPECT_EQ(result->query_row, "ACGTACGT");
  EXPECT_EQ(result->match_row, "||||||||");
  EXPECT_EQ(result->target_row, "ACGTACGT");
  EXPECT_EQ(result->score, 16);
  EXPECT_DOUBLE_EQ(result->identity_percent, 100.0);
  EXPECT_DOUBLE_EQ(result->similarity_percent, 100.0);
  EXPECT_EQ(result->homology, "high homology");
}

TEST(SequenceComparatorTest, EqualLengthTransversionIsMismatch) {
  SequenceComparator comparator;
  auto result = comparator.Compare("AAAA", "ACAA");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result->match_row, "| ||");
  EXPECT_EQ(result->matches, 3);
  EXPECT_EQ(result->transitions, 0);
  EXPECT_EQ(result->gaps, 0);
  EXPECT_DOUBLE_EQ(result->identity_percent, 75.0);
  EXPECT_DOUBLE_EQ(result->similarity_percent, 75.0);
}

TEST(SequenceComparatorTest, TransitionGetsHalfCredit) {
  SequenceComparator comparator;
  auto result = comparator.Compare("ACAA", "ATAA");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result->match_row, "|:||");
  EXPECT_EQ(result->transitions, 1);
  EXPECT_DOUBLE_EQ(result->identity_percent, 75.0);
  EXPECT_DOUBLE_EQ(result->similarity_percent, 87.5);
}

TEST(SequenceComparatorTest, DeletionProducesGap) {
  SequenceComparator comparator;
  auto result = comparator.Compare("ACGTACGT", "ACGACGT");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result->query_row, "ACGTACGT");
  EXPECT_EQ(result->target_row, "ACG-ACGT");
  EXPECT_EQ(result->aligned_length, 8);
  EXPECT_EQ(result->gaps, 1);
  EXPECT_EQ(result->matches, 7);
  EXPECT_EQ(result->score, 7 * 2 - 3);
  EXPECT_DOUBLE_EQ(result->identity_percent, 87.5);
}

TEST(SequenceComparatorTest, UnrelatedSequencesAreLowHomology) {
  SequenceComparator comparator;
  auto result = comparator.Compare("AAAAAAAA", "CCCCCCCC");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result->matches, 0);
  EXPECT_DOUBLE_EQ(result->identity_percent, 0.0);
  EXPECT_EQ(result->homology, "low homology");
}

TEST(SequenceComparatorTest, UnknownBaseNeverMatches) {
  SequenceComparator comparator;
  auto result = comparator.Compare("ANA", "ANA");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result->matches, 2);
  EXPECT_EQ(result->match_row, "| |");
}

TEST(SequenceComparatorTest, ConfigurableThresholds) {
  AlignmentScoring scoring;
  scoring.high_homology_threshold = 90.0;
  scoring.moderate_homology_threshold = 50.0;
  SequenceComparator comparator(scoring);
  auto result = comparator.Compare("ACAA", "ATAA");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result->homology, "moderate homology");
}

TEST(SequenceComparatorTest, RejectsInvalidInput) {
  SequenceComparator comparator;
  auto result = comparator.Compare("ACGT", "");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(GetErrorKind(result.status()), ErrorKind::kInvalidSequence);

  result = comparator.Compare("HELLO", "ACGT");
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(GetErrorKind(result.status()), ErrorKind::kInvalidSequence);
}

TEST(SequenceComparatorTest, IsTransition) {
  EXPECT_TRUE(SequenceComparator::IsTransition('A', 'G'));
  EXPECT_TRUE(SequenceComparator::IsTransition('C', 'T'));
  EXPECT_FALSE(SequenceComparator::IsTransition('A', 'C'));
  EXPECT_FALSE(SequenceComparator::IsTransition('A', 'A'));
}

}  // namespace
}  // namespace geneflow
