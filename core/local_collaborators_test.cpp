#include "core/local_collaborators.h"

#include <filesystem>

#include <gtest/gtest.h>

#include "core/file_util.h"

namespace geneflow {
namespace {

class LocalCollaboratorsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir = (std::filesystem::temp_directory_path() /
           ("geneflow_local_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name())))
              .string();
    std::filesystem::remove_all(dir);
  }
  void TearDown() override { std::filesystem::remove_all(dir); }

  std::string dir;
};

TEST_F(LocalCollaboratorsTest, OfflineLiteratureReturnsNoPapers) {
  OfflineLiteratureClient client;
  auto result = client.Search("TATA_box gene", 5);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result->total_results, 0);
  EXPECT_TRUE(result->papers.empty());
}

TEST_F(LocalCollaboratorsTest, GcProfileWindows) {
  std::string seq(100, 'A');
  seq += std::string(100, 'G');
  nlohmann::json points = JsonVisualizationWriter::GcProfile(seq);
  // Windows start at 0, 10, ..., 100.
  ASSERT_EQ(points.size(), 11);
  EXPECT_EQ(points[0]["position"], 50);
  EXPECT_DOUBLE_EQ(points[0]["gc_percent"].get<double>(), 0.0);
  EXPECT_DOUBLE_EQ(points[5]["gc_percent"].get<double>(), 50.0);
  EXPECT_DOUBLE_EQ(points[10]["gc_percent"].get<double>(), 100.0);

  nlohmann::json short_points = JsonVisualizationWriter::GcProfile("GCAT");
  ASSERT_EQ(short_points.size(), 1);
  EXPECT_DOUBLE_EQ(short_points[0]["gc_percent"].get<double>(), 50.0);
  EXPECT_TRUE(JsonVisualizationWriter::GcProfile("").empty());
}

TEST_F(LocalCollaboratorsTest, RenderWritesPlotFiles) {
  SequenceAnalyzer analyzer;
  auto analysis = analyzer.Analyze("ATGAAATAAGGGCCC");
  ASSERT_TRUE(analysis.ok());

  JsonVisualizationWriter writer(dir);
  auto result = writer.Render("run1", *analysis);
  ASSERT_TRUE(result.ok()) << result.status();
  ASSERT_EQ(result->plots.size(), 2);
  EXPECT_EQ(result->plots[0].name, "gc_profile");
  EXPECT_EQ(result->plots[1].name, "orf_map");

  auto orf_map = ReadFileToString(result->plots[1].path);
  ASSERT_TRUE(orf_map.ok());
  auto doc = nlohmann::json::parse(*orf_map, nullptr, false);
  ASSERT_FALSE(doc.is_discarded());
  ASSERT_EQ(doc["orfs"].size(), 1);
  EXPECT_EQ(doc["orfs"][0]["id"], "ORF_0_9");
  EXPECT_EQ(doc["orfs"][0]["strand"], "+");
}

TEST_F(LocalCollaboratorsTest, ReportReportsRealFileSize) {
  JsonReportWriter writer(dir);
  auto info = writer.Build("run2", {{"success", true}});
  ASSERT_TRUE(info.ok()) << info.status();
  EXPECT_EQ(info->page_count, 1);
  EXPECT_EQ(info->file_size_bytes, static_cast<int64_t>(std::filesystem::file_size(info->report_path)));

  auto content = ReadFileToString(info->report_path);
  ASSERT_TRUE(content.ok());
  auto doc = nlohmann::json::parse(*content, nullptr, false);
  EXPECT_EQ(doc["run_id"], "run2");
  EXPECT_EQ(doc["results"]["success"], true);
}

}  // namespace
}  // namespace geneflow
