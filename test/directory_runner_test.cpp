/**
 * @file directory_runner_test.cpp
 * @brief Tests for filtering a directory of Parquet files.
 */

#include "babylonify/directory_runner.h"

#include "test_helpers.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace babylonify;
using test_util::ScratchDir;
using test_util::ScriptDetector;

namespace fs = std::filesystem;

class DirectoryRunnerTest : public ::testing::Test {
protected:
  void SetUp() override {
    source_ = dir_.path() / "in";
    dest_ = dir_.path() / "out";
    fs::create_directories(source_);
  }

  void write_good(const std::string& name) {
    test_util::write_parquet(
        test_util::make_transcript_table({"Привіт світ", "Hello world", "Київ"}),
        (source_ / name).string());
  }

  void write_garbage(const std::string& name) {
    std::ofstream out(source_ / name, std::ios::binary);
    out << "definitely not parquet";
  }

  FilterOptions options() {
    FilterOptions o;
    o.num_threads = 2;
    return o;
  }

  ScratchDir dir_;
  fs::path source_;
  fs::path dest_;
  ScriptDetector detector_;
};

TEST_F(DirectoryRunnerTest, ListsOnlyParquetFilesSorted) {
  write_good("b.parquet");
  write_good("a.PARQUET");
  {
    std::ofstream(source_ / "notes.txt") << "ignore me";
  }
  fs::create_directories(source_ / "nested.parquet");
  fs::create_directories(source_ / "sub");
  write_good("sub/d.parquet");
  write_good("c.parquet");

  auto files = list_parquet_files(source_.string());
  ASSERT_TRUE(files.ok) << files.error.to_string();
  ASSERT_EQ(files.value.size(), 3u);
  EXPECT_EQ(fs::path(files.value[0]).filename(), "a.PARQUET");
  EXPECT_EQ(fs::path(files.value[1]).filename(), "b.parquet");
  EXPECT_EQ(fs::path(files.value[2]).filename(), "c.parquet");
}

TEST_F(DirectoryRunnerTest, MissingSourceIsIoError) {
  auto files = list_parquet_files((dir_.path() / "nope").string());
  ASSERT_FALSE(files.ok);
  EXPECT_EQ(files.error.code(), ErrorCode::IO_ERROR);
}

TEST_F(DirectoryRunnerTest, FiltersEveryFile) {
  write_good("one.parquet");
  write_good("two.parquet");

  DirectoryRunner runner(detector_, options());
  auto report = runner.run(source_.string(), dest_.string());
  ASSERT_TRUE(report.ok) << report.error.to_string();
  EXPECT_EQ(report.value.status(), RunStatus::ALL_SUCCEEDED);
  EXPECT_TRUE(report.value.ok());
  EXPECT_EQ(report.value.summary(), "Processed 2 files: 2 succeeded, 0 failed");

  for (const auto& name : {"one.parquet", "two.parquet"}) {
    auto table = test_util::read_parquet((dest_ / name).string());
    ASSERT_NE(table, nullptr);
    EXPECT_EQ(test_util::int64_column(*table, "id"), std::vector<int64_t>({0, 2}));
  }
}

TEST_F(DirectoryRunnerTest, FailingFileDoesNotAffectSiblings) {
  write_good("a.parquet");
  write_garbage("b.parquet");
  write_good("c.parquet");

  std::vector<std::string> seen;
  DirectoryRunner runner(detector_, options());
  runner.set_file_callback([&seen](const FileOutcome& outcome) {
    seen.push_back(fs::path(outcome.input_path).filename().string());
  });

  auto report = runner.run(source_.string(), dest_.string());
  ASSERT_TRUE(report.ok) << report.error.to_string();
  EXPECT_EQ(report.value.status(), RunStatus::PARTIAL);
  EXPECT_TRUE(report.value.ok());
  EXPECT_EQ(report.value.succeeded(), 2u);
  EXPECT_EQ(report.value.failed(), 1u);
  EXPECT_EQ(seen, std::vector<std::string>({"a.parquet", "b.parquet", "c.parquet"}));

  const auto& files = report.value.files;
  ASSERT_EQ(files.size(), 3u);
  EXPECT_TRUE(files[0].ok);
  EXPECT_FALSE(files[1].ok);
  EXPECT_EQ(files[1].error.code(), ErrorCode::IO_ERROR);
  EXPECT_TRUE(files[2].ok);
  EXPECT_EQ(files[2].stats.rows_kept, 2);

  EXPECT_TRUE(fs::exists(dest_ / "a.parquet"));
  EXPECT_FALSE(fs::exists(dest_ / "b.parquet"));
  EXPECT_TRUE(fs::exists(dest_ / "c.parquet"));

  // Only the two finished outputs, no leftovers of the failed file
  size_t entries = 0;
  for (const auto& entry : fs::directory_iterator(dest_)) {
    (void)entry;
    ++entries;
  }
  EXPECT_EQ(entries, 2u);
}

TEST_F(DirectoryRunnerTest, AllFailed) {
  write_garbage("x.parquet");

  DirectoryRunner runner(detector_, options());
  auto report = runner.run(source_.string(), dest_.string());
  ASSERT_TRUE(report.ok);
  EXPECT_EQ(report.value.status(), RunStatus::ALL_FAILED);
  EXPECT_FALSE(report.value.ok());
}

TEST_F(DirectoryRunnerTest, NoFiles) {
  DirectoryRunner runner(detector_, options());
  auto report = runner.run(source_.string(), dest_.string());
  ASSERT_TRUE(report.ok);
  EXPECT_EQ(report.value.status(), RunStatus::NO_FILES);
  EXPECT_FALSE(report.value.ok());
  EXPECT_TRUE(fs::is_directory(dest_));
}

TEST_F(DirectoryRunnerTest, DestinationIsAFile) {
  write_good("a.parquet");
  {
    std::ofstream(dest_) << "file";
  }

  DirectoryRunner runner(detector_, options());
  auto report = runner.run(source_.string(), dest_.string());
  ASSERT_FALSE(report.ok);
  EXPECT_EQ(report.error.code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(DirectoryRunnerTest, CreatesNestedDestination) {
  write_good("a.parquet");
  fs::path nested = dest_ / "deep" / "er";

  DirectoryRunner runner(detector_, options());
  auto report = runner.run(source_.string(), nested.string());
  ASSERT_TRUE(report.ok) << report.error.to_string();
  EXPECT_TRUE(fs::exists(nested / "a.parquet"));
}

TEST(RunReportTest, StatusNames) {
  EXPECT_STREQ(run_status_to_string(RunStatus::ALL_SUCCEEDED), "ALL_SUCCEEDED");
  EXPECT_STREQ(run_status_to_string(RunStatus::PARTIAL), "PARTIAL");
  EXPECT_STREQ(run_status_to_string(RunStatus::ALL_FAILED), "ALL_FAILED");
  EXPECT_STREQ(run_status_to_string(RunStatus::NO_FILES), "NO_FILES");
}
