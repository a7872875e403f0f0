/**
 * @file batch_pipeline_test.cpp
 * @brief Tests for filtering a single Parquet file.
 */

#include "babylonify/batch_pipeline.h"

#include "test_helpers.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

using namespace babylonify;
using test_util::ScratchDir;
using test_util::ScriptDetector;

class BatchPipelineTest : public ::testing::Test {
protected:
  std::string write_input(const std::vector<std::optional<std::string>>& texts,
                          const std::string& name = "in.parquet",
                          const std::string& column = "transcription", bool large = false) {
    std::string path = dir_.file(name);
    test_util::write_parquet(test_util::make_transcript_table(texts, column, large), path);
    return path;
  }

  FilterOptions options(size_t threads = 2) {
    FilterOptions o;
    o.num_threads = threads;
    return o;
  }

  Result<FileStats> run(const FilterOptions& o, const std::string& input,
                        const std::string& output) {
    BatchPipeline pipeline(detector_, o);
    auto result = pipeline.run(input, output);
    EXPECT_EQ(pipeline.state(), result.ok ? PipelineState::DONE : PipelineState::FAILED);
    return result;
  }

  // Files left in the scratch directory, excluding the inputs
  std::vector<std::string> stray_files(const std::vector<std::string>& expected) {
    std::vector<std::string> stray;
    for (const auto& entry : std::filesystem::directory_iterator(dir_.path())) {
      std::string path = entry.path().string();
      if (std::find(expected.begin(), expected.end(), path) == expected.end())
        stray.push_back(path);
    }
    return stray;
  }

  ScratchDir dir_;
  ScriptDetector detector_;
};

// =============================================================================
// End-to-end scenario
// =============================================================================

TEST_F(BatchPipelineTest, KeepsOnlyTargetLanguage) {
  std::string input = write_input({"Привіт світ", "Hello world", "", std::nullopt});
  std::string output = dir_.file("out.parquet");

  auto stats = run(options(), input, output);
  ASSERT_TRUE(stats.ok) << stats.error.to_string();
  EXPECT_EQ(stats.value.rows_read, 4);
  EXPECT_EQ(stats.value.rows_kept, 1);
  EXPECT_GT(stats.value.bytes_written, 0);

  auto table = test_util::read_parquet(output);
  ASSERT_NE(table, nullptr);
  EXPECT_EQ(table->num_rows(), 1);
  auto texts = test_util::string_column(*table, "transcription");
  ASSERT_EQ(texts.size(), 1u);
  EXPECT_EQ(texts[0], "Привіт світ");
  EXPECT_EQ(test_util::int64_column(*table, "id"), std::vector<int64_t>({0}));
}

TEST_F(BatchPipelineTest, KeepEmptyKeepsNullAndEmpty) {
  std::string input = write_input({"Привіт світ", "Hello world", "", std::nullopt});
  std::string output = dir_.file("out.parquet");

  auto o = options();
  o.keep_empty = true;
  auto stats = run(o, input, output);
  ASSERT_TRUE(stats.ok) << stats.error.to_string();
  EXPECT_EQ(stats.value.rows_kept, 3);

  auto table = test_util::read_parquet(output);
  ASSERT_NE(table, nullptr);
  EXPECT_EQ(test_util::int64_column(*table, "id"), std::vector<int64_t>({0, 2, 3}));
  auto texts = test_util::string_column(*table, "transcription");
  ASSERT_EQ(texts.size(), 3u);
  EXPECT_EQ(texts[1], "");
  EXPECT_FALSE(texts[2].has_value());
}

TEST_F(BatchPipelineTest, OtherTargetLanguage) {
  std::string input = write_input({"Привіт світ", "Hello world", "Good morning", "Привет"});
  std::string output = dir_.file("out.parquet");

  auto o = options();
  o.target = CLD2::ENGLISH;
  auto stats = run(o, input, output);
  ASSERT_TRUE(stats.ok) << stats.error.to_string();

  auto table = test_util::read_parquet(output);
  ASSERT_NE(table, nullptr);
  EXPECT_EQ(test_util::int64_column(*table, "id"), std::vector<int64_t>({1, 2}));
}

// =============================================================================
// Order, schema and parallelism
// =============================================================================

TEST_F(BatchPipelineTest, PreservesRowOrderAcrossBatches) {
  std::vector<std::optional<std::string>> texts;
  std::vector<int64_t> expected;
  for (int i = 0; i < 1000; ++i) {
    if (i % 3 == 0) {
      texts.push_back("рядок " + std::to_string(i) + " і");
      expected.push_back(i);
    } else {
      texts.push_back("line " + std::to_string(i));
    }
  }
  std::string input = write_input(texts);
  std::string output = dir_.file("out.parquet");

  auto o = options(4);
  o.batch_size = 64;
  auto stats = run(o, input, output);
  ASSERT_TRUE(stats.ok) << stats.error.to_string();
  EXPECT_EQ(stats.value.rows_read, 1000);
  EXPECT_GE(stats.value.batches, 16);

  auto table = test_util::read_parquet(output);
  ASSERT_NE(table, nullptr);
  EXPECT_EQ(test_util::int64_column(*table, "id"), expected);
}

TEST_F(BatchPipelineTest, SchemaUnchanged) {
  std::string input = write_input({"Привіт світ", "Hello world"});
  std::string output = dir_.file("out.parquet");

  auto o = options();
  o.clean = true;
  ASSERT_TRUE(run(o, input, output).ok);

  auto in_table = test_util::read_parquet(input);
  auto out_table = test_util::read_parquet(output);
  ASSERT_NE(in_table, nullptr);
  ASSERT_NE(out_table, nullptr);
  EXPECT_TRUE(out_table->schema()->Equals(*in_table->schema(), /*check_metadata=*/true))
      << out_table->schema()->ToString() << "\nvs\n"
      << in_table->schema()->ToString();
}

TEST_F(BatchPipelineTest, SchemaPreservedWhenNothingKept) {
  std::string input = write_input({"Hello world", "Good morning"});
  std::string output = dir_.file("out.parquet");

  auto stats = run(options(), input, output);
  ASSERT_TRUE(stats.ok) << stats.error.to_string();
  EXPECT_EQ(stats.value.rows_kept, 0);

  auto table = test_util::read_parquet(output);
  ASSERT_NE(table, nullptr);
  EXPECT_EQ(table->num_rows(), 0);
  EXPECT_EQ(table->num_columns(), 3);
  EXPECT_EQ(table->schema()->field(1)->name(), "transcription");
}

TEST_F(BatchPipelineTest, LargeStringColumn) {
  std::string input = write_input({"Hello", "Привіт", "  Київ 2024 ", std::nullopt},
                                  "in.parquet", "transcription", /*large=*/true);
  std::string output = dir_.file("out.parquet");

  auto o = options();
  o.clean = true;
  auto stats = run(o, input, output);
  ASSERT_TRUE(stats.ok) << stats.error.to_string();

  auto table = test_util::read_parquet(output);
  ASSERT_NE(table, nullptr);
  EXPECT_EQ(table->schema()->field(1)->type()->id(), arrow::Type::LARGE_STRING);
  auto texts = test_util::string_column(*table, "transcription");
  ASSERT_EQ(texts.size(), 2u);
  EXPECT_EQ(texts[0], "Привіт");
  EXPECT_EQ(texts[1], "Київ");
}

TEST_F(BatchPipelineTest, WorkerCountInvariance) {
  std::vector<std::optional<std::string>> texts;
  for (int i = 0; i < 500; ++i) {
    switch (i % 5) {
    case 0:
      texts.push_back("Добрий день, " + std::to_string(i) + " ґанок");
      break;
    case 1:
      texts.push_back("good day " + std::to_string(i));
      break;
    case 2:
      texts.push_back(std::nullopt);
      break;
    case 3:
      texts.push_back("   42  ");
      break;
    default:
      texts.push_back("її");
      break;
    }
  }
  std::string input = write_input(texts);

  auto single = options(1);
  single.clean = true;
  single.batch_size = 37;
  auto many = single;
  many.num_threads = 8;

  std::string out_single = dir_.file("single.parquet");
  std::string out_many = dir_.file("many.parquet");
  ASSERT_TRUE(run(single, input, out_single).ok);
  ASSERT_TRUE(run(many, input, out_many).ok);

  auto a = test_util::read_parquet(out_single);
  auto b = test_util::read_parquet(out_many);
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_TRUE(a->Equals(*b));
  EXPECT_EQ(a->num_rows(), 200);
}

// =============================================================================
// Cleaning
// =============================================================================

TEST_F(BatchPipelineTest, CleanWritesCleanedText) {
  std::string input =
      write_input({"  Привіт,   світ! 123 @#", "Hello 42", "", std::nullopt, "567 ***"});
  std::string output = dir_.file("out.parquet");

  auto o = options();
  o.clean = true;
  o.keep_empty = true;
  auto stats = run(o, input, output);
  ASSERT_TRUE(stats.ok) << stats.error.to_string();

  auto table = test_util::read_parquet(output);
  ASSERT_NE(table, nullptr);
  EXPECT_EQ(test_util::int64_column(*table, "id"), std::vector<int64_t>({0, 2, 3, 4}));
  auto texts = test_util::string_column(*table, "transcription");
  ASSERT_EQ(texts.size(), 4u);
  EXPECT_EQ(texts[0], "Привіт, світ!");
  EXPECT_EQ(texts[1], "");
  EXPECT_FALSE(texts[2].has_value());
  // Cleaned to nothing, kept by the keep-empty policy
  EXPECT_EQ(texts[3], "");

  // Other columns are untouched
  auto speakers = test_util::string_column(*table, "speaker");
  EXPECT_EQ(speakers[0], "s0");
  EXPECT_EQ(speakers[3], "s4");
}

TEST_F(BatchPipelineTest, WithoutCleanTextIsUnchanged) {
  std::string input = write_input({"  Привіт,   світ! 123 @#"});
  std::string output = dir_.file("out.parquet");

  ASSERT_TRUE(run(options(), input, output).ok);
  auto table = test_util::read_parquet(output);
  ASSERT_NE(table, nullptr);
  auto texts = test_util::string_column(*table, "transcription");
  ASSERT_EQ(texts.size(), 1u);
  EXPECT_EQ(texts[0], "  Привіт,   світ! 123 @#");
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(BatchPipelineTest, MissingColumnIsSchemaError) {
  std::string input = write_input({"Привіт"}, "in.parquet", "text");
  std::string output = dir_.file("out.parquet");

  auto stats = run(options(), input, output);
  ASSERT_FALSE(stats.ok);
  EXPECT_EQ(stats.error.code(), ErrorCode::SCHEMA_ERROR);
  EXPECT_NE(stats.error.message().find("transcription"), std::string::npos);
  EXPECT_FALSE(std::filesystem::exists(output));
  EXPECT_TRUE(stray_files({input}).empty());
}

TEST_F(BatchPipelineTest, CustomColumnName) {
  std::string input = write_input({"Привіт", "Hello"}, "in.parquet", "text");
  std::string output = dir_.file("out.parquet");

  auto o = options();
  o.column = "text";
  auto stats = run(o, input, output);
  ASSERT_TRUE(stats.ok) << stats.error.to_string();
  EXPECT_EQ(stats.value.rows_kept, 1);
}

TEST_F(BatchPipelineTest, NonStringColumnIsSchemaError) {
  std::string input = write_input({"Привіт"});
  std::string output = dir_.file("out.parquet");

  auto o = options();
  o.column = "id";
  auto stats = run(o, input, output);
  ASSERT_FALSE(stats.ok);
  EXPECT_EQ(stats.error.code(), ErrorCode::SCHEMA_ERROR);
  EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(BatchPipelineTest, MissingInputIsIoError) {
  std::string output = dir_.file("out.parquet");
  auto stats = run(options(), dir_.file("missing.parquet"), output);
  ASSERT_FALSE(stats.ok);
  EXPECT_EQ(stats.error.code(), ErrorCode::IO_ERROR);
  EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(BatchPipelineTest, OutputDirectoryIsIoError) {
  std::string input = write_input({"Привіт"});
  std::string output = dir_.file("subdir");
  std::filesystem::create_directory(output);

  auto stats = run(options(), input, output);
  ASSERT_FALSE(stats.ok);
  EXPECT_EQ(stats.error.code(), ErrorCode::IO_ERROR);
}

TEST_F(BatchPipelineTest, DetectionErrorLeavesNoOutput) {
  std::vector<std::optional<std::string>> texts;
  for (int i = 0; i < 300; ++i)
    texts.push_back(i == 250 ? "FAIL" : "Привіт " + std::to_string(i));
  std::string input = write_input(texts);
  std::string output = dir_.file("out.parquet");

  auto o = options(4);
  o.batch_size = 50;
  auto stats = run(o, input, output);
  ASSERT_FALSE(stats.ok);
  EXPECT_EQ(stats.error.code(), ErrorCode::DETECTION_ERROR);
  EXPECT_NE(stats.error.message().find("Row 250"), std::string::npos) << stats.error.message();
  EXPECT_FALSE(std::filesystem::exists(output));
  EXPECT_TRUE(stray_files({input}).empty());
}

TEST_F(BatchPipelineTest, FailureKeepsExistingDestination) {
  std::string input = write_input({"Привіт"}, "in.parquet", "text");
  std::string output = dir_.file("out.parquet");
  {
    std::ofstream existing(output);
    existing << "previous";
  }

  auto stats = run(options(), input, output);
  ASSERT_FALSE(stats.ok);
  std::ifstream check(output);
  std::string content;
  check >> content;
  EXPECT_EQ(content, "previous");
}

TEST_F(BatchPipelineTest, InvalidBatchSize) {
  std::string input = write_input({"Привіт"});
  auto o = options();
  o.batch_size = 0;
  auto stats = run(o, input, dir_.file("out.parquet"));
  ASSERT_FALSE(stats.ok);
  EXPECT_EQ(stats.error.code(), ErrorCode::INVALID_ARGUMENT);
}

// =============================================================================
// Building blocks
// =============================================================================

TEST(BatchPipelineHelpersTest, FindTextColumn) {
  auto schema = arrow::schema({arrow::field("id", arrow::int64()),
                               arrow::field("text", arrow::utf8()),
                               arrow::field("big", arrow::large_utf8()),
                               arrow::field("view", arrow::utf8_view())});
  EXPECT_EQ(find_text_column(*schema, "text").value, 1);
  EXPECT_EQ(find_text_column(*schema, "big").value, 2);
  EXPECT_EQ(find_text_column(*schema, "view").value, 3);
  EXPECT_EQ(find_text_column(*schema, "id").error.code(), ErrorCode::SCHEMA_ERROR);
  EXPECT_EQ(find_text_column(*schema, "nope").error.code(), ErrorCode::SCHEMA_ERROR);
}

TEST(BatchPipelineHelpersTest, ApplySelectionKeepsRunsInOrder) {
  auto table = test_util::make_transcript_table({"a", "b", "c", "d", "e", "f"});
  auto batch = table->CombineChunksToBatch();
  ASSERT_TRUE(batch.ok());

  SelectionMask mask = {true, true, false, true, false, true};
  std::vector<RowDecision> decisions(6);
  auto selected = apply_selection(*batch, mask, 1, decisions, false);
  ASSERT_TRUE(selected.ok) << selected.error.to_string();
  ASSERT_EQ(selected.value->num_rows(), 4);

  auto ids = std::static_pointer_cast<arrow::Int64Array>(selected.value->column(0));
  EXPECT_EQ(ids->Value(0), 0);
  EXPECT_EQ(ids->Value(1), 1);
  EXPECT_EQ(ids->Value(2), 3);
  EXPECT_EQ(ids->Value(3), 5);
}

TEST(BatchPipelineHelpersTest, ApplySelectionRejectsSizeMismatch) {
  auto table = test_util::make_transcript_table({"a", "b"});
  auto batch = table->CombineChunksToBatch();
  ASSERT_TRUE(batch.ok());

  SelectionMask mask = {true};
  auto selected = apply_selection(*batch, mask, 1, {}, false);
  ASSERT_FALSE(selected.ok);
  EXPECT_EQ(selected.error.code(), ErrorCode::INTERNAL_ERROR);
}

TEST(BatchPipelineHelpersTest, ClassifyColumnReportsFirstFailingRow) {
  ScriptDetector detector;
  RowClassifier classifier(detector, ClassifierOptions{});
  BS::thread_pool pool(4);

  std::vector<std::optional<std::string>> texts(100, std::string("Привіт"));
  texts[30] = "FAIL one";
  texts[80] = "FAIL two";
  auto column = test_util::make_string_array(texts);

  auto result = classify_column(*column, classifier, pool, 1000);
  ASSERT_FALSE(result.ok);
  EXPECT_NE(result.error.message().find("Row 1030"), std::string::npos)
      << result.error.message();
}

TEST(BatchPipelineHelpersTest, StringViewColumn) {
  arrow::StringViewBuilder builder;
  ASSERT_TRUE(builder.Append("Привіт, світ! 123").ok());
  ASSERT_TRUE(builder.Append("Hello world").ok());
  ASSERT_TRUE(builder.AppendNull().ok());
  ASSERT_TRUE(builder.Append("Київ").ok());
  std::shared_ptr<arrow::Array> text;
  ASSERT_TRUE(builder.Finish(&text).ok());

  auto schema = arrow::schema(
      {arrow::field("id", arrow::int64()), arrow::field("transcription", arrow::utf8_view())});
  auto batch = arrow::RecordBatch::Make(schema, 4, {test_util::make_int64_array(4), text});
  ASSERT_EQ(find_text_column(*schema, "transcription").value, 1);

  ScriptDetector detector;
  RowClassifier classifier(detector, ClassifierOptions{.clean = true});
  BS::thread_pool pool(2);
  auto decisions = classify_column(*text, classifier, pool);
  ASSERT_TRUE(decisions.ok) << decisions.error.to_string();

  SelectionMask mask = build_selection_mask(decisions.value);
  EXPECT_EQ(mask, SelectionMask({true, false, false, true}));

  auto selected = apply_selection(batch, mask, 1, decisions.value, true);
  ASSERT_TRUE(selected.ok) << selected.error.to_string();
  ASSERT_EQ(selected.value->num_rows(), 2);
  EXPECT_EQ(selected.value->schema()->field(1)->type()->id(), arrow::Type::STRING_VIEW);
  const auto& cleaned = static_cast<const arrow::StringViewArray&>(*selected.value->column(1));
  EXPECT_EQ(cleaned.GetView(0), "Привіт, світ!");
  EXPECT_EQ(cleaned.GetView(1), "Київ");
}

// Throws on "BOOM" rows; every other row takes a little while so ranges are
// still running when the throwing one finishes
class ThrowingDetector : public LanguageDetector {
public:
  Result<Language> detect(std::string_view text) const override {
    in_flight_.fetch_add(1);
    if (text == "BOOM") {
      in_flight_.fetch_sub(1);
      throw std::runtime_error("detector exploded");
    }
    std::this_thread::sleep_for(std::chrono::microseconds(200));
    in_flight_.fetch_sub(1);
    return Result<Language>::success(CLD2::UKRAINIAN);
  }

  int in_flight() const { return in_flight_.load(); }

private:
  mutable std::atomic<int> in_flight_{0};
};

TEST(BatchPipelineHelpersTest, ClassifyColumnWaitsForAllRangesBeforeThrowing) {
  ThrowingDetector detector;
  RowClassifier classifier(detector, ClassifierOptions{});
  BS::thread_pool pool(4);

  std::vector<std::optional<std::string>> texts(400, std::string("Привіт"));
  texts[0] = "BOOM";
  auto column = test_util::make_string_array(texts);

  EXPECT_THROW(classify_column(*column, classifier, pool), std::runtime_error);
  EXPECT_EQ(detector.in_flight(), 0);

  // The pool is still usable afterwards
  texts[0] = "Київ";
  auto again = classify_column(*test_util::make_string_array(texts), classifier, pool);
  ASSERT_TRUE(again.ok) << again.error.to_string();
  EXPECT_EQ(again.value.size(), 400u);
}

TEST(BatchPipelineHelpersTest, ResolveThreadCount) {
  EXPECT_GE(resolve_thread_count(0), 1u);
  EXPECT_EQ(resolve_thread_count(3), 3u);
  EXPECT_EQ(resolve_thread_count(5000), kMaxThreads);
}
