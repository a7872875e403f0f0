#include "babylonify/babylonify.h"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <benchmark/benchmark.h>
#include <parquet/arrow/writer.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace {

const char* kSamples[] = {
    "Київ є столицею та найбільшим містом України, розташованим на річці Дніпро.",
    "The quick brown fox jumps over the lazy dog while the farmer watches.",
    "Москва является столицей и крупнейшим городом России.",
    "  (сміється) ну, це 100% правда @user #тег 👍  ",
    "Warszawa jest stolicą i największym miastem Polski.",
};
constexpr size_t kNumSamples = sizeof(kSamples) / sizeof(kSamples[0]);

std::shared_ptr<arrow::Array> make_text_column(int64_t rows) {
  arrow::StringBuilder builder;
  for (int64_t i = 0; i < rows; ++i) {
    if (!builder.Append(kSamples[static_cast<size_t>(i) % kNumSamples]).ok())
      return nullptr;
  }
  std::shared_ptr<arrow::Array> array;
  if (!builder.Finish(&array).ok())
    return nullptr;
  return array;
}

std::string write_fixture(int64_t rows) {
  std::string path = (std::filesystem::temp_directory_path() /
                      ("babylonify_bench_" + std::to_string(rows) + ".parquet"))
                         .string();
  if (std::filesystem::exists(path))
    return path;

  arrow::Int64Builder ids;
  for (int64_t i = 0; i < rows; ++i) {
    if (!ids.Append(i).ok())
      return "";
  }
  std::shared_ptr<arrow::Array> id_array;
  if (!ids.Finish(&id_array).ok())
    return "";

  auto schema = arrow::schema(
      {arrow::field("id", arrow::int64()), arrow::field("transcription", arrow::utf8())});
  auto table = arrow::Table::Make(schema, {id_array, make_text_column(rows)});

  auto outfile = arrow::io::FileOutputStream::Open(path);
  if (!outfile.ok())
    return "";
  if (!parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), *outfile, 64 * 1024).ok())
    return "";
  if (!(*outfile)->Close().ok())
    return "";
  return path;
}

} // namespace

static void BM_CleanText(benchmark::State& state) {
  size_t bytes = 0;
  for (auto _ : state) {
    for (const char* sample : kSamples) {
      auto cleaned = babylonify::clean_text(sample);
      benchmark::DoNotOptimize(cleaned);
      bytes += std::char_traits<char>::length(sample);
    }
  }
  state.SetBytesProcessed(static_cast<int64_t>(bytes));
}
BENCHMARK(BM_CleanText);

static void BM_Cld2Detect(benchmark::State& state) {
  babylonify::Cld2Detector detector;
  size_t bytes = 0;
  for (auto _ : state) {
    for (const char* sample : kSamples) {
      auto result = detector.detect(sample);
      benchmark::DoNotOptimize(result);
      bytes += std::char_traits<char>::length(sample);
    }
  }
  state.SetBytesProcessed(static_cast<int64_t>(bytes));
}
BENCHMARK(BM_Cld2Detect);

// Classification of one batch across worker counts
static void BM_ClassifyColumn_Threads(benchmark::State& state) {
  auto column = make_text_column(64 * 1024);
  if (!column) {
    state.SkipWithError("Failed to build column");
    return;
  }

  babylonify::Cld2Detector detector;
  babylonify::RowClassifier classifier(detector, babylonify::ClassifierOptions{.clean = true});
  BS::thread_pool pool(static_cast<size_t>(state.range(0)));

  for (auto _ : state) {
    auto decisions = babylonify::classify_column(*column, classifier, pool);
    if (!decisions.ok) {
      state.SkipWithError(decisions.error.to_string().c_str());
      return;
    }
    benchmark::DoNotOptimize(decisions.value);
  }
  state.SetItemsProcessed(state.iterations() * column->length());
  state.counters["Threads"] = static_cast<double>(state.range(0));
}
BENCHMARK(BM_ClassifyColumn_Threads)
    ->RangeMultiplier(2)
    ->Range(1, 16)
    ->Unit(benchmark::kMillisecond)
    ->UseRealTime();

// Whole file: read, classify, select, write
static void BM_FilterFile(benchmark::State& state) {
  const int64_t rows = state.range(0);
  std::string input = write_fixture(rows);
  if (input.empty()) {
    state.SkipWithError("Failed to write fixture");
    return;
  }
  std::string output = input + ".out";

  babylonify::Cld2Detector detector;
  babylonify::FilterOptions options;
  babylonify::BatchPipeline pipeline(detector, options);

  for (auto _ : state) {
    auto stats = pipeline.run(input, output);
    if (!stats.ok) {
      state.SkipWithError(stats.error.to_string().c_str());
      return;
    }
    benchmark::DoNotOptimize(stats.value);
  }
  state.SetItemsProcessed(state.iterations() * rows);

  std::error_code ec;
  std::filesystem::remove(output, ec);
}
BENCHMARK(BM_FilterFile)->Arg(100000)->Arg(1000000)->Unit(benchmark::kMillisecond)->UseRealTime();
