/**
 * @file batch_pipeline.h
 * @brief Read -> classify -> select -> write loop for a single Parquet file.
 */

#pragma once

#include "babylonify/debug.h"
#include "babylonify/detector.h"
#include "babylonify/error.h"
#include "babylonify/language.h"
#include "babylonify/parquet_io.h"
#include "babylonify/row_classifier.h"

#include "BS_thread_pool.hpp"

#include <arrow/api.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace babylonify {

/// Upper bound for the worker count accepted from configuration.
inline constexpr size_t kMaxThreads = 1024;

struct FilterOptions {
  /// Designated text column
  std::string column = "transcription";
  Language target = CLD2::UKRAINIAN;
  bool clean = false;
  bool keep_empty = false;

  /// Worker threads for classification (0 = hardware concurrency)
  size_t num_threads = 0;

  /// Rows per record batch pulled from the reader. Only affects memory use
  /// and parallel granularity, never the output.
  int64_t batch_size = 64 * 1024;

  ParquetWriteOptions write_options;
};

/// 0 -> hardware concurrency (at least 1), capped at kMaxThreads.
size_t resolve_thread_count(size_t requested);

enum class PipelineState { OPENING, STREAMING, CLOSING, DONE, FAILED };

const char* pipeline_state_to_string(PipelineState state);

struct FileStats {
  int64_t rows_read = 0;
  int64_t rows_kept = 0;
  int64_t batches = 0;
  int64_t bytes_written = 0;
};

/// One entry per row of a batch, in row order; true keeps the row.
using SelectionMask = std::vector<bool>;

/**
 * @brief Locate the designated column and check that it holds strings.
 *
 * @return Column index, or SCHEMA_ERROR when missing or not utf8/large_utf8/utf8_view
 */
Result<int> find_text_column(const arrow::Schema& schema, const std::string& name);

/**
 * @brief Classify every value of a string column on the pool.
 *
 * Rows are split into contiguous ranges, one task per range. Each task
 * stores decisions at the rows' own indices and the futures are joined in
 * submission order, so the result is in row order regardless of which task
 * finishes first. On failure the error of the lowest failing row is returned.
 *
 * @param row_offset Index of the column's first row within the file, used in
 *        error messages
 */
Result<std::vector<RowDecision>> classify_column(const arrow::Array& column,
                                                 const RowClassifier& classifier,
                                                 BS::thread_pool& pool, int64_t row_offset = 0);

SelectionMask build_selection_mask(const std::vector<RowDecision>& decisions);

/**
 * @brief Keep the rows selected by mask, preserving order and schema.
 *
 * When replace_text is set, the text column of the result holds the cleaned
 * values from decisions instead of the original ones.
 */
Result<std::shared_ptr<arrow::RecordBatch>>
apply_selection(const std::shared_ptr<arrow::RecordBatch>& batch, const SelectionMask& mask,
                int text_column, const std::vector<RowDecision>& decisions, bool replace_text);

/**
 * @brief Filters one Parquet file by language.
 *
 * States: OPENING -> STREAMING -> CLOSING -> DONE, or FAILED from any of
 * them. Output is streamed batch by batch; on failure the partially written
 * output is deleted and nothing appears at the destination path.
 *
 * @code
 * babylonify::Cld2Detector detector;
 * babylonify::FilterOptions options;
 * options.target = babylonify::resolve_language("uk").value_or_throw();
 * babylonify::BatchPipeline pipeline(detector, options);
 * auto stats = pipeline.run("in.parquet", "out.parquet");
 * @endcode
 */
class BatchPipeline {
public:
  /// Uses its own pool of options.num_threads workers.
  BatchPipeline(const LanguageDetector& detector, FilterOptions options,
                DebugTrace* trace = nullptr);

  /// Uses a pool owned by the caller, e.g. one shared across many files.
  BatchPipeline(const LanguageDetector& detector, FilterOptions options, BS::thread_pool& pool,
                DebugTrace* trace = nullptr);

  ~BatchPipeline();

  BatchPipeline(const BatchPipeline&) = delete;
  BatchPipeline& operator=(const BatchPipeline&) = delete;

  Result<FileStats> run(const std::string& input_path, const std::string& output_path);

  PipelineState state() const;
  const FilterOptions& options() const;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace babylonify
