#include "babylonify/batch_pipeline.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <future>
#include <thread>

namespace babylonify {

size_t resolve_thread_count(size_t requested) {
  size_t n = requested;
  if (n == 0) {
    n = std::thread::hardware_concurrency();
    if (n == 0)
      n = 1;
  }
  return std::min(n, kMaxThreads);
}

const char* pipeline_state_to_string(PipelineState state) {
  switch (state) {
  case PipelineState::OPENING:
    return "OPENING";
  case PipelineState::STREAMING:
    return "STREAMING";
  case PipelineState::CLOSING:
    return "CLOSING";
  case PipelineState::DONE:
    return "DONE";
  case PipelineState::FAILED:
    return "FAILED";
  default:
    return "UNKNOWN";
  }
}

Result<int> find_text_column(const arrow::Schema& schema, const std::string& name) {
  int index = schema.GetFieldIndex(name);
  if (index < 0) {
    if (!schema.GetAllFieldIndices(name).empty())
      return Result<int>::failure(ErrorCode::SCHEMA_ERROR,
                                  "Column '" + name + "' appears more than once");
    return Result<int>::failure(ErrorCode::SCHEMA_ERROR, "Column '" + name + "' not found");
  }

  auto type_id = schema.field(index)->type()->id();
  if (type_id != arrow::Type::STRING && type_id != arrow::Type::LARGE_STRING &&
      type_id != arrow::Type::STRING_VIEW) {
    return Result<int>::failure(ErrorCode::SCHEMA_ERROR,
                                "Column '" + name + "' has type " +
                                    schema.field(index)->type()->ToString() +
                                    ", expected a string column");
  }
  return Result<int>::success(index);
}

// =============================================================================
// Parallel classification
// =============================================================================

namespace {

// Classify rows [begin, end) into decisions[begin, end). Stops at the first
// failing row of the range.
template <typename ArrayType>
Error classify_range(const ArrayType& array, const RowClassifier& classifier,
                     std::vector<RowDecision>& decisions, int64_t begin, int64_t end,
                     int64_t row_offset) {
  for (int64_t i = begin; i < end; ++i) {
    std::optional<std::string_view> value;
    if (!array.IsNull(i))
      value = array.GetView(i);

    auto result = classifier.classify(value);
    if (!result.ok) {
      return Error(result.error.code(),
                   "Row " + std::to_string(row_offset + i) + ": " + result.error.message());
    }
    decisions[static_cast<size_t>(i)] = std::move(result.value);
  }
  return Error();
}

template <typename ArrayType>
Result<std::vector<RowDecision>> classify_typed(const ArrayType& array,
                                                const RowClassifier& classifier,
                                                BS::thread_pool& pool, int64_t row_offset) {
  const int64_t num_rows = array.length();
  std::vector<RowDecision> decisions(static_cast<size_t>(num_rows));
  if (num_rows == 0)
    return Result<std::vector<RowDecision>>::success(std::move(decisions));

  // A few ranges per worker so one slow range does not leave the others idle
  int64_t num_ranges = static_cast<int64_t>(pool.get_thread_count()) * 4;
  num_ranges = std::max<int64_t>(1, std::min(num_ranges, num_rows));
  const int64_t range_size = (num_rows + num_ranges - 1) / num_ranges;

  std::vector<std::future<Error>> futures;
  futures.reserve(static_cast<size_t>(num_ranges));
  // Tasks reference decisions; every submitted one must finish before this
  // frame unwinds or returns
  try {
    for (int64_t begin = 0; begin < num_rows; begin += range_size) {
      int64_t end = std::min(begin + range_size, num_rows);
      futures.push_back(
          pool.submit_task([&array, &classifier, &decisions, begin, end, row_offset]() {
            return classify_range(array, classifier, decisions, begin, end, row_offset);
          }));
    }
  } catch (...) {
    for (auto& f : futures)
      f.wait();
    throw;
  }
  for (auto& f : futures)
    f.wait();

  Error first_error;
  for (auto& f : futures) {
    Error error = f.get();
    if (!error.ok() && first_error.ok())
      first_error = std::move(error);
  }
  if (!first_error.ok())
    return Result<std::vector<RowDecision>>::failure(std::move(first_error));

  return Result<std::vector<RowDecision>>::success(std::move(decisions));
}

template <typename BuilderType, typename ArrayType>
arrow::Result<std::shared_ptr<arrow::Array>>
build_cleaned_column(const ArrayType& array, const SelectionMask& mask,
                     const std::vector<RowDecision>& decisions) {
  BuilderType builder;
  for (int64_t i = 0; i < array.length(); ++i) {
    auto row = static_cast<size_t>(i);
    if (!mask[row])
      continue;
    if (array.IsNull(i)) {
      ARROW_RETURN_NOT_OK(builder.AppendNull());
    } else if (decisions[row].cleaned) {
      ARROW_RETURN_NOT_OK(builder.Append(*decisions[row].cleaned));
    } else {
      ARROW_RETURN_NOT_OK(builder.Append(array.GetView(i)));
    }
  }
  return builder.Finish();
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>>
select_rows(const std::shared_ptr<arrow::RecordBatch>& batch, const SelectionMask& mask) {
  // Zero-copy slices over each run of kept rows
  std::vector<std::shared_ptr<arrow::RecordBatch>> runs;
  const int64_t num_rows = batch->num_rows();
  int64_t i = 0;
  while (i < num_rows) {
    if (!mask[static_cast<size_t>(i)]) {
      ++i;
      continue;
    }
    int64_t start = i;
    while (i < num_rows && mask[static_cast<size_t>(i)])
      ++i;
    runs.push_back(batch->Slice(start, i - start));
  }

  if (runs.empty())
    return batch->Slice(0, 0);
  if (runs.size() == 1)
    return runs.front();

  ARROW_ASSIGN_OR_RAISE(auto table, arrow::Table::FromRecordBatches(batch->schema(), runs));
  return table->CombineChunksToBatch(arrow::default_memory_pool());
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>>
select_and_replace(const std::shared_ptr<arrow::RecordBatch>& batch, const SelectionMask& mask,
                   int text_column, const std::vector<RowDecision>& decisions, bool replace_text) {
  ARROW_ASSIGN_OR_RAISE(auto selected, select_rows(batch, mask));
  if (!replace_text)
    return selected;

  const auto& column = batch->column(text_column);
  std::shared_ptr<arrow::Array> cleaned;
  if (column->type_id() == arrow::Type::LARGE_STRING) {
    ARROW_ASSIGN_OR_RAISE(cleaned, (build_cleaned_column<arrow::LargeStringBuilder>(
                                       static_cast<const arrow::LargeStringArray&>(*column), mask,
                                       decisions)));
  } else if (column->type_id() == arrow::Type::STRING_VIEW) {
    ARROW_ASSIGN_OR_RAISE(cleaned, (build_cleaned_column<arrow::StringViewBuilder>(
                                       static_cast<const arrow::StringViewArray&>(*column), mask,
                                       decisions)));
  } else {
    ARROW_ASSIGN_OR_RAISE(cleaned,
                          (build_cleaned_column<arrow::StringBuilder>(
                              static_cast<const arrow::StringArray&>(*column), mask, decisions)));
  }
  return selected->SetColumn(text_column, batch->schema()->field(text_column), cleaned);
}

} // namespace

Result<std::vector<RowDecision>> classify_column(const arrow::Array& column,
                                                 const RowClassifier& classifier,
                                                 BS::thread_pool& pool, int64_t row_offset) {
  switch (column.type_id()) {
  case arrow::Type::STRING:
    return classify_typed(static_cast<const arrow::StringArray&>(column), classifier, pool,
                          row_offset);
  case arrow::Type::LARGE_STRING:
    return classify_typed(static_cast<const arrow::LargeStringArray&>(column), classifier, pool,
                          row_offset);
  case arrow::Type::STRING_VIEW:
    return classify_typed(static_cast<const arrow::StringViewArray&>(column), classifier, pool,
                          row_offset);
  default:
    return Result<std::vector<RowDecision>>::failure(
        ErrorCode::SCHEMA_ERROR, "Expected a string column, got " + column.type()->ToString());
  }
}

SelectionMask build_selection_mask(const std::vector<RowDecision>& decisions) {
  SelectionMask mask(decisions.size());
  for (size_t i = 0; i < decisions.size(); ++i)
    mask[i] = decisions[i].keep;
  return mask;
}

Result<std::shared_ptr<arrow::RecordBatch>>
apply_selection(const std::shared_ptr<arrow::RecordBatch>& batch, const SelectionMask& mask,
                int text_column, const std::vector<RowDecision>& decisions, bool replace_text) {
  using BatchResult = Result<std::shared_ptr<arrow::RecordBatch>>;
  if (!batch)
    return BatchResult::failure(ErrorCode::INTERNAL_ERROR, "Batch is null");
  if (static_cast<int64_t>(mask.size()) != batch->num_rows() ||
      (replace_text && static_cast<int64_t>(decisions.size()) != batch->num_rows())) {
    return BatchResult::failure(ErrorCode::INTERNAL_ERROR,
                                "Selection size does not match batch of " +
                                    std::to_string(batch->num_rows()) + " rows");
  }
  if (text_column < 0 || text_column >= batch->num_columns())
    return BatchResult::failure(ErrorCode::INTERNAL_ERROR, "Text column index out of range");

  auto result = select_and_replace(batch, mask, text_column, decisions, replace_text);
  if (!result.ok())
    return BatchResult::failure(
        arrow_error(ErrorCode::INTERNAL_ERROR, "Failed to build filtered batch", result.status()));
  return BatchResult::success(std::move(*result));
}

// =============================================================================
// BatchPipeline
// =============================================================================

struct BatchPipeline::Impl {
  const LanguageDetector& detector;
  FilterOptions options;
  DebugTrace* trace = nullptr;
  PipelineState state = PipelineState::OPENING;

  std::unique_ptr<BS::thread_pool> owned_pool;
  BS::thread_pool* pool = nullptr;

  Impl(const LanguageDetector& d, FilterOptions opts, DebugTrace* t)
      : detector(d), options(std::move(opts)), trace(t) {}


  BS::thread_pool& workers() {
    if (!pool) {
      owned_pool = std::make_unique<BS::thread_pool>(resolve_thread_count(options.num_threads));
      pool = owned_pool.get();
    }
    return *pool;
  }

  Result<FileStats> fail(Error error) {
    if (trace)
      trace->log("Failed in %s: %s", pipeline_state_to_string(state), error.to_string().c_str());
    state = PipelineState::FAILED;
    return Result<FileStats>::failure(std::move(error));
  }

  Result<FileStats> run(const std::string& input_path, const std::string& output_path);
};

BatchPipeline::BatchPipeline(const LanguageDetector& detector, FilterOptions options,
                             DebugTrace* trace)
    : impl_(std::make_unique<Impl>(detector, std::move(options), trace)) {}

BatchPipeline::BatchPipeline(const LanguageDetector& detector, FilterOptions options,
                             BS::thread_pool& pool, DebugTrace* trace)
    : impl_(std::make_unique<Impl>(detector, std::move(options), trace)) {
  impl_->pool = &pool;
}

BatchPipeline::~BatchPipeline() = default;

PipelineState BatchPipeline::state() const {
  return impl_->state;
}

const FilterOptions& BatchPipeline::options() const {
  return impl_->options;
}

Result<FileStats> BatchPipeline::run(const std::string& input_path,
                                     const std::string& output_path) {
  impl_->state = PipelineState::OPENING;
  try {
    return impl_->run(input_path, output_path);
  } catch (const std::exception& e) {
    return impl_->fail(Error(ErrorCode::INTERNAL_ERROR, std::string("Unexpected failure: ") + e.what()));
  }
}

Result<FileStats> BatchPipeline::Impl::run(const std::string& input_path,
                                           const std::string& output_path) {
  FileStats stats;

  if (options.batch_size <= 0)
    return fail(Error(ErrorCode::INVALID_ARGUMENT, "Batch size must be positive"));

  std::error_code ec;
  if (std::filesystem::is_directory(output_path, ec))
    return fail(Error(ErrorCode::IO_ERROR, "Output path '" + output_path + "' is a directory"));

  // OPENING
  if (trace)
    trace->start_phase("open");
  ParquetBatchReader reader;
  auto opened = reader.open(input_path, options.batch_size);
  if (!opened.ok)
    return fail(opened.error);

  auto column_index = find_text_column(*reader.schema(), options.column);
  if (!column_index.ok)
    return fail(column_index.error);
  const int text_column = column_index.value;

  ParquetBatchWriter writer;
  auto created = writer.create(output_path, reader.schema(), options.write_options);
  if (!created.ok)
    return fail(created.error);
  if (trace)
    trace->end_phase();

  if (trace) {
    trace->log("Opened %s: %lld rows, %d columns, text column '%s' (%s)", input_path.c_str(),
               static_cast<long long>(reader.num_rows()), reader.schema()->num_fields(),
               options.column.c_str(),
               reader.schema()->field(text_column)->type()->ToString().c_str());
  }

  // STREAMING
  state = PipelineState::STREAMING;
  if (trace)
    trace->start_phase("filter");
  RowClassifier classifier(detector, ClassifierOptions{.target = options.target,
                                                       .clean = options.clean,
                                                       .keep_empty = options.keep_empty});
  BS::thread_pool& workers_pool = workers();

  while (true) {
    auto next = reader.next_batch();
    if (!next.ok) {
      writer.discard();
      return fail(next.error);
    }
    const auto& batch = next.value;
    if (!batch)
      break;

    auto decisions = classify_column(*batch->column(text_column), classifier, workers_pool,
                                     stats.rows_read);
    if (!decisions.ok) {
      writer.discard();
      return fail(decisions.error);
    }

    SelectionMask mask = build_selection_mask(decisions.value);
    auto filtered = apply_selection(batch, mask, text_column, decisions.value, options.clean);
    if (!filtered.ok) {
      writer.discard();
      return fail(filtered.error);
    }

    auto written = writer.write(*filtered.value);
    if (!written.ok) {
      writer.discard();
      return fail(written.error);
    }

    if (trace) {
      trace->log("Batch %lld: %lld rows -> %lld kept", static_cast<long long>(stats.batches),
                 static_cast<long long>(batch->num_rows()),
                 static_cast<long long>(filtered.value->num_rows()));
    }
    stats.rows_read += batch->num_rows();
    stats.rows_kept += filtered.value->num_rows();
    ++stats.batches;
  }
  if (trace)
    trace->end_phase(static_cast<uint64_t>(stats.rows_read));

  // CLOSING
  state = PipelineState::CLOSING;
  if (trace)
    trace->start_phase("finalize");
  auto finalized = writer.finalize();
  if (!finalized.ok)
    return fail(finalized.error);
  stats.bytes_written = writer.bytes_written();
  if (trace)
    trace->end_phase();

  if (trace) {
    trace->log("Wrote %s: %lld rows, %lld bytes (%s)", output_path.c_str(),
               static_cast<long long>(stats.rows_kept),
               static_cast<long long>(stats.bytes_written),
               compression_to_string(options.write_options.compression));
  }

  state = PipelineState::DONE;
  return Result<FileStats>::success(stats);
}

} // namespace babylonify
