#include "babylonify/parquet_io.h"

#include <parquet/exception.h>
#include <parquet/properties.h>

#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace babylonify {

Error arrow_error(ErrorCode code, const std::string& context, const arrow::Status& status) {
  return Error(code, context + ": " + status.ToString());
}

const char* compression_to_string(ParquetWriteOptions::Compression compression) {
  switch (compression) {
  case ParquetWriteOptions::Compression::UNCOMPRESSED:
    return "uncompressed";
  case ParquetWriteOptions::Compression::SNAPPY:
    return "snappy";
  case ParquetWriteOptions::Compression::GZIP:
    return "gzip";
  case ParquetWriteOptions::Compression::ZSTD:
    return "zstd";
  case ParquetWriteOptions::Compression::LZ4:
    return "lz4";
  default:
    return "unknown";
  }
}

// =============================================================================
// ParquetBatchReader
// =============================================================================

Result<bool> ParquetBatchReader::open(const std::string& path, int64_t batch_size) {
  path_ = path;

  auto input_result = arrow::io::ReadableFile::Open(path);
  if (!input_result.ok()) {
    return Result<bool>::failure(
        arrow_error(ErrorCode::IO_ERROR, "Failed to open input file", input_result.status()));
  }

  parquet::ArrowReaderProperties properties = parquet::default_arrow_reader_properties();
  properties.set_batch_size(batch_size);

  try {
    parquet::arrow::FileReaderBuilder builder;
    auto status = builder.Open(*input_result);
    if (!status.ok()) {
      return Result<bool>::failure(
          arrow_error(ErrorCode::IO_ERROR, "Not a readable Parquet file", status));
    }

    status = builder.memory_pool(arrow::default_memory_pool())->properties(properties)->Build(&reader_);
    if (!status.ok()) {
      return Result<bool>::failure(
          arrow_error(ErrorCode::IO_ERROR, "Failed to create Parquet reader", status));
    }

    status = reader_->GetSchema(&schema_);
    if (!status.ok()) {
      return Result<bool>::failure(
          arrow_error(ErrorCode::IO_ERROR, "Failed to read Parquet schema", status));
    }

    status = reader_->GetRecordBatchReader(&batches_);
    if (!status.ok()) {
      return Result<bool>::failure(
          arrow_error(ErrorCode::IO_ERROR, "Failed to create batch reader", status));
    }
  } catch (const parquet::ParquetException& e) {
    return Result<bool>::failure(ErrorCode::IO_ERROR,
                                 std::string("Not a readable Parquet file: ") + e.what());
  }

  return Result<bool>::success(true);
}

int64_t ParquetBatchReader::num_rows() const {
  if (!reader_)
    return 0;
  return reader_->parquet_reader()->metadata()->num_rows();
}

Result<std::shared_ptr<arrow::RecordBatch>> ParquetBatchReader::next_batch() {
  using BatchResult = Result<std::shared_ptr<arrow::RecordBatch>>;
  if (!batches_)
    return BatchResult::failure(ErrorCode::IO_ERROR, "Reader is not open");

  std::shared_ptr<arrow::RecordBatch> batch;
  try {
    auto status = batches_->ReadNext(&batch);
    if (!status.ok())
      return BatchResult::failure(arrow_error(ErrorCode::IO_ERROR, "Failed to read batch", status));
  } catch (const parquet::ParquetException& e) {
    return BatchResult::failure(ErrorCode::IO_ERROR, std::string("Failed to read batch: ") + e.what());
  }
  return BatchResult::success(std::move(batch));
}

// =============================================================================
// ParquetBatchWriter
// =============================================================================

ParquetBatchWriter::~ParquetBatchWriter() {
  if (writer_ || sink_)
    discard();
}

Result<bool> ParquetBatchWriter::create(const std::string& path,
                                        const std::shared_ptr<arrow::Schema>& schema,
                                        const ParquetWriteOptions& options) {
  if (!schema)
    return Result<bool>::failure(ErrorCode::INTERNAL_ERROR, "Schema is null");

  path_ = path;
  temp_path_ = path + ".tmp." + std::to_string(getpid());
  rows_written_ = 0;
  bytes_written_ = 0;

  auto file_result = arrow::io::FileOutputStream::Open(temp_path_);
  if (!file_result.ok()) {
    return Result<bool>::failure(
        arrow_error(ErrorCode::IO_ERROR, "Failed to open output file", file_result.status()));
  }
  sink_ = *file_result;

  auto builder = parquet::WriterProperties::Builder();

  parquet::Compression::type compression;
  switch (options.compression) {
  case ParquetWriteOptions::Compression::UNCOMPRESSED:
    compression = parquet::Compression::UNCOMPRESSED;
    break;
  case ParquetWriteOptions::Compression::SNAPPY:
    compression = parquet::Compression::SNAPPY;
    break;
  case ParquetWriteOptions::Compression::GZIP:
    compression = parquet::Compression::GZIP;
    break;
  case ParquetWriteOptions::Compression::LZ4:
    compression = parquet::Compression::LZ4;
    break;
  case ParquetWriteOptions::Compression::ZSTD:
  default:
    compression = parquet::Compression::ZSTD;
    break;
  }
  builder.compression(compression);
  builder.max_row_group_length(options.row_group_size);
  auto writer_properties = builder.build();

  // Keep the Arrow schema (and its metadata) in the file so readers see the
  // same types that came in
  auto arrow_properties = parquet::ArrowWriterProperties::Builder().store_schema()->build();

  auto writer_result = parquet::arrow::FileWriter::Open(*schema, arrow::default_memory_pool(), sink_,
                                                        writer_properties, arrow_properties);
  if (!writer_result.ok()) {
    discard();
    return Result<bool>::failure(
        arrow_error(ErrorCode::IO_ERROR, "Failed to create Parquet writer", writer_result.status()));
  }
  writer_ = std::move(*writer_result);

  return Result<bool>::success(true);
}

Result<bool> ParquetBatchWriter::write(const arrow::RecordBatch& batch) {
  if (!writer_)
    return Result<bool>::failure(ErrorCode::IO_ERROR, "Writer is not open");
  if (batch.num_rows() == 0)
    return Result<bool>::success(true);

  auto status = writer_->WriteRecordBatch(batch);
  if (!status.ok())
    return Result<bool>::failure(arrow_error(ErrorCode::IO_ERROR, "Failed to write batch", status));

  rows_written_ += batch.num_rows();
  return Result<bool>::success(true);
}

Result<bool> ParquetBatchWriter::finalize() {
  if (!writer_)
    return Result<bool>::failure(ErrorCode::IO_ERROR, "Writer is not open");

  auto status = writer_->Close();
  if (!status.ok()) {
    discard();
    return Result<bool>::failure(arrow_error(ErrorCode::IO_ERROR, "Failed to close Parquet writer", status));
  }
  writer_.reset();

  auto pos_result = sink_->Tell();
  if (pos_result.ok())
    bytes_written_ = *pos_result;

  status = sink_->Close();
  if (!status.ok()) {
    discard();
    return Result<bool>::failure(arrow_error(ErrorCode::IO_ERROR, "Failed to close output file", status));
  }
  sink_.reset();

  std::error_code ec;
  std::filesystem::rename(temp_path_, path_, ec);
  if (ec) {
    discard();
    return Result<bool>::failure(ErrorCode::IO_ERROR,
                                 "Failed to move output into place: " + ec.message());
  }
  temp_path_.clear();

  return Result<bool>::success(true);
}

void ParquetBatchWriter::discard() {
  // The footer the writer emits on destruction lands in the temp file, which
  // is removed below
  writer_.reset();
  if (sink_) {
    if (!sink_->closed()) {
      auto status = sink_->Close();
      if (!status.ok())
        status.Warn("Failed to close discarded output " + temp_path_);
    }
    sink_.reset();
  }
  if (!temp_path_.empty()) {
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
    temp_path_.clear();
  }
}

} // namespace babylonify
