/**
 * @file parquet_io.h
 * @brief Batched Parquet reading and streaming Parquet writing.
 *
 * ParquetBatchReader yields record batches lazily so a file is never fully
 * materialized. ParquetBatchWriter writes batches as they arrive into a
 * temporary sibling of the destination and moves it into place on finalize(),
 * so a failed run never leaves a truncated file at the destination path.
 */

#pragma once

#include "babylonify/error.h"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <cstdint>
#include <memory>
#include <string>

namespace babylonify {

/// Convert a non-OK Arrow status into an Error with context.
Error arrow_error(ErrorCode code, const std::string& context, const arrow::Status& status);

struct ParquetWriteOptions {
  enum class Compression { UNCOMPRESSED, SNAPPY, GZIP, ZSTD, LZ4 };

  Compression compression = Compression::ZSTD;

  /// Maximum rows per row group
  int64_t row_group_size = 1024 * 1024;
};

const char* compression_to_string(ParquetWriteOptions::Compression compression);

class ParquetBatchReader {
public:
  ParquetBatchReader() = default;
  ParquetBatchReader(const ParquetBatchReader&) = delete;
  ParquetBatchReader& operator=(const ParquetBatchReader&) = delete;

  /// Open a file; batches will hold at most batch_size rows.
  /// Failures are IO_ERROR.
  Result<bool> open(const std::string& path, int64_t batch_size);

  const std::shared_ptr<arrow::Schema>& schema() const { return schema_; }

  /// Total rows according to the file footer.
  int64_t num_rows() const;

  /// Next batch, or nullptr once the file is exhausted.
  Result<std::shared_ptr<arrow::RecordBatch>> next_batch();

private:
  std::string path_;
  std::unique_ptr<parquet::arrow::FileReader> reader_;
  std::unique_ptr<arrow::RecordBatchReader> batches_;
  std::shared_ptr<arrow::Schema> schema_;
};

class ParquetBatchWriter {
public:
  ParquetBatchWriter() = default;
  ~ParquetBatchWriter();

  ParquetBatchWriter(const ParquetBatchWriter&) = delete;
  ParquetBatchWriter& operator=(const ParquetBatchWriter&) = delete;

  /// Create the temporary output file and the Parquet writer for schema.
  Result<bool> create(const std::string& path, const std::shared_ptr<arrow::Schema>& schema,
                      const ParquetWriteOptions& options = ParquetWriteOptions());

  /// Append a batch. Empty batches are skipped.
  Result<bool> write(const arrow::RecordBatch& batch);

  /// Write the footer, close the file and move it to the destination path.
  Result<bool> finalize();

  /// Drop everything written so far and delete the temporary file.
  /// Safe to call at any point, including after a failed finalize().
  void discard();

  bool is_open() const { return writer_ != nullptr; }
  int64_t rows_written() const { return rows_written_; }
  int64_t bytes_written() const { return bytes_written_; }
  const std::string& temp_path() const { return temp_path_; }

private:
  std::string path_;
  std::string temp_path_;
  std::shared_ptr<arrow::io::FileOutputStream> sink_;
  std::unique_ptr<parquet::arrow::FileWriter> writer_;
  int64_t rows_written_ = 0;
  int64_t bytes_written_ = 0;
};

} // namespace babylonify
