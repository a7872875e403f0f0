/**
 * @file directory_runner.h
 * @brief Filters every Parquet file of a directory into a destination directory.
 */

#pragma once

#include "babylonify/batch_pipeline.h"
#include "babylonify/debug.h"
#include "babylonify/detector.h"
#include "babylonify/error.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace babylonify {

/// Outcome of one file of a directory run.
struct FileOutcome {
  std::string input_path;
  std::string output_path;
  bool ok = false;
  FileStats stats; ///< Valid when ok
  Error error;     ///< Set when !ok
};

enum class RunStatus { ALL_SUCCEEDED, PARTIAL, ALL_FAILED, NO_FILES };

const char* run_status_to_string(RunStatus status);

struct RunReport {
  /// One entry per discovered file, in discovery (sorted path) order
  std::vector<FileOutcome> files;

  size_t succeeded() const;
  size_t failed() const;
  RunStatus status() const;

  /// ALL_FAILED and NO_FILES are failures of the run as a whole.
  bool ok() const;

  /// "Processed 3 files: 2 succeeded, 1 failed"
  std::string summary() const;
};

/// Regular files directly under dir with a .parquet extension (any case),
/// sorted by path.
Result<std::vector<std::string>> list_parquet_files(const std::string& dir);

/**
 * @brief Runs a BatchPipeline per file, sequentially, sharing one worker pool.
 *
 * A failing file is recorded in the report and does not affect its siblings.
 * Only problems with the directories themselves fail the whole run.
 */
class DirectoryRunner {
public:
  DirectoryRunner(const LanguageDetector& detector, FilterOptions options,
                  DebugTrace* trace = nullptr);
  ~DirectoryRunner();

  DirectoryRunner(const DirectoryRunner&) = delete;
  DirectoryRunner& operator=(const DirectoryRunner&) = delete;

  /// Called after each file finishes, before the next one starts.
  using FileCallback = std::function<void(const FileOutcome&)>;
  void set_file_callback(FileCallback callback);

  /**
   * @return The report, or INVALID_ARGUMENT when dest_dir exists and is not a
   *         directory, or IO_ERROR when source_dir cannot be listed or
   *         dest_dir cannot be created
   */
  Result<RunReport> run(const std::string& source_dir, const std::string& dest_dir);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace babylonify
