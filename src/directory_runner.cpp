#include "babylonify/directory_runner.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace babylonify {

const char* run_status_to_string(RunStatus status) {
  switch (status) {
  case RunStatus::ALL_SUCCEEDED:
    return "ALL_SUCCEEDED";
  case RunStatus::PARTIAL:
    return "PARTIAL";
  case RunStatus::ALL_FAILED:
    return "ALL_FAILED";
  case RunStatus::NO_FILES:
    return "NO_FILES";
  default:
    return "UNKNOWN";
  }
}

// =============================================================================
// RunReport
// =============================================================================

size_t RunReport::succeeded() const {
  return static_cast<size_t>(
      std::count_if(files.begin(), files.end(), [](const FileOutcome& f) { return f.ok; }));
}

size_t RunReport::failed() const {
  return files.size() - succeeded();
}

RunStatus RunReport::status() const {
  if (files.empty())
    return RunStatus::NO_FILES;
  size_t ok_count = succeeded();
  if (ok_count == files.size())
    return RunStatus::ALL_SUCCEEDED;
  if (ok_count == 0)
    return RunStatus::ALL_FAILED;
  return RunStatus::PARTIAL;
}

bool RunReport::ok() const {
  RunStatus s = status();
  return s == RunStatus::ALL_SUCCEEDED || s == RunStatus::PARTIAL;
}

std::string RunReport::summary() const {
  return "Processed " + std::to_string(files.size()) + " files: " + std::to_string(succeeded()) +
         " succeeded, " + std::to_string(failed()) + " failed";
}

// =============================================================================
// File discovery
// =============================================================================

namespace {

bool has_parquet_extension(const fs::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".parquet";
}

} // namespace

Result<std::vector<std::string>> list_parquet_files(const std::string& dir) {
  using ListResult = Result<std::vector<std::string>>;

  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return ListResult::failure(ErrorCode::IO_ERROR, "'" + dir + "' is not a readable directory");

  std::vector<std::string> files;
  fs::directory_iterator it(dir, ec);
  if (ec)
    return ListResult::failure(ErrorCode::IO_ERROR, "Failed to list '" + dir + "': " + ec.message());

  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec)
      break;
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && has_parquet_extension(it->path()))
      files.push_back(it->path().string());
  }
  if (ec)
    return ListResult::failure(ErrorCode::IO_ERROR, "Failed to list '" + dir + "': " + ec.message());

  std::sort(files.begin(), files.end());
  return ListResult::success(std::move(files));
}

// =============================================================================
// DirectoryRunner
// =============================================================================

struct DirectoryRunner::Impl {
  const LanguageDetector& detector;
  FilterOptions options;
  DebugTrace* trace = nullptr;
  FileCallback on_file;

  Impl(const LanguageDetector& d, FilterOptions opts, DebugTrace* t)
      : detector(d), options(std::move(opts)), trace(t) {}
};

DirectoryRunner::DirectoryRunner(const LanguageDetector& detector, FilterOptions options,
                                 DebugTrace* trace)
    : impl_(std::make_unique<Impl>(detector, std::move(options), trace)) {}

DirectoryRunner::~DirectoryRunner() = default;

void DirectoryRunner::set_file_callback(FileCallback callback) {
  impl_->on_file = std::move(callback);
}

Result<RunReport> DirectoryRunner::run(const std::string& source_dir, const std::string& dest_dir) {
  std::error_code ec;
  if (fs::exists(dest_dir, ec) && !fs::is_directory(dest_dir, ec)) {
    return Result<RunReport>::failure(ErrorCode::INVALID_ARGUMENT,
                                      "Output '" + dest_dir + "' exists and is not a directory");
  }

  auto listed = list_parquet_files(source_dir);
  if (!listed.ok)
    return Result<RunReport>::failure(listed.error);

  fs::create_directories(dest_dir, ec);
  if (ec) {
    return Result<RunReport>::failure(ErrorCode::IO_ERROR, "Failed to create output directory '" +
                                                               dest_dir + "': " + ec.message());
  }

  if (impl_->trace)
    impl_->trace->log("Found %zu Parquet files in %s", listed.value.size(), source_dir.c_str());

  RunReport report;
  if (listed.value.empty())
    return Result<RunReport>::success(std::move(report));

  // One pool for the whole run; files are processed one after another
  BS::thread_pool pool(resolve_thread_count(impl_->options.num_threads));

  for (const auto& input : listed.value) {
    FileOutcome outcome;
    outcome.input_path = input;
    outcome.output_path = (fs::path(dest_dir) / fs::path(input).filename()).string();

    BatchPipeline pipeline(impl_->detector, impl_->options, pool, impl_->trace);
    auto result = pipeline.run(outcome.input_path, outcome.output_path);
    if (result.ok) {
      outcome.ok = true;
      outcome.stats = result.value;
    } else {
      outcome.error = result.error;
    }

    if (impl_->on_file)
      impl_->on_file(outcome);
    report.files.push_back(std::move(outcome));
  }

  if (impl_->trace)
    impl_->trace->log("%s (%s)", report.summary().c_str(), run_status_to_string(report.status()));

  return Result<RunReport>::success(std::move(report));
}

} // namespace babylonify
