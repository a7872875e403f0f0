/**
 * babylonify - Keep the rows of Parquet transcription datasets whose text is
 * in a given language.
 */

#include "babylonify/babylonify.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <string>
#include <system_error>

using namespace std;

constexpr long MIN_THREADS = 1;
constexpr long MAX_THREADS = static_cast<long>(babylonify::kMaxThreads);
constexpr const char* DEFAULT_COLUMN = "transcription";
constexpr const char* DEFAULT_LANGUAGE = "uk";

// Long-only options
enum LongOption { OPT_INPUT_DIR = 256, OPT_KEEP_EMPTY, OPT_CLEAN };

void printVersion() {
  cout << "babylonify version " << BABYLONIFY_VERSION_STRING << '\n';
}

void printUsage(const char* prog) {
  cerr << "babylonify - Filter Parquet transcription datasets by language\n\n";
  cerr << "Usage: " << prog << " (-i <file> | --input-dir <dir>) -o <path> [options]\n\n";
  cerr << "Input/Output:\n";
  cerr << "  -i, --input <file>       Input Parquet file\n";
  cerr << "      --input-dir <dir>    Directory of Parquet files (not recursive)\n";
  cerr << "  -o, --output <path>      Output file, or output directory with --input-dir\n";
  cerr << "\nOptions:\n";
  cerr << "  -c, --column <name>      Text column (default: " << DEFAULT_COLUMN << ")\n";
  cerr << "  -l, --lang <language>    Language to keep: code or name, e.g. uk, ukr,\n";
  cerr << "                           Ukrainian, українська (default: " << DEFAULT_LANGUAGE
       << ")\n";
  cerr << "  -t, --threads <n>        Number of threads (default: auto, max: " << MAX_THREADS
       << ")\n";
  cerr << "  -b, --batch-size <n>     Rows per batch (default: "
       << babylonify::FilterOptions().batch_size << ")\n";
  cerr << "      --keep-empty         Keep rows whose text is null or empty\n";
  cerr << "      --clean              Strip digits, symbols and extra whitespace from the\n";
  cerr << "                           text before detection and write the cleaned text\n";
  cerr << "  -S, --strict             Exit with code 1 if any file fails\n";
  cerr << "  -V, --verbose            Trace progress and timings on stderr\n";
  cerr << "  -h, --help               Show this help message\n";
  cerr << "  -v, --version            Show version information\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " -i data.parquet -o data.uk.parquet\n";
  cerr << "  " << prog << " -i data.parquet -o data.en.parquet -l english -c text\n";
  cerr << "  " << prog << " --input-dir shards/ -o filtered/ --clean -t 8\n";
}

static bool parseLong(const char* text, long& out) {
  char* endptr;
  errno = 0;
  long val = strtol(text, &endptr, 10);
  if (endptr == text || *endptr != '\0' || errno == ERANGE)
    return false;
  out = val;
  return true;
}

static void printFileResult(const string& input, const string& output,
                            const babylonify::FileStats& stats, const string& lang_name,
                            bool clean) {
  cout << "Filtered " << stats.rows_read << " rows -> " << stats.rows_kept
       << " rows kept (lang = " << lang_name << ", cleaned = " << (clean ? "true" : "false")
       << ") [" << input << " -> " << output << "]\n";
}

static void printFileError(const string& input, const babylonify::Error& error) {
  cerr << "Error: " << input << ": " << error.to_string() << endl;
}

int main(int argc, char* argv[]) {
  // Disable buffering for stdout so popen() in tests sees every line.
  setvbuf(stdout, nullptr, _IONBF, 0);

  string input_file;
  string input_dir;
  string output;
  string column = DEFAULT_COLUMN;
  string lang_token = DEFAULT_LANGUAGE;
  size_t n_threads = 0;
  int64_t batch_size = babylonify::FilterOptions().batch_size;
  bool keep_empty = false;
  bool clean = false;
  bool strict_mode = false;
  bool verbose = false;

  static const struct option long_options[] = {
      {"input", required_argument, nullptr, 'i'},
      {"input-dir", required_argument, nullptr, OPT_INPUT_DIR},
      {"output", required_argument, nullptr, 'o'},
      {"column", required_argument, nullptr, 'c'},
      {"lang", required_argument, nullptr, 'l'},
      {"threads", required_argument, nullptr, 't'},
      {"batch-size", required_argument, nullptr, 'b'},
      {"keep-empty", no_argument, nullptr, OPT_KEEP_EMPTY},
      {"clean", no_argument, nullptr, OPT_CLEAN},
      {"strict", no_argument, nullptr, 'S'},
      {"verbose", no_argument, nullptr, 'V'},
      {"help", no_argument, nullptr, 'h'},
      {"version", no_argument, nullptr, 'v'},
      {nullptr, 0, nullptr, 0}};

  int c;
  while ((c = getopt_long(argc, argv, "i:o:c:l:t:b:SVhv", long_options, nullptr)) != -1) {
    switch (c) {
    case 'i':
      input_file = optarg;
      break;
    case OPT_INPUT_DIR:
      input_dir = optarg;
      break;
    case 'o':
      output = optarg;
      break;
    case 'c':
      column = optarg;
      break;
    case 'l':
      lang_token = optarg;
      break;
    case 't': {
      long val;
      if (!parseLong(optarg, val) || val < MIN_THREADS || val > MAX_THREADS) {
        cerr << "Error: Thread count must be between " << MIN_THREADS << " and " << MAX_THREADS
             << "\n";
        return 1;
      }
      n_threads = static_cast<size_t>(val);
      break;
    }
    case 'b': {
      long val;
      if (!parseLong(optarg, val) || val <= 0) {
        cerr << "Error: Invalid batch size '" << optarg << "'\n";
        return 1;
      }
      batch_size = static_cast<int64_t>(val);
      break;
    }
    case OPT_KEEP_EMPTY:
      keep_empty = true;
      break;
    case OPT_CLEAN:
      clean = true;
      break;
    case 'S':
      strict_mode = true;
      break;
    case 'V':
      verbose = true;
      break;
    case 'h':
      printUsage(argv[0]);
      return 0;
    case 'v':
      printVersion();
      return 0;
    default:
      printUsage(argv[0]);
      return 1;
    }
  }

  if (optind < argc) {
    cerr << "Error: Unexpected argument '" << argv[optind] << "'\n";
    printUsage(argv[0]);
    return 1;
  }
  if (input_file.empty() == input_dir.empty()) {
    cerr << "Error: Exactly one of --input or --input-dir is required\n";
    printUsage(argv[0]);
    return 1;
  }
  if (output.empty()) {
    cerr << "Error: --output is required\n";
    printUsage(argv[0]);
    return 1;
  }

  // Resolve the language before touching any file
  auto lang = babylonify::resolve_language(lang_token);
  if (!lang.ok) {
    cerr << "Error: " << lang.error.message() << endl;
    return 1;
  }
  const string lang_name = babylonify::language_display_name(lang.value);

  babylonify::FilterOptions options;
  options.column = column;
  options.target = lang.value;
  options.clean = clean;
  options.keep_empty = keep_empty;
  options.num_threads = babylonify::resolve_thread_count(n_threads);
  options.batch_size = batch_size;

  babylonify::DebugConfig debug_config = verbose ? babylonify::DebugConfig::all()
                                                  : babylonify::DebugConfig{};
  babylonify::DebugTrace trace(debug_config);
  babylonify::DebugTrace* pipeline_trace = debug_config.enabled() ? &trace : nullptr;

  trace.log("Target language: %s (%s), column '%s', %zu threads, batch size %lld",
            lang_name.c_str(), babylonify::language_code(lang.value).c_str(), column.c_str(),
            options.num_threads, static_cast<long long>(batch_size));

  babylonify::Cld2Detector detector;
  int result = 0;

  if (!input_file.empty()) {
    std::error_code ec;
    if (std::filesystem::is_directory(output, ec)) {
      cerr << "Error: Output path '" << output
           << "' is a directory; use --input-dir to filter a directory\n";
      return 1;
    }

    babylonify::BatchPipeline pipeline(detector, options, pipeline_trace);
    auto stats = pipeline.run(input_file, output);
    if (stats.ok) {
      printFileResult(input_file, output, stats.value, lang_name, clean);
    } else {
      printFileError(input_file, stats.error);
      result = 1;
    }
  } else {
    babylonify::DirectoryRunner runner(detector, options, pipeline_trace);
    runner.set_file_callback([&](const babylonify::FileOutcome& outcome) {
      if (outcome.ok)
        printFileResult(outcome.input_path, outcome.output_path, outcome.stats, lang_name, clean);
      else
        printFileError(outcome.input_path, outcome.error);
    });

    auto report = runner.run(input_dir, output);
    if (!report.ok) {
      cerr << "Error: " << report.error.to_string() << endl;
      return 1;
    }

    switch (report.value.status()) {
    case babylonify::RunStatus::NO_FILES:
      cerr << "Error: No Parquet files found in '" << input_dir << "'\n";
      result = 1;
      break;
    case babylonify::RunStatus::ALL_FAILED:
      result = 1;
      break;
    case babylonify::RunStatus::PARTIAL:
      result = strict_mode ? 1 : 0;
      break;
    case babylonify::RunStatus::ALL_SUCCEEDED:
      result = 0;
      break;
    }
    if (report.value.status() != babylonify::RunStatus::NO_FILES)
      cout << report.value.summary() << "\n";
  }

  trace.print_timing_summary();

  std::cout.flush();
  std::cerr.flush();
  fflush(stdout);
  fflush(stderr);
  return result;
}
