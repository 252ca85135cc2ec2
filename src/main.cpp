/**
 * @file main.cpp
 * @brief Entry point for SnapMerge application
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Batch run over one export directory with BatchProcessor
 *
 *          - Exit status: 0 success, 1 usage or missing input, 2 failures
 *
 * @note Set PARALLEL_STREAMS to process several entries concurrently and
 *       FAIL_FAST=1 to stop after the first failing entry.
 */

#include <cstdio>
#include <filesystem>
#include <string>

#include "snapmerge/batch_processor.hpp"
#include "snapmerge/config.hpp"
#include "snapmerge/errors.hpp"
#include "snapmerge/logging.hpp"

using namespace snapmerge;

namespace {

void print_usage() {
  LOG_WARN("Usage: ./snapmerge <input_dir> <output_dir> [--overwrite] "
           "[--dry-run] [--verbose] [--fail-fast]");
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  namespace fs = std::filesystem;

  bool overwrite = false;
  bool dry_run = false;
  bool fail_fast = false;
  bool verbose = false;
  std::string positional[2];
  int n_positional = 0;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--overwrite") {
      overwrite = true;
    } else if (arg == "--dry-run") {
      dry_run = true;
    } else if (arg == "--verbose") {
      verbose = true;
    } else if (arg == "--fail-fast") {
      fail_fast = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else if (arg.rfind("--", 0) == 0) {
      LOG_ERROR("Unknown option: {}", arg);
      print_usage();
      return 1;
    } else if (n_positional < 2) {
      positional[n_positional++] = arg;
    } else {
      LOG_ERROR("Unexpected argument: {}", arg);
      print_usage();
      return 1;
    }
  }

  if (n_positional < 2) {
    print_usage();
    return 1;
  }

  set_verbose(verbose);

  fs::path input_dir = positional[0];
  fs::path output_dir = positional[1];

  LOG_INFO("SnapMerge - Batch Mode");

  BatchReport report;
  try {
    /// Reads PARALLEL_STREAMS and FAIL_FAST
    BatchOptions options;
    options.overwrite = overwrite;
    options.dry_run = dry_run;
    options.fail_fast = options.fail_fast || fail_fast;
    LOG_DEBUG("Overwrite: {}, dry run: {}, fail fast: {}", options.overwrite,
              options.dry_run, options.fail_fast);

    BatchProcessor processor(options);
    report = processor.process(input_dir, output_dir);
  } catch (const NotFoundError &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  } catch (const InvalidArgumentError &e) {
    LOG_ERROR("Invalid configuration: {}", e.what());
    return 1;
  } catch (const std::exception &e) {
    LOG_ERROR("{}", e.what());
    return 2;
  }

  if (verbose) {
    TimingCollector::print_summary();
  }

  return report.ok() ? 0 : 2;
}
