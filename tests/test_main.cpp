/**
 * @file test_main.cpp
 * @brief Catch2 runner with a private scratch directory per test process
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <cstdlib>
#include <filesystem>
#include <string>

#include <unistd.h>

#include "snapmerge/logging.hpp"

int main(int argc, char *argv[]) {
  namespace fs = std::filesystem;

  /// Archive tests count leftover scratch directories; keep them apart from
  /// other test processes running at the same time
  fs::path scratch = fs::temp_directory_path() /
                     ("snapmerge-tests-" + std::to_string(getpid()));
  fs::create_directories(scratch);
  setenv("SCRATCH_DIR", scratch.c_str(), 1);

  snapmerge::set_verbose(false);

  int result = Catch::Session().run(argc, argv);

  std::error_code ec;
  fs::remove_all(scratch, ec);
  return result;
}
