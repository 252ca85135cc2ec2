/**
 * @file system.hpp
 * @brief System utilities: CPU detection, processes and file staging
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Shell quoting and child process execution
 *
 *          - PendingOutput: write-to-temp-then-rename staging of outputs
 *
 *          - String and time formatting helpers
 */

#ifndef SNAPMERGE_SYSTEM_HPP
#define SNAPMERGE_SYSTEM_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace snapmerge {

// **---- CPU Detection ----**

/**
 * @brief Detect the number of CPUs available to this process.
 *
 * @note std::thread::hardware_concurrency() reports the host's cores inside
 *       a container. This reads the cgroup v2 `cpu.max` quota, then the
 *       cgroup v1 CFS quota, then the effective cpuset, and falls back to
 *       hardware_concurrency(). The result is clamped to [1, 64].
 */
int detect_cpu_limit();

/**
 * @brief Resolve a configured stream count to an actual worker count.
 * @param configured 0 = auto (CPU limit), otherwise the requested count
 * @return Worker count in [1, detect_cpu_limit()]
 */
int calculate_parallel_streams(int configured);

// **---- Processes ----**

/**
 * @brief Quote an argument for /bin/sh (single quotes, embedded ' escaped).
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief Run a shell command and wait for it.
 * @return Exit code of the command, or -1 if it did not exit normally
 */
int run_command(const std::string &cmd);

/**
 * @brief Whether an executable can be found (absolute path or on PATH).
 */
bool executable_available(const std::string &name);

// **---- Output Staging ----**

/**
 * @class PendingOutput
 * @brief Stages an output under a hidden temporary sibling name.
 *
 * @details Writers fill temp(), then commit() renames it onto the final
 *          path. If commit() is never reached (error, exception) the
 *          destructor deletes the temporary, so no partial output is left.
 */
class PendingOutput {
public:
  explicit PendingOutput(std::filesystem::path final_path);
  ~PendingOutput();

  PendingOutput(const PendingOutput &) = delete;
  PendingOutput &operator=(const PendingOutput &) = delete;

  const std::filesystem::path &temp() const { return temp_; }
  const std::filesystem::path &final_path() const { return final_; }

  /// Atomically move the temporary into place (replacing any existing file)
  void commit();

private:
  std::filesystem::path final_;
  std::filesystem::path temp_;
  bool committed_{false};
};

/**
 * @brief Write a byte buffer to a path through a PendingOutput.
 */
void write_file_atomically(const std::filesystem::path &path,
                           const std::vector<uint8_t> &bytes);

/**
 * @brief Copy a file, keeping its modification time, through a
 *        PendingOutput. Replaces an existing destination.
 */
void copy_file_atomically(const std::filesystem::path &from,
                          const std::filesystem::path &to);

// **---- Utilities ----**

/// ASCII lowercase copy of a string
std::string to_lower(std::string s);

/**
 * @brief Format seconds as HH:MM:SS string.
 */
std::string format_time(double seconds);

} // namespace snapmerge

#endif // SNAPMERGE_SYSTEM_HPP
