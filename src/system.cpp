/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Child process execution through /bin/sh
 *
 *          - Output staging (PendingOutput)
 *
 *          - String and time formatting utilities
 */

#include "snapmerge/system.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "snapmerge/errors.hpp"
#include "snapmerge/logging.hpp"

namespace snapmerge {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// Count CPUs in a cpuset list such as "0-3,6,8-9"
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  if (line.empty())
    return -1;

  int count = 0;
  std::stringstream ss(line);
  std::string range;
  while (std::getline(ss, range, ',')) {
    auto dash = range.find('-');
    try {
      if (dash == std::string::npos) {
        std::stoi(range);
        count++;
      } else {
        int lo = std::stoi(range.substr(0, dash));
        int hi = std::stoi(range.substr(dash + 1));
        count += std::max(0, hi - lo + 1);
      }
    } catch (const std::exception &) {
      return -1;
    }
  }
  return count > 0 ? count : -1;
}

/// Ceil(quota / period) from a cgroup v2 cpu.max line ("max 100000" = none)
int cgroup_v2_quota() {
  std::ifstream f("/sys/fs/cgroup/cpu.max");
  if (!f)
    return -1;
  std::string quota_str, period_str;
  f >> quota_str >> period_str;
  if (quota_str == "max" || period_str.empty())
    return -1;
  try {
    long quota = std::stol(quota_str);
    long period = std::stol(period_str);
    if (quota > 0 && period > 0)
      return static_cast<int>((quota + period - 1) / period);
  } catch (const std::exception &) {
  }
  return -1;
}

int cgroup_v1_quota() {
  std::ifstream fq("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
  std::ifstream fp("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
  long quota = -1, period = -1;
  if (!(fq >> quota) || !(fp >> period))
    return -1;
  if (quota > 0 && period > 0)
    return static_cast<int>((quota + period - 1) / period);
  return -1;
}

std::atomic<unsigned> pending_counter{0};

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = cgroup_v2_quota();

  if (limit <= 0)
    limit = cgroup_v1_quota();

  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0)
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
  }

  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  return std::clamp(limit, 1, 64);
}

int calculate_parallel_streams(int configured) {
  int available = detect_cpu_limit();
  if (configured <= 0)
    return available;
  return std::max(1, std::min(configured, available));
}

// **---- Processes ----**

std::string shell_quote(const std::string &arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out += '\'';
  for (char c : arg) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

int run_command(const std::string &cmd) {
  LOG_DEBUG("exec: {}", cmd);
  int status = std::system(cmd.c_str());
  if (status == -1)
    return -1;
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  return -1;
}

bool executable_available(const std::string &name) {
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0;
  }
  const char *path_env = std::getenv("PATH");
  if (!path_env)
    return false;

  std::stringstream ss(path_env);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty())
      continue;
    fs::path candidate = fs::path(dir) / name;
    if (access(candidate.c_str(), X_OK) == 0)
      return true;
  }
  return false;
}

// **---- Output Staging ----**

PendingOutput::PendingOutput(fs::path final_path)
    : final_(std::move(final_path)) {
  /// Hidden sibling on the same filesystem so rename() is atomic; the
  /// extension is kept for tools that infer the format from it
  temp_ = final_.parent_path() /
          fmt::format(".{}.partial-{}-{}{}", final_.stem().string(), getpid(),
                      pending_counter.fetch_add(1),
                      final_.extension().string());
}

PendingOutput::~PendingOutput() {
  if (!committed_) {
    std::error_code ec;
    fs::remove(temp_, ec);
  }
}

void PendingOutput::commit() {
  std::error_code ec;
  fs::rename(temp_, final_, ec);
  if (ec) {
    throw Error(fmt::format("cannot move {} into place: {}", final_.string(),
                            ec.message()),
                final_);
  }
  committed_ = true;
}

void write_file_atomically(const fs::path &path,
                           const std::vector<uint8_t> &bytes) {
  PendingOutput pending(path);
  {
    std::ofstream out(pending.temp(), std::ios::binary | std::ios::trunc);
    if (!out) {
      throw Error(fmt::format("cannot open {} for writing", path.string()),
                  path);
    }
    out.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!out) {
      throw Error(fmt::format("short write to {}", path.string()), path);
    }
  }
  pending.commit();
}

void copy_file_atomically(const fs::path &from, const fs::path &to) {
  PendingOutput pending(to);
  std::error_code ec;
  fs::copy_file(from, pending.temp(), fs::copy_options::overwrite_existing,
                ec);
  if (ec) {
    throw Error(fmt::format("cannot copy {} to {}: {}", from.string(),
                            to.string(), ec.message()),
                from);
  }
  auto mtime = fs::last_write_time(from, ec);
  if (!ec) {
    fs::last_write_time(pending.temp(), mtime, ec);
  }
  if (ec) {
    LOG_WARN("Could not preserve modification time of {}: {}", from.string(),
             ec.message());
  }
  pending.commit();
}

// **---- Utilities ----**

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace snapmerge
