/**
 * @file batch_processor.cpp
 * @brief Parallel batch routing implementation
 *
 * @details Implements the BatchProcessor class:
 *
 *          - Sorted planning pass (classification, base names, conflicts)
 *
 *          - Shared work queue for load balancing across streams
 *
 *          - Per-entry error isolation with optional fail-fast
 *
 *          - Sequential summary output
 */

#include "snapmerge/batch_processor.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "snapmerge/archive.hpp"
#include "snapmerge/compositor.hpp"
#include "snapmerge/errors.hpp"
#include "snapmerge/image_codec.hpp"
#include "snapmerge/logging.hpp"
#include "snapmerge/pairing.hpp"
#include "snapmerge/system.hpp"

namespace snapmerge {

namespace fs = std::filesystem;

namespace {

/// Copy name of a loose image: its own name, plus an extension if missing
std::string image_copy_name(const fs::path &source, const ImageFormat &format) {
  std::string name = source.filename().string();
  if (!has_matching_extension(source, format)) {
    name += "." + format.extension;
  }
  return name;
}

/// File name combine() will write for this media under base_name
std::string merged_output_name(const std::string &base_name,
                               const fs::path &media) {
  if (auto image = probe_image(media)) {
    return base_name + "." + encodable_format(image->format).extension;
  }
  return base_name + ".mp4";
}

/**
 * @brief Output file name known before any work starts.
 * @return Empty for archives (claimed once unpacked) and for directories
 *         whose pair does not resolve (the entry fails when it runs).
 */
std::string planned_output_name(const fs::path &path, const EntryProbe &probe,
                                const std::string &base_name) {
  switch (probe.kind) {
  case Kind::Video:
    return path.filename().string();
  case Kind::Image:
    return image_copy_name(path, probe.image_format ? *probe.image_format
                                                    : image_format(path));
  case Kind::Directory:
    try {
      Pair pair = resolve_pair(path);
      return merged_output_name(base_name, pair.media);
    } catch (const std::exception &e) {
      LOG_DEBUG("No planned output for {}: {}", path.filename().string(),
                e.what());
      return {};
    }
  default:
    return {};
  }
}

} // anonymous namespace

const char *outcome_name(Outcome outcome) {
  switch (outcome) {
  case Outcome::Skipped:
    return "skipped";
  case Outcome::Copied:
    return "copied";
  case Outcome::Merged:
    return "merged";
  case Outcome::Failed:
    return "failed";
  }
  return "unknown";
}

std::size_t BatchReport::count(Outcome outcome) const {
  return static_cast<std::size_t>(
      std::count_if(results.begin(), results.end(),
                    [outcome](const auto &r) { return r.outcome == outcome; }));
}

std::string entry_base_name(const fs::path &path, const EntryProbe &probe) {
  switch (probe.kind) {
  case Kind::Archive:
    return archive_base_name(path);
  case Kind::Directory:
    return path.filename().string();
  case Kind::Image:
    if (probe.image_format && !has_matching_extension(path, *probe.image_format))
      return path.filename().string();
    return path.stem().string();
  default:
    return path.stem().string();
  }
}

BatchProcessor::BatchProcessor(BatchOptions options)
    : options_(options),
      num_streams_(calculate_parallel_streams(options.num_streams)) {}

BatchReport BatchProcessor::process(const fs::path &input_dir,
                                    const fs::path &output_dir) {
  std::error_code ec;
  if (!fs::is_directory(input_dir, ec)) {
    throw NotFoundError(
        fmt::format("{}: input directory does not exist", input_dir.string()),
        input_dir);
  }

  output_dir_ = output_dir;
  if (!options_.dry_run) {
    fs::create_directories(output_dir_);
  }

  // **---- PLANNING ----**

  std::vector<fs::path> entries;
  for (const auto &entry : fs::directory_iterator(input_dir)) {
    entries.push_back(entry.path());
  }
  std::sort(entries.begin(), entries.end());

  /// Snapshot before any worker starts; never re-queried mid-batch
  existing_ = OutputIndex::snapshot(output_dir_);

  TIMER_START(planning);
  plan_.clear();
  claimed_.clear();
  for (const auto &path : entries) {
    PlannedEntry planned;
    planned.source = path;
    planned.probe = inspect(path);
    planned.base_name = entry_base_name(path, planned.probe);

    const bool writes = planned.probe.kind != Kind::Unsupported &&
                        (options_.overwrite ||
                         !existing_.contains(planned.base_name));
    if (writes) {
      planned.output_name =
          planned_output_name(path, planned.probe, planned.base_name);
    }
    if (!planned.output_name.empty()) {
      auto inserted = claimed_.emplace(to_lower(planned.output_name), path);
      if (!inserted.second) {
        planned.conflicts_with = inserted.first->second;
      }
    }
    LOG_DEBUG("Planned {} ({}) -> '{}'", path.filename().string(),
              kind_name(planned.probe.kind),
              planned.output_name.empty() ? planned.base_name
                                          : planned.output_name);
    plan_.push_back(std::move(planned));
  }
  TIMER_END(planning);

  slots_.assign(plan_.size(), EntryResult{});
  started_.assign(plan_.size(), 0);
  entries_done_.store(0);
  stop_.store(false);
  work_queue_ = std::queue<std::size_t>();
  for (std::size_t i = 0; i < plan_.size(); ++i) {
    work_queue_.push(i);
  }

  int actual_streams =
      std::max(1, std::min(num_streams_, static_cast<int>(plan_.size())));

  LOG_PHASE("================== BATCH PROCESSING ==================");
  LOG_INFO("Input directory: {}", input_dir.string());
  LOG_INFO("Output directory: {}", output_dir_.string());
  LOG_INFO("Entries: {}", plan_.size());
  LOG_INFO("Existing outputs: {}", existing_.size());
  LOG_INFO("Parallel streams: {}", actual_streams);
  if (options_.overwrite)
    LOG_INFO("Overwrite: enabled");
  if (options_.dry_run)
    LOG_INFO("Dry run: nothing will be written");
  LOG_PHASE("=======================================================");

  auto batch_start = std::chrono::high_resolution_clock::now();

  std::vector<std::thread> streams;
  for (int i = 0; i < actual_streams; ++i) {
    streams.emplace_back(&BatchProcessor::stream_worker, this, i);
  }
  for (auto &stream : streams) {
    stream.join();
  }

  auto batch_end = std::chrono::high_resolution_clock::now();

  BatchReport report;
  report.wall_clock_sec =
      std::chrono::duration<double>(batch_end - batch_start).count();
  for (std::size_t i = 0; i < slots_.size(); ++i) {
    if (started_[i]) {
      report.results.push_back(std::move(slots_[i]));
    } else {
      ++report.not_started;
    }
  }

  print_batch_summary(report);
  return report;
}

bool BatchProcessor::get_next_entry(std::size_t &index) {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (work_queue_.empty() || stop_.load()) {
    return false;
  }
  index = work_queue_.front();
  work_queue_.pop();
  return true;
}

void BatchProcessor::stream_worker(int stream_id) {
  std::size_t index = 0;
  while (get_next_entry(index)) {
    const PlannedEntry &entry = plan_[index];
    const std::string name = entry.source.filename().string();
    started_[index] = 1;

    LOG_DEBUG("[Stream {}] Processing: {} ({}/{})", stream_id, name,
              entries_done_.load() + 1, plan_.size());

    auto start_time = std::chrono::high_resolution_clock::now();

    EntryResult result;
    try {
      result = process_entry(entry);
    } catch (const Error &e) {
      result.outcome = Outcome::Failed;
      result.error_kind = e.kind();
      result.reason = e.what();
    } catch (const std::exception &e) {
      /// Filesystem and allocation failures outside our hierarchy
      result.outcome = Outcome::Failed;
      result.error_kind = "std::exception";
      result.reason = fmt::format("{}: {}", entry.source.string(), e.what());
    }
    result.source = entry.source;
    result.kind = entry.probe.kind;

    auto end_time = std::chrono::high_resolution_clock::now();
    result.processing_time_us =
        std::chrono::duration_cast<std::chrono::microseconds>(end_time -
                                                              start_time)
            .count();

    ++entries_done_;

    switch (result.outcome) {
    case Outcome::Skipped:
      LOG_INFO("[Stream {}] Skipping existing output: {}", stream_id,
               entry.base_name);
      break;
    case Outcome::Failed:
      LOG_ERROR("[Stream {}] Failed: {} ({}: {})", stream_id, name,
                result.error_kind, result.reason);
      if (options_.fail_fast)
        stop_.store(true);
      break;
    default:
      LOG_SUCCESS("[Stream {}] {}: {} -> {} ({:.1f}s)", stream_id,
                  outcome_name(result.outcome), name,
                  result.output.filename().string(),
                  result.processing_time_us / 1000000.0);
      break;
    }

    slots_[index] = std::move(result);
  }

  LOG_DEBUG("[Stream {}] Finished (no more entries)", stream_id);
}

EntryResult BatchProcessor::process_entry(const PlannedEntry &entry) {
  EntryResult result;
  const fs::path &source = entry.source;

  // 1. Existing output wins unless overwriting
  if (!options_.overwrite && existing_.contains(entry.base_name)) {
    result.outcome = Outcome::Skipped;
    return result;
  }

  if (!entry.conflicts_with.empty()) {
    throw OutputConflictError(
        fmt::format("{}: output '{}' already claimed by {}",
                    source.string(), entry.output_name,
                    entry.conflicts_with.filename().string()),
        source);
  }

  const fs::path output_base = output_dir_ / entry.base_name;

  switch (entry.probe.kind) {
  case Kind::Archive:
    if (options_.dry_run) {
      check_archive(entry);
      result.output = output_base;
    } else {
      TIMER_START(archive_merge);
      result.output = with_unpacked(source, [&](const fs::path &scratch) {
        return merge_pair(scratch, entry);
      });
      TIMER_END(archive_merge);
    }
    result.outcome = Outcome::Merged;
    return result;

  case Kind::Directory: {
    TIMER_START(directory_merge);
    result.output = merge_pair(source, entry);
    TIMER_END(directory_merge);
    result.outcome = Outcome::Merged;
    return result;
  }

  case Kind::Video:
    result.output = output_dir_ / source.filename();
    if (!options_.dry_run) {
      TIMER_START(copy);
      copy_file_atomically(source, result.output);
      TIMER_END(copy);
    }
    result.outcome = Outcome::Copied;
    return result;

  case Kind::Image:
    result.output = copy_image(entry);
    result.outcome = Outcome::Copied;
    return result;

  default:
    throw UnsupportedEntryError(
        fmt::format("{}: unsupported entry (not an image, video, archive or "
                    "directory)",
                    source.string()),
        source);
  }
}

fs::path BatchProcessor::copy_image(const PlannedEntry &entry) {
  const fs::path &source = entry.source;
  const ImageFormat format =
      entry.probe.image_format ? *entry.probe.image_format : image_format(source);

  fs::path output = output_dir_ / image_copy_name(source, format);

  if (!options_.dry_run) {
    TIMER_START(copy);
    copy_file_atomically(source, output);
    TIMER_END(copy);
  }
  return output;
}

fs::path BatchProcessor::merge_pair(const fs::path &dir,
                                    const PlannedEntry &entry) {
  Pair pair = resolve_pair(dir);
  LOG_DEBUG("Pair in {}: media={}, overlay={}", entry.source.filename().string(),
            pair.media.filename().string(), pair.overlay.filename().string());

  const std::string name = merged_output_name(entry.base_name, pair.media);
  claim_output(name, entry.source);
  if (options_.dry_run) {
    return output_dir_ / name;
  }
  return combine(pair.media, pair.overlay, output_dir_ / entry.base_name);
}

void BatchProcessor::claim_output(const std::string &name,
                                  const fs::path &source) {
  std::lock_guard<std::mutex> lock(claim_mutex_);
  auto inserted = claimed_.emplace(to_lower(name), source);
  if (!inserted.second && inserted.first->second != source) {
    throw OutputConflictError(
        fmt::format("{}: output '{}' already claimed by {}", source.string(),
                    name, inserted.first->second.filename().string()),
        source);
  }
}

void BatchProcessor::check_archive(const PlannedEntry &entry) {
  validate_archive(entry.source);
  std::vector<std::string> members = list_archive_members(entry.source);
  if (members.size() != ARCHIVE_ENTRY_COUNT) {
    throw InvalidArchiveError(
        fmt::format("{}: expected exactly {} top-level entries, found {}",
                    entry.source.string(), ARCHIVE_ENTRY_COUNT,
                    members.size()),
        entry.source);
  }
  check_pair_names(members, entry.source);
}

void BatchProcessor::print_batch_summary(const BatchReport &report) const {
  long total_time_us = 0;
  for (const auto &result : report.results) {
    total_time_us += result.processing_time_us;
  }
  const std::size_t failed = report.count(Outcome::Failed);

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== BATCH PROCESSING SUMMARY ==============\n");
  fmt::print("{:<25} {:>25}\n", "Total entries:",
             report.results.size() + report.not_started);
  fmt::print("{:<25} {:>25}\n", "Merged:", report.count(Outcome::Merged));
  fmt::print("{:<25} {:>25}\n", "Copied:", report.count(Outcome::Copied));
  fmt::print("{:<25} {:>25}\n", "Skipped:", report.count(Outcome::Skipped));
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  if (report.not_started > 0) {
    fmt::print("{:<25} {:>25}\n", "Not started:", report.not_started);
  }
  fmt::print("{:<25} {:>25}\n", "Parallel streams:", num_streams_);
  fmt::print("{:<25} {:>25}\n", "Wall-clock time:",
             format_time(report.wall_clock_sec));
  fmt::print("{:<25} {:>22.1f}s\n", "Sum of entry times:",
             total_time_us / 1000000.0);
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");
  std::fflush(stdout);

  /// List failed entries if any
  if (failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed entries:\n");
    for (const auto &result : report.results) {
      if (result.outcome == Outcome::Failed) {
        fmt::print(fg(fmt::color::red), "  - {} [{}] {}\n",
                   result.source.filename().string(), result.error_kind,
                   result.reason);
      }
    }
    std::fflush(stdout);
  }
}

} // namespace snapmerge
