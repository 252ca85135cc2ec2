/**
 * @file batch_processor.hpp
 * @brief Parallel batch routing of an export directory's top-level entries
 *
 * @details The BatchProcessor class orchestrates one run over a source
 *          directory:
 *
 *          - Lists top-level entries in sorted order and classifies each
 *
 *          - Takes one OutputIndex snapshot of the destination up front
 *
 *          - Spawns PARALLEL_STREAMS worker threads that pull entries from a
 *            shared queue and route them (skip, copy or merge)
 *
 *          - Collects one EntryResult per entry and prints a summary table
 *
 * @note Configuration via environment variables:
 *
 *       - PARALLEL_STREAMS: Number of concurrent workers (0 = auto)
 *
 *       - FAIL_FAST: Stop starting new entries after the first failure
 *
 * @attention A failing entry never unwinds the batch. It is recorded as
 *            Outcome::Failed with the error's kind and message, and the
 *            remaining entries continue unless fail-fast is enabled.
 */

#ifndef SNAPMERGE_BATCH_PROCESSOR_HPP
#define SNAPMERGE_BATCH_PROCESSOR_HPP

#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

#include "config.hpp"
#include "media_probe.hpp"
#include "output_index.hpp"
#include "types.hpp"

namespace snapmerge {

/// Terminal state of one entry
enum class Outcome { Skipped, Copied, Merged, Failed };

const char *outcome_name(Outcome outcome);

/**
 * @struct EntryResult
 * @brief Result from processing a single top-level entry.
 */
struct EntryResult {
  std::filesystem::path source;     //< Input entry
  Kind kind = Kind::Unsupported;    //< Classifier verdict
  Outcome outcome = Outcome::Failed;
  std::filesystem::path output;     //< Written (or planned) output, if any
  std::string error_kind;           //< Error::kind() when Failed
  std::string reason;               //< Error message when Failed
  long processing_time_us = 0;      //< Processing time in microseconds
};

/**
 * @struct BatchOptions
 * @brief Per-run switches; defaults come from the environment.
 */
struct BatchOptions {
  bool overwrite = false;
  bool dry_run = false;
  bool fail_fast = Config::fail_fast();
  int num_streams = Config::parallel_streams(); //< 0 = auto-detect
};

/**
 * @struct BatchReport
 * @brief Results of one run, in sorted entry order.
 */
struct BatchReport {
  std::vector<EntryResult> results;
  std::size_t not_started = 0; //< Entries left untouched by fail-fast
  double wall_clock_sec = 0;

  std::size_t count(Outcome outcome) const;

  /// True when nothing failed and nothing was left unstarted
  bool ok() const { return count(Outcome::Failed) == 0 && not_started == 0; }
};

/**
 * @brief Stem of the output an entry will produce.
 *
 * @note archive: name minus archive suffix; directory: its name; video: file
 *       stem; image: stem if the extension matches the decoded format,
 *       otherwise the full file name (the copy appends an extension).
 *       Unsupported entries use the file stem.
 */
std::string entry_base_name(const std::filesystem::path &path,
                            const EntryProbe &probe);

/**
 * @class BatchProcessor
 * @brief Routes every top-level entry of an input directory to its output.
 */
class BatchProcessor {
public:
  explicit BatchProcessor(BatchOptions options = {});

  /**
   * @brief Process all top-level entries of input_dir into output_dir.
   *
   * @param input_dir Export directory to read
   * @param output_dir Destination, created with parents unless dry-run
   * @return One result per started entry
   * @throws NotFoundError if input_dir is missing or not a directory
   */
  BatchReport process(const std::filesystem::path &input_dir,
                      const std::filesystem::path &output_dir);

private:
  /**
   * @struct PlannedEntry
   * @brief Entry after classification, before any work.
   */
  struct PlannedEntry {
    std::filesystem::path source;
    EntryProbe probe;
    std::string base_name;
    std::string output_name;              //< Empty until known
    std::filesystem::path conflicts_with; //< Earlier entry claiming the name
  };

  BatchOptions options_;
  int num_streams_;

  std::mutex queue_mutex_;           //< Protects work queue
  std::queue<std::size_t> work_queue_; //< Indices into plan_
  std::atomic<int> entries_done_{0};
  std::atomic<bool> stop_{false};    //< Set by fail-fast

  std::filesystem::path output_dir_;
  OutputIndex existing_;
  std::vector<PlannedEntry> plan_;
  std::vector<EntryResult> slots_;   //< One per plan_ entry
  std::vector<char> started_;        //< Written by the owning worker only

  std::mutex claim_mutex_;           //< Protects claimed_
  /// Lowercase output file name -> entry writing it
  std::map<std::string, std::filesystem::path> claimed_;

  /**
   * @brief Get next entry index from the work queue.
   * @return false once the queue is empty
   */
  bool get_next_entry(std::size_t &index);

  /// Worker loop for one stream thread
  void stream_worker(int stream_id);

  /**
   * @brief Apply the routing rules to one entry.
   * @throws Error subclasses for any failure; caught by stream_worker
   */
  EntryResult process_entry(const PlannedEntry &entry);

  /// Copy an image, restoring its extension when missing
  std::filesystem::path copy_image(const PlannedEntry &entry);

  /// Resolve a pair in dir and composite it under the entry's base name
  std::filesystem::path merge_pair(const std::filesystem::path &dir,
                                   const PlannedEntry &entry);

  /**
   * @brief Reserve an output file name for an entry.
   * @throws OutputConflictError if another entry already holds it
   */
  void claim_output(const std::string &name,
                    const std::filesystem::path &source);

  /// Dry-run checks of an archive without extracting it
  void check_archive(const PlannedEntry &entry);

  /**
   * @brief Print final batch summary.
   */
  void print_batch_summary(const BatchReport &report) const;
};

} // namespace snapmerge

#endif // SNAPMERGE_BATCH_PROCESSOR_HPP
