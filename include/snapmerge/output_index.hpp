/**
 * @file output_index.hpp
 * @brief Output existence checks for idempotent re-runs
 *
 * @details An output "exists" when the destination holds any file whose stem
 *          equals the entry's base name, ignoring case and extension. A merged
 *          "trip" therefore counts as done whether it was written as
 *          trip.png, trip.JPG or trip.mp4.
 */

#ifndef SNAPMERGE_OUTPUT_INDEX_HPP
#define SNAPMERGE_OUTPUT_INDEX_HPP

#include <filesystem>
#include <string>
#include <unordered_set>

namespace snapmerge {

/**
 * @class OutputIndex
 * @brief Immutable snapshot of the lowercase stems present in a directory.
 * @note Taken once per batch before any worker starts, so outputs written
 *       during the batch never change a skip decision.
 */
class OutputIndex {
public:
  OutputIndex() = default;

  /**
   * @brief Capture the stems of every direct child of a directory.
   * @note A missing directory yields an empty index.
   */
  static OutputIndex snapshot(const std::filesystem::path &dir);

  /// Whether base_name matches a captured stem (case-insensitive)
  bool contains(const std::string &base_name) const;

  std::size_t size() const { return stems_.size(); }

private:
  std::unordered_set<std::string> stems_;
};

/**
 * @brief One-off existence check against the current directory contents.
 * @param base_name Output name without extension
 * @param destination_dir Directory to search (direct children only)
 */
bool exists_in(const std::string &base_name,
               const std::filesystem::path &destination_dir);

} // namespace snapmerge

#endif // SNAPMERGE_OUTPUT_INDEX_HPP
