/**
 * @file archive.hpp
 * @brief Archive validation, listing and scoped extraction
 *
 * @details Supported formats are identified by extension only (.zip, .tar,
 *          .tar.gz, .tgz); the content is not inspected until extraction.
 *          Extraction goes through libarchive into a private scratch
 *          directory that is removed on every exit path.
 *
 * @attention A memory archive is expected to hold exactly one media file and
 *            one overlay, so anything other than two top-level entries is
 *            rejected with InvalidArchiveError.
 */

#ifndef SNAPMERGE_ARCHIVE_HPP
#define SNAPMERGE_ARCHIVE_HPP

#include <filesystem>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "errors.hpp"

namespace snapmerge {

/// Number of top-level entries a memory archive must contain
constexpr std::size_t ARCHIVE_ENTRY_COUNT = 2;

// **---- Archive Identity ----**

/**
 * @brief Whether the file name ends in a supported archive suffix.
 * @note Case-insensitive; ".tar.gz" is matched before ".gz" alone.
 */
bool is_archive_path(const std::filesystem::path &path);

/**
 * @brief File name with its archive suffix removed ("a.tar.gz" -> "a").
 * @note Returns the file name unchanged if it is not an archive name.
 */
std::string archive_base_name(const std::filesystem::path &path);

// **---- Scratch Directory ----**

/**
 * @class ScratchDirectory
 * @brief Uniquely named temporary directory, deleted with its contents when
 *        the object goes out of scope.
 * @note Created with mkdtemp so concurrent extractions never share a path.
 */
class ScratchDirectory {
public:
  explicit ScratchDirectory(
      const std::filesystem::path &parent = Config::scratch_dir());
  ~ScratchDirectory();

  ScratchDirectory(const ScratchDirectory &) = delete;
  ScratchDirectory &operator=(const ScratchDirectory &) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

// **---- Operations ----**

/**
 * @brief Check that an archive exists, is non-empty and has a supported
 *        extension.
 * @throws InvalidArchiveError naming the violated precondition
 */
void validate_archive(const std::filesystem::path &archive_path);

/**
 * @brief List the distinct top-level member names without extracting.
 * @throws InvalidArchiveError if the archive cannot be read
 */
std::vector<std::string>
list_archive_members(const std::filesystem::path &archive_path);

/**
 * @brief Extract every member of an archive below a directory.
 * @throws InvalidArchiveError on read errors or members that would land
 *         outside the destination (absolute paths, "..")
 */
void extract_archive(const std::filesystem::path &archive_path,
                     const std::filesystem::path &destination);

/**
 * @brief Extract an archive into a private scratch directory, run a
 *        callback on it, and remove the directory afterwards.
 *
 * @param archive_path Archive to unpack
 * @param fn Callable taking the scratch directory path
 * @return Whatever fn returns
 * @throws InvalidArchiveError for invalid archives or a top-level entry
 *         count other than ARCHIVE_ENTRY_COUNT; anything fn throws
 */
template <typename Fn>
auto with_unpacked(const std::filesystem::path &archive_path, Fn &&fn)
    -> decltype(fn(std::declval<const std::filesystem::path &>())) {
  validate_archive(archive_path);

  ScratchDirectory scratch;
  extract_archive(archive_path, scratch.path());

  auto entries = static_cast<std::size_t>(
      std::distance(std::filesystem::directory_iterator(scratch.path()),
                    std::filesystem::directory_iterator{}));
  if (entries != ARCHIVE_ENTRY_COUNT) {
    throw InvalidArchiveError(
        archive_path.string() + ": expected exactly " +
            std::to_string(ARCHIVE_ENTRY_COUNT) +
            " top-level entries, found " + std::to_string(entries),
        archive_path);
  }

  return std::forward<Fn>(fn)(scratch.path());
}

} // namespace snapmerge

#endif // SNAPMERGE_ARCHIVE_HPP
