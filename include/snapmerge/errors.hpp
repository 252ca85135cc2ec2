/**
 * @file errors.hpp
 * @brief Exception hierarchy for the classification-and-merge pipeline
 *
 * @details Every error carries the offending path so the batch report can
 *          name it. Library status codes (FFmpeg, libarchive, child process
 *          exit status) are translated into these types at module boundaries.
 */

#ifndef SNAPMERGE_ERRORS_HPP
#define SNAPMERGE_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

namespace snapmerge {

/**
 * @class Error
 * @brief Base class for all pipeline errors.
 */
class Error : public std::runtime_error {
public:
  Error(const std::string &message, std::filesystem::path path)
      : std::runtime_error(message), path_(std::move(path)) {}

  /// Path the failure relates to (may be empty for pure argument errors)
  const std::filesystem::path &path() const noexcept { return path_; }

  /// Short taxonomy name used in reports, e.g. "PairingError"
  virtual const char *kind() const noexcept { return "Error"; }

private:
  std::filesystem::path path_;
};

#define SNAPMERGE_DEFINE_ERROR(Name)                                           \
  class Name : public Error {                                                  \
  public:                                                                      \
    using Error::Error;                                                        \
    const char *kind() const noexcept override { return #Name; }               \
  }

/// Input path missing, or not the expected filesystem kind
SNAPMERGE_DEFINE_ERROR(NotFoundError);

/// Caller contract violation (e.g. output base carrying an extension)
SNAPMERGE_DEFINE_ERROR(InvalidArgumentError);

/// Zero or several candidates for the media or overlay role
SNAPMERGE_DEFINE_ERROR(PairingError);

/// Missing, empty, unreadable or wrongly shaped archive
SNAPMERGE_DEFINE_ERROR(InvalidArchiveError);

/// Media that is neither a decodable image nor a video
SNAPMERGE_DEFINE_ERROR(UnsupportedMediaError);

/// Top-level entry of a batch with no handling rule
SNAPMERGE_DEFINE_ERROR(UnsupportedEntryError);

/// Decode or encode failure reported by FFmpeg
SNAPMERGE_DEFINE_ERROR(CodecError);

/// Two entries of one batch would write the same output name
SNAPMERGE_DEFINE_ERROR(OutputConflictError);

#undef SNAPMERGE_DEFINE_ERROR

} // namespace snapmerge

#endif // SNAPMERGE_ERRORS_HPP
