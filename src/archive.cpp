/**
 * @file archive.cpp
 * @brief Archive validation, listing and scoped extraction implementation
 *
 * @details libarchive reads zip and (optionally gzip-compressed) tar input;
 *          archive_write_disk materializes members below the scratch
 *          directory with its secure-extraction flags enabled.
 */

#include "snapmerge/archive.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <archive.h>
#include <archive_entry.h>

#include <fmt/core.h>

#include "snapmerge/logging.hpp"
#include "snapmerge/system.hpp"

namespace snapmerge {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// Suffixes are checked in order, so ".tar.gz" wins over ".tar"
const char *const ARCHIVE_SUFFIXES[] = {".tar.gz", ".tgz", ".tar", ".zip"};

constexpr size_t READ_BLOCK_SIZE = 64 * 1024;

struct ReadArchiveDeleter {
  void operator()(struct archive *a) const { archive_read_free(a); }
};
struct WriteArchiveDeleter {
  void operator()(struct archive *a) const { archive_write_free(a); }
};
using ReadArchive = std::unique_ptr<struct archive, ReadArchiveDeleter>;
using WriteArchive = std::unique_ptr<struct archive, WriteArchiveDeleter>;

/// libarchive may return NULL when no error message was recorded
const char *error_text(struct archive *a) {
  const char *msg = archive_error_string(a);
  return msg ? msg : "unknown libarchive error";
}

const char *matching_suffix(const fs::path &path) {
  std::string name = to_lower(path.filename().string());
  for (const char *suffix : ARCHIVE_SUFFIXES) {
    size_t len = std::strlen(suffix);
    if (name.size() > len &&
        name.compare(name.size() - len, len, suffix) == 0) {
      return suffix;
    }
  }
  return nullptr;
}

/// Open an archive for reading with the supported formats and filters
ReadArchive open_for_reading(const fs::path &archive_path) {
  ReadArchive a(archive_read_new());
  if (!a) {
    throw InvalidArchiveError(
        fmt::format("{}: cannot allocate archive reader", archive_path.string()),
        archive_path);
  }
  archive_read_support_format_zip(a.get());
  archive_read_support_format_tar(a.get());
  archive_read_support_filter_gzip(a.get());

  if (archive_read_open_filename(a.get(), archive_path.c_str(),
                                 READ_BLOCK_SIZE) != ARCHIVE_OK) {
    throw InvalidArchiveError(fmt::format("{}: cannot open archive: {}",
                                          archive_path.string(),
                                          error_text(a.get())),
                              archive_path);
  }
  return a;
}

/// First path component with any leading "./" removed ("" for "./")
std::string top_level_component(std::string name) {
  while (name.rfind("./", 0) == 0) {
    name.erase(0, 2);
  }
  auto slash = name.find('/');
  return slash == std::string::npos ? name : name.substr(0, slash);
}

/// Relative member path that stays inside the destination
bool is_safe_member_path(const std::string &name) {
  fs::path p(name);
  if (p.is_absolute())
    return false;
  for (const auto &part : p) {
    if (part == "..")
      return false;
  }
  return true;
}

void copy_entry_data(struct archive *in, struct archive *out,
                     const fs::path &archive_path) {
  const void *buff = nullptr;
  size_t size = 0;
  la_int64_t offset = 0;

  for (;;) {
    int r = archive_read_data_block(in, &buff, &size, &offset);
    if (r == ARCHIVE_EOF)
      return;
    if (r < ARCHIVE_OK) {
      throw InvalidArchiveError(fmt::format("{}: corrupt member data: {}",
                                            archive_path.string(),
                                            error_text(in)),
                                archive_path);
    }
    if (archive_write_data_block(out, buff, size, offset) < ARCHIVE_OK) {
      throw InvalidArchiveError(fmt::format("{}: cannot write member: {}",
                                            archive_path.string(),
                                            error_text(out)),
                                archive_path);
    }
  }
}

} // anonymous namespace

// **---- Archive Identity ----**

bool is_archive_path(const fs::path &path) {
  return matching_suffix(path) != nullptr;
}

std::string archive_base_name(const fs::path &path) {
  std::string name = path.filename().string();
  const char *suffix = matching_suffix(path);
  if (!suffix)
    return name;
  return name.substr(0, name.size() - std::strlen(suffix));
}

// **---- ScratchDirectory ----**

ScratchDirectory::ScratchDirectory(const fs::path &parent) {
  std::error_code ec;
  fs::create_directories(parent, ec);

  std::string tmpl = (parent / "snapmerge-XXXXXX").string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');

  if (!mkdtemp(buf.data())) {
    throw Error(fmt::format("cannot create scratch directory under {}: {}",
                            parent.string(), std::strerror(errno)),
                parent);
  }
  path_ = buf.data();
  LOG_DEBUG("Created scratch directory {}", path_.string());
}

ScratchDirectory::~ScratchDirectory() {
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    LOG_WARN("Failed to remove scratch directory {}: {}", path_.string(),
             ec.message());
  } else {
    LOG_DEBUG("Removed scratch directory {}", path_.string());
  }
}

// **---- Operations ----**

void validate_archive(const fs::path &archive_path) {
  std::error_code ec;
  if (!fs::exists(archive_path, ec)) {
    throw InvalidArchiveError(
        fmt::format("{}: archive does not exist", archive_path.string()),
        archive_path);
  }
  if (!fs::is_regular_file(archive_path, ec)) {
    throw InvalidArchiveError(
        fmt::format("{}: archive is not a regular file", archive_path.string()),
        archive_path);
  }
  if (!is_archive_path(archive_path)) {
    throw InvalidArchiveError(
        fmt::format("{}: unsupported archive format (expected .zip, .tar, "
                    ".tar.gz or .tgz)",
                    archive_path.string()),
        archive_path);
  }
  auto size = fs::file_size(archive_path, ec);
  if (ec || size == 0) {
    throw InvalidArchiveError(
        fmt::format("{}: archive is empty", archive_path.string()),
        archive_path);
  }
}

std::vector<std::string> list_archive_members(const fs::path &archive_path) {
  ReadArchive a = open_for_reading(archive_path);

  std::vector<std::string> members;
  struct archive_entry *entry = nullptr;
  int r;
  while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
    const char *raw = archive_entry_pathname(entry);
    std::string top = top_level_component(raw ? raw : "");
    if (!top.empty() &&
        std::find(members.begin(), members.end(), top) == members.end()) {
      members.push_back(top);
    }
    archive_read_data_skip(a.get());
  }
  if (r != ARCHIVE_EOF) {
    throw InvalidArchiveError(fmt::format("{}: cannot read archive: {}",
                                          archive_path.string(),
                                          error_text(a.get())),
                              archive_path);
  }
  return members;
}

void extract_archive(const fs::path &archive_path, const fs::path &destination) {
  TIMER_START(extract_archive);

  ReadArchive in = open_for_reading(archive_path);
  WriteArchive out(archive_write_disk_new());
  if (!out) {
    throw InvalidArchiveError(
        fmt::format("{}: cannot allocate disk writer", archive_path.string()),
        archive_path);
  }
  /// Member names are checked and rewritten to absolute paths below the
  /// destination, so NOABSOLUTEPATHS cannot be used here
  archive_write_disk_set_options(out.get(),
                                 ARCHIVE_EXTRACT_TIME |
                                     ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                     ARCHIVE_EXTRACT_SECURE_SYMLINKS);
  archive_write_disk_set_standard_lookup(out.get());

  struct archive_entry *entry = nullptr;
  int r;
  int count = 0;
  while ((r = archive_read_next_header(in.get(), &entry)) == ARCHIVE_OK) {
    const char *raw = archive_entry_pathname(entry);
    std::string name = raw ? raw : "";
    if (!is_safe_member_path(name)) {
      throw InvalidArchiveError(
          fmt::format("{}: member '{}' escapes the extraction directory",
                      archive_path.string(), name),
          archive_path);
    }

    /// Symlink targets resolve relative to the link, hardlink targets
    /// relative to the archive root; both must stay inside it
    const char *symlink = archive_entry_symlink(entry);
    if (archive_entry_filetype(entry) == AE_IFLNK || symlink) {
      std::string link = symlink ? symlink : "";
      if (link.empty() || !is_safe_member_path(link)) {
        throw InvalidArchiveError(
            fmt::format("{}: link '{}' -> '{}' escapes the extraction "
                        "directory",
                        archive_path.string(), name, link),
            archive_path);
      }
    }
    const char *hardlink = archive_entry_hardlink(entry);
    if (hardlink) {
      std::string link = hardlink;
      if (link.empty() || !is_safe_member_path(link)) {
        throw InvalidArchiveError(
            fmt::format("{}: link '{}' -> '{}' escapes the extraction "
                        "directory",
                        archive_path.string(), name, link),
            archive_path);
      }
      std::string linked = (destination / link).string();
      archive_entry_set_hardlink(entry, linked.c_str());
    }

    std::string target = (destination / name).string();
    archive_entry_set_pathname(entry, target.c_str());

    if (archive_write_header(out.get(), entry) < ARCHIVE_OK) {
      throw InvalidArchiveError(fmt::format("{}: cannot extract '{}': {}",
                                            archive_path.string(), name,
                                            error_text(out.get())),
                                archive_path);
    }
    /// Zip members written in streaming mode report no size up front
    copy_entry_data(in.get(), out.get(), archive_path);
    if (archive_write_finish_entry(out.get()) < ARCHIVE_OK) {
      throw InvalidArchiveError(fmt::format("{}: cannot finish '{}': {}",
                                            archive_path.string(), name,
                                            error_text(out.get())),
                                archive_path);
    }
    count++;
  }
  if (r != ARCHIVE_EOF) {
    throw InvalidArchiveError(fmt::format("{}: cannot read archive: {}",
                                          archive_path.string(),
                                          error_text(in.get())),
                              archive_path);
  }
  archive_write_close(out.get());

  TIMER_END(extract_archive);
  LOG_DEBUG("Extracted {} members of {} into {}", count,
            archive_path.filename().string(), destination.string());
}

} // namespace snapmerge
