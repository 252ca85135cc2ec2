/**
 * @file pairing.cpp
 * @brief Media + overlay pairing implementation
 */

#include "snapmerge/pairing.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "snapmerge/errors.hpp"
#include "snapmerge/logging.hpp"
#include "snapmerge/media_probe.hpp"
#include "snapmerge/system.hpp"

namespace snapmerge {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void throw_count_error(const fs::path &source, Role role,
                                    std::size_t found) {
  const char *what = role == Role::Overlay ? "overlay image" : "main media file";
  throw PairingError(
      fmt::format("{}: expected exactly one {} (name containing '{}'), "
                  "found {}",
                  source.string(), what, role_marker(role), found),
      source);
}

} // anonymous namespace

const char *role_marker(Role role) {
  return role == Role::Overlay ? "overlay" : "main";
}

bool name_matches_role(const std::string &filename, Role role) {
  return to_lower(filename).find(role_marker(role)) != std::string::npos;
}

Pair resolve_pair(const fs::path &dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw NotFoundError(
        fmt::format("{}: directory does not exist", dir.string()), dir);
  }

  std::vector<fs::path> media;
  std::vector<fs::path> overlays;

  for (const auto &entry : fs::directory_iterator(dir)) {
    const fs::path &path = entry.path();
    const std::string name = path.filename().string();
    const bool overlay_name = name_matches_role(name, Role::Overlay);
    const bool media_name = name_matches_role(name, Role::Media);
    if (!overlay_name && !media_name)
      continue;

    const Kind kind = classify(path);
    if (overlay_name && kind == Kind::Image) {
      overlays.push_back(path);
    }
    if (media_name && (kind == Kind::Image || kind == Kind::Video)) {
      media.push_back(path);
    }
    LOG_DEBUG("{}: {} ({})", dir.filename().string(), name, kind_name(kind));
  }

  if (overlays.size() != 1)
    throw_count_error(dir, Role::Overlay, overlays.size());
  if (media.size() != 1)
    throw_count_error(dir, Role::Media, media.size());

  return Pair{media.front(), overlays.front()};
}

void check_pair_names(const std::vector<std::string> &names,
                      const fs::path &source) {
  for (Role role : {Role::Overlay, Role::Media}) {
    auto found = static_cast<std::size_t>(
        std::count_if(names.begin(), names.end(), [role](const auto &n) {
          return name_matches_role(n, role);
        }));
    if (found != 1)
      throw_count_error(source, role, found);
  }
}

} // namespace snapmerge
