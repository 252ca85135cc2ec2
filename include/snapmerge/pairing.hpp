/**
 * @file pairing.hpp
 * @brief Media + overlay pairing inside a folder or unpacked archive
 *
 * @details Roles are assigned by combining a case-insensitive name
 *          substring ("main" / "overlay") with the classifier's verdict.
 *          Missing or ambiguous pairs are rejected, never guessed.
 */

#ifndef SNAPMERGE_PAIRING_HPP
#define SNAPMERGE_PAIRING_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "types.hpp"

namespace snapmerge {

enum class Role { Media, Overlay };

/// Name marker for a role: "main" or "overlay"
const char *role_marker(Role role);

/**
 * @brief Whether a file name contains the role's marker (case-insensitive).
 */
bool name_matches_role(const std::string &filename, Role role);

/**
 * @brief Resolve the media and overlay among the direct children of dir.
 *
 * @note Overlay: name contains "overlay" and classifies as Image.
 *       Media: name contains "main" and classifies as Image or Video.
 * @throws NotFoundError if dir does not exist or is not a directory
 * @throws PairingError if either role has zero or several candidates
 */
Pair resolve_pair(const std::filesystem::path &dir);

/**
 * @brief Name-only pairing check for a listing that cannot be probed
 *        (archive members during a dry run).
 * @param names Member file names
 * @param source Archive the names came from, for error messages
 * @throws PairingError if either role has zero or several name matches
 */
void check_pair_names(const std::vector<std::string> &names,
                      const std::filesystem::path &source);

} // namespace snapmerge

#endif // SNAPMERGE_PAIRING_HPP
