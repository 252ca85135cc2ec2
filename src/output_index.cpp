/**
 * @file output_index.cpp
 * @brief Output existence checks implementation
 */

#include "snapmerge/output_index.hpp"

#include "snapmerge/system.hpp"

namespace snapmerge {

namespace fs = std::filesystem;

OutputIndex OutputIndex::snapshot(const fs::path &dir) {
  OutputIndex index;
  std::error_code ec;
  if (!fs::is_directory(dir, ec))
    return index;

  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    index.stems_.insert(to_lower(entry.path().stem().string()));
  }
  return index;
}

bool OutputIndex::contains(const std::string &base_name) const {
  return stems_.count(to_lower(base_name)) > 0;
}

bool exists_in(const std::string &base_name, const fs::path &destination_dir) {
  return OutputIndex::snapshot(destination_dir).contains(base_name);
}

} // namespace snapmerge
