#pragma once

#include "unit_index.h"

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace luapack {

struct classifier_cfg {
  std::vector<std::string> unit_blacklist;
  std::vector<std::string> file_blacklist;  // fnmatch globs over the basename
  std::filesystem::path catch_all{ "lib" };
};

struct classification {
  std::optional<std::string> unit;  // nullopt for catch-all files
  std::filesystem::path destination;  // relative to the bundle root
};

// Decide whether `path` (absolute, links resolved) belongs in the bundle and where.
// nullopt means excluded: blacklisted basename, built-in owner, or blacklisted owner.
// Files outside every unit land directly under the catch-all directory. Does not
// touch the filesystem.
std::optional<classification> classify(std::filesystem::path const &path,
                                       unit_index const &index,
                                       std::set<std::string> const &builtins,
                                       classifier_cfg const &cfg);

}  // namespace luapack
