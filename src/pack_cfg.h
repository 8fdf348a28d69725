#pragma once

#include "classifier.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace luapack {

// Construction-time configuration of a runner, read from luapack.lua globals.
struct pack_cfg {
  std::vector<std::string> unit_blacklist;
  std::vector<std::string> file_blacklist;
  std::string builtin_reference;
  std::string site_dir{ "site" };
  std::string catch_all{ "lib" };
  std::string output{ "~/luapack_build" };
  std::optional<std::filesystem::path> source;  // config file, if one was read

  // Walk up from `start` looking for luapack.lua; stops at a .git directory or the root.
  static std::optional<std::filesystem::path> discover(
      std::filesystem::path start = std::filesystem::current_path());

  static pack_cfg load(std::filesystem::path const &path);
  static pack_cfg load(char const *script, std::filesystem::path const &path);

  // Explicit path (must exist), else a discovered file, else defaults.
  static pack_cfg resolve(std::optional<std::filesystem::path> const &explicit_path);

  classifier_cfg classifier() const;
};

// Command-line adjustments: scalars replace, lists append.
struct pack_overrides {
  std::optional<std::string> output;
  std::vector<std::string> exclude_units;
  std::vector<std::string> exclude_files;
};

void pack_cfg_apply(pack_cfg &cfg, pack_overrides const &overrides);

}  // namespace luapack
