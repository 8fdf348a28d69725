#include "classifier.h"

#include "trace.h"
#include "util.h"

#include <algorithm>

namespace luapack {

namespace fs = std::filesystem;

namespace {

bool file_blacklisted(std::string const &basename, std::vector<std::string> const &globs) {
  return std::any_of(globs.begin(), globs.end(), [&](std::string const &glob) {
    return util_glob_match(glob, basename);
  });
}

}  // namespace

std::optional<classification> classify(fs::path const &path,
                                       unit_index const &index,
                                       std::set<std::string> const &builtins,
                                       classifier_cfg const &cfg) {
  std::string const basename{ path.filename().string() };
  if (file_blacklisted(basename, cfg.file_blacklist)) {
    LUAPACK_TRACE_FILE_EXCLUDED(path.string(), "file_blacklist");
    return std::nullopt;
  }

  unit const *const owner{ index.owner_of(path) };
  if (!owner) {
    classification result{ .unit = std::nullopt, .destination = cfg.catch_all / basename };
    LUAPACK_TRACE_FILE_CLASSIFIED(path.string(), "", result.destination.string());
    return result;
  }

  if (builtins.contains(owner->name)) {
    LUAPACK_TRACE_FILE_EXCLUDED(path.string(), "builtin");
    return std::nullopt;
  }

  auto const &blacklist{ cfg.unit_blacklist };
  if (std::find(blacklist.begin(), blacklist.end(), owner->name) != blacklist.end()) {
    LUAPACK_TRACE_FILE_EXCLUDED(path.string(), "unit_blacklist");
    return std::nullopt;
  }

  // Keep the unit's own directory (or file) name as the top-level entry.
  fs::path const base{ owner->root.parent_path() };
  classification result{ .unit = owner->name,
                         .destination = path.lexically_normal().lexically_relative(base) };
  LUAPACK_TRACE_FILE_CLASSIFIED(path.string(), owner->name, result.destination.string());
  return result;
}

}  // namespace luapack
