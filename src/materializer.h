#pragma once

#include "classifier.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace luapack {

enum touch_origin : unsigned { TOUCH_EXECUTED = 1u << 0, TOUCH_OPENED = 1u << 1 };

struct touched_file {
  std::filesystem::path path;  // canonical
  unsigned origin;             // touch_origin bits
};

struct bundle_entry {
  std::filesystem::path source;       // canonical
  std::filesystem::path destination;  // relative to the bundle root
  std::optional<std::string> unit;    // nullopt for catch-all files
};

using classify_fn_t =
    std::function<std::optional<classification>(std::filesystem::path const &)>;

// Union executed files and opened files into one record per canonical path. Broken
// links and anything that is neither a regular file nor a directory are dropped.
std::vector<touched_file> materializer_collect(
    std::vector<std::filesystem::path> const &executed,
    std::set<std::filesystem::path> const &opened);

// Classify every touched file and keep the retained ones, dropping files that already
// lie under a retained directory entry. Sorted by destination.
std::vector<bundle_entry> materializer_build_list(std::vector<touched_file> const &touched,
                                                  classify_fn_t const &classify_fn);

// Throws if two distinct sources map to the same destination.
void materializer_check_collisions(std::vector<bundle_entry> const &entries);

// Copy every entry beneath `output_root` ("~" and $VARS expanded). Existing destination
// files are never overwritten. Stops at the first failure.
void materialize(std::vector<bundle_entry> const &entries, std::string const &output_root);

}  // namespace luapack
