#pragma once

#include "platform.h"

#include <filesystem>
#include <set>
#include <string_view>

namespace luapack {

using path_set_t = std::set<std::filesystem::path>;

// Regular files the process holds open (fd table) or has mapped from disk. Any failure
// to read or parse the process tables yields an empty set and a warning; `label`
// names the snapshot in logs and trace events.
path_set_t open_handles_snapshot(platform::process_id pid,
                                 std::string_view label,
                                 std::filesystem::path const &proc_root = "/proc");

// Entries of `after` not present in `before`.
path_set_t open_handles_diff(path_set_t const &before, path_set_t const &after);

}  // namespace luapack
