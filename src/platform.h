#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace luapack::platform {

using process_id = long;

process_id current_pid();

// Target of a symbolic link, or nullopt if `link` is not a readable symlink.
std::optional<std::filesystem::path> read_link(std::filesystem::path const &link);

// Expand a leading "~" or "~user" to the home directory; everything else is kept
// literally. Throws when the current user's home cannot be determined.
std::filesystem::path expand_path(std::string_view p);

bool is_tty();

}  // namespace luapack::platform
