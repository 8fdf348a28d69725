#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace luapack {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Human-readable byte formatter (B, KB, MB, GB, TB). B uses integer form, higher
// units use two decimal places (e.g., 1536 -> "1.50KB").
std::string util_format_bytes(std::uint64_t bytes);

// Shell-style glob match of a single filename component ("*secret*", "*.so").
bool util_glob_match(std::string_view pattern, std::string_view name);

// True if `path` equals `root` or lies beneath it, comparing whole path components.
// Both paths are expected to be absolute and lexically normal.
bool util_path_is_within(std::filesystem::path const &path,
                         std::filesystem::path const &root);

// Size of a regular file, or the recursive sum of regular files under a directory.
// Unreadable entries count as zero.
std::uint64_t util_path_size(std::filesystem::path const &path);

// Split on a single character, dropping empty tokens.
std::vector<std::string> util_split(std::string_view s, char delim);

class scoped_path_cleanup : public unmovable {
 public:
  explicit scoped_path_cleanup(std::filesystem::path path);
  ~scoped_path_cleanup();

  void reset(std::filesystem::path path = {});
  std::filesystem::path const &path() const { return path_; }

 private:
  void cleanup();

  std::filesystem::path path_;
};

}  // namespace luapack
