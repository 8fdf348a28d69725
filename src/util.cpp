#include "util.h"

#include <fnmatch.h>

#include <array>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace luapack {

std::string util_format_bytes(std::uint64_t bytes) {
  static constexpr std::array<char const *, 5> kUnits{ "B", "KB", "MB", "GB", "TB" };

  double value{ static_cast<double>(bytes) };
  std::size_t unit{ 0 };

  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  if (unit == 0) { return std::to_string(static_cast<std::uint64_t>(value)) + "B"; }

  std::ostringstream oss;
  oss.setf(std::ios::fixed, std::ios::floatfield);
  oss << std::setprecision(2) << value << kUnits[unit];
  return oss.str();
}

bool util_glob_match(std::string_view pattern, std::string_view name) {
  std::string const pattern_str{ pattern };
  std::string const name_str{ name };
  return ::fnmatch(pattern_str.c_str(), name_str.c_str(), 0) == 0;
}

bool util_path_is_within(std::filesystem::path const &path,
                         std::filesystem::path const &root) {
  if (root.empty()) { return false; }

  auto p{ path.begin() };
  for (auto r{ root.begin() }; r != root.end(); ++r, ++p) {
    if (r->empty() && std::next(r) == root.end()) { return true; }  // trailing '/'
    if (p == path.end() || *p != *r) { return false; }
  }
  return true;
}

std::uint64_t util_path_size(std::filesystem::path const &path) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (fs::is_regular_file(path, ec)) {
    auto const size{ fs::file_size(path, ec) };
    return ec ? 0 : static_cast<std::uint64_t>(size);
  }

  if (!fs::is_directory(path, ec)) { return 0; }

  std::uint64_t total{ 0 };
  fs::recursive_directory_iterator it{ path,
                                       fs::directory_options::skip_permission_denied,
                                       ec };
  fs::recursive_directory_iterator const end{};
  for (; !ec && it != end; it.increment(ec)) {
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) { continue; }
    auto const size{ it->file_size(entry_ec) };
    if (!entry_ec) { total += static_cast<std::uint64_t>(size); }
  }
  return total;
}

std::vector<std::string> util_split(std::string_view s, char delim) {
  std::vector<std::string> result;
  while (!s.empty()) {
    auto const pos{ s.find(delim) };
    auto const token{ s.substr(0, pos) };
    if (!token.empty()) { result.emplace_back(token); }
    s = (pos == std::string_view::npos) ? std::string_view{} : s.substr(pos + 1);
  }
  return result;
}

scoped_path_cleanup::scoped_path_cleanup(std::filesystem::path path)
    : path_{ std::move(path) } {}

scoped_path_cleanup::~scoped_path_cleanup() { cleanup(); }

void scoped_path_cleanup::reset(std::filesystem::path path) {
  cleanup();
  path_ = std::move(path);
}

void scoped_path_cleanup::cleanup() {
  if (path_.empty()) { return; }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  path_.clear();
}

}  // namespace luapack
