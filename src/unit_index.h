#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

struct lua_State;

namespace luapack {

// An independently installable Lua module: a directory with an init.lua, or a
// single .lua / native .so file.
struct unit {
  std::string name;
  std::filesystem::path root;  // absolute, canonical
};

enum class resolution_error_kind { UNRESOLVABLE, NAMESPACE_ONLY, UNSUPPORTED_LOADER };

std::string_view resolution_error_kind_name(resolution_error_kind kind);

struct resolution_error {
  std::string name;
  std::filesystem::path location;
  resolution_error_kind kind;
  std::string detail;
};

using resolve_result_t = std::variant<unit, resolution_error>;

// A top-level module name and the path its first matching search template points at.
struct unit_candidate {
  std::string name;
  std::filesystem::path location;
};

// Walk `?` search templates in order (package.path entries, then package.cpath
// entries) and list every top-level module they expose. The first template providing
// a name wins. Directories lacking the template's initializer are listed last, only
// if no template provides that name.
std::vector<unit_candidate> unit_index_enumerate(std::vector<std::string> const &templates);

// Expand and canonicalize a candidate's location. Never throws.
resolve_result_t unit_resolve(unit_candidate const &candidate);

// The `?` templates of package.path followed by package.cpath of a live Lua state.
std::vector<std::string> unit_index_search_templates(lua_State *L);

class unit_index {
 public:
  using unit_map_t = std::map<std::string, unit>;

  unit_index() = default;

  // Enumerate and resolve every candidate (resolution runs in parallel), then keep
  // the successes. Failures are logged and skipped.
  static unit_index build(std::vector<std::string> const &templates);

  // Filtering pass over explicit per-candidate results.
  static unit_index from_results(std::vector<resolve_result_t> const &results);

  static unit_index from_units(std::vector<unit> const &units);

  unit const *find(std::string_view name) const;

  // Unit whose root is the longest whole-component prefix of `path`, or nullptr.
  // Equal roots resolve to the lexicographically smallest name.
  unit const *owner_of(std::filesystem::path const &path) const;

  unit_map_t const &units() const { return units_; }
  std::size_t size() const { return units_.size(); }
  bool empty() const { return units_.empty(); }

 private:
  void add(unit u);

  unit_map_t units_;
  std::vector<std::pair<std::string, std::string>> roots_;  // sorted (root, name)
};

// Units under the reference unit's parent directory but outside `site_dir` beneath
// it. Empty when `reference` is empty. Throws if the reference unit is not indexed.
std::set<std::string> unit_index_builtin_set(unit_index const &index,
                                             std::string_view reference,
                                             std::string_view site_dir);

}  // namespace luapack
