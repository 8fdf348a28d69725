#include "unit_index.h"

#include "platform.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include "sol/sol.hpp"
#include "tbb/blocked_range.h"
#include "tbb/parallel_for.h"

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

namespace luapack {

namespace fs = std::filesystem;

namespace {

// Root paths are compared as strings; strip any trailing separator so "/a/pkg/" and
// "/a/pkg" key the same entry.
fs::path normalize_root(fs::path const &p) {
  auto result{ p.lexically_normal() };
  if (!result.has_filename() && result.has_relative_path()) {
    result = result.parent_path();
  }
  return result;
}

std::vector<fs::directory_entry> sorted_entries(fs::path const &dir) {
  std::vector<fs::directory_entry> entries;

  std::error_code ec;
  fs::directory_iterator it{ dir, fs::directory_options::skip_permission_denied, ec };
  fs::directory_iterator const end{};
  for (; !ec && it != end; it.increment(ec)) { entries.push_back(*it); }

  std::sort(entries.begin(), entries.end(), [](auto const &a, auto const &b) {
    return a.path().filename() < b.path().filename();
  });
  return entries;
}

bool is_module_name(std::string_view name) {
  return !name.empty() && name.find('.') == std::string_view::npos;
}

fs::path expand_location(fs::path const &location) {
  auto const str{ location.string() };
  if (!str.empty() && str.front() == '~') { return platform::expand_path(str); }
  return location;
}

}  // namespace

std::string_view resolution_error_kind_name(resolution_error_kind kind) {
  switch (kind) {
    case resolution_error_kind::UNRESOLVABLE: return "unresolvable";
    case resolution_error_kind::NAMESPACE_ONLY: return "namespace_only";
    case resolution_error_kind::UNSUPPORTED_LOADER: return "unsupported_loader";
  }
  return "unknown";
}

std::vector<unit_candidate> unit_index_enumerate(std::vector<std::string> const &templates) {
  std::vector<unit_candidate> candidates;
  std::unordered_set<std::string> seen;
  std::vector<unit_candidate> namespace_dirs;
  std::unordered_set<std::string> seen_templates;

  for (auto const &tmpl : templates) {
    if (!seen_templates.insert(tmpl).second) { continue; }

    auto const pos{ tmpl.find('?') };
    if (pos == std::string::npos || pos == 0) { continue; }
    if (tmpl.find('?', pos + 1) != std::string::npos) { continue; }

    std::string const prefix{ tmpl.substr(0, pos) };
    std::string const suffix{ tmpl.substr(pos + 1) };
    if (prefix.back() != '/') { continue; }

    fs::path const dir{ prefix };
    bool const wants_directory{ !suffix.empty() && suffix.front() == '/' };

    for (auto const &entry : sorted_entries(dir)) {
      std::error_code ec;
      std::string const filename{ entry.path().filename().string() };

      if (wants_directory) {
        if (!entry.is_directory(ec)) { continue; }
        if (!is_module_name(filename) || seen.contains(filename)) { continue; }

        fs::path const initializer{ prefix + filename + suffix };
        if (fs::exists(fs::symlink_status(initializer, ec))) {
          seen.insert(filename);
          candidates.push_back({ .name = filename, .location = initializer });
        } else {
          namespace_dirs.push_back({ .name = filename, .location = entry.path() });
        }
        continue;
      }

      if (suffix.empty() || filename.size() <= suffix.size()) { continue; }
      if (!filename.ends_with(suffix)) { continue; }
      if (!entry.is_symlink(ec) && !entry.is_regular_file(ec)) { continue; }

      std::string const name{ filename.substr(0, filename.size() - suffix.size()) };
      if (!is_module_name(name) || seen.contains(name)) { continue; }

      seen.insert(name);
      candidates.push_back({ .name = name, .location = entry.path() });
    }
  }

  for (auto &ns : namespace_dirs) {
    if (seen.insert(ns.name).second) { candidates.push_back(std::move(ns)); }
  }

  return candidates;
}

resolve_result_t unit_resolve(unit_candidate const &candidate) {
  auto const fail{ [&](resolution_error_kind kind, std::string detail) -> resolve_result_t {
    return resolution_error{ .name = candidate.name,
                             .location = candidate.location,
                             .kind = kind,
                             .detail = std::move(detail) };
  } };

  fs::path expanded;
  try {
    expanded = expand_location(candidate.location);
  } catch (std::runtime_error const &e) {
    return fail(resolution_error_kind::UNRESOLVABLE, e.what());
  }

  std::error_code ec;
  fs::path const real{ fs::canonical(fs::absolute(expanded, ec), ec) };
  if (ec) { return fail(resolution_error_kind::UNRESOLVABLE, ec.message()); }

  if (fs::is_directory(real, ec)) {
    return fail(resolution_error_kind::NAMESPACE_ONLY, "directory has no initializer");
  }

  if (real.filename() == "init.lua") {
    return unit{ .name = candidate.name, .root = real.parent_path() };
  }

  auto const ext{ real.extension() };
  if (ext == ".lua" || ext == ".so") { return unit{ .name = candidate.name, .root = real }; }

  return fail(resolution_error_kind::UNSUPPORTED_LOADER,
              "not a loadable file: " + real.filename().string());
}

std::vector<std::string> unit_index_search_templates(lua_State *L) {
  if (!L) { throw std::invalid_argument("unit_index_search_templates: null Lua state"); }

  sol::state_view lua{ L };
  sol::table package{ lua["package"] };

  std::vector<std::string> templates;
  for (char const *key : { "path", "cpath" }) {
    auto const value{ package[key].get_or<std::string>("") };
    for (auto &tmpl : util_split(value, ';')) { templates.push_back(std::move(tmpl)); }
  }
  return templates;
}

unit_index unit_index::build(std::vector<std::string> const &templates) {
  auto const candidates{ unit_index_enumerate(templates) };

  std::vector<resolve_result_t> results(candidates.size());
  tbb::parallel_for(tbb::blocked_range<std::size_t>{ 0, candidates.size() },
                    [&](tbb::blocked_range<std::size_t> const &range) {
                      for (std::size_t i{ range.begin() }; i != range.end(); ++i) {
                        results[i] = unit_resolve(candidates[i]);
                      }
                    });

  return from_results(results);
}

unit_index unit_index::from_results(std::vector<resolve_result_t> const &results) {
  unit_index index;

  for (auto const &result : results) {
    std::visit(match{
                   [&](unit const &u) {
                     LUAPACK_TRACE_UNIT_RESOLVED(u.name, u.root.string());
                     index.add(u);
                   },
                   [](resolution_error const &err) {
                     auto const reason{ resolution_error_kind_name(err.kind) };
                     tui::debug("skipping unit %s (%s): %s",
                                err.name.c_str(),
                                std::string{ reason }.c_str(),
                                err.detail.c_str());
                     LUAPACK_TRACE_UNIT_SKIPPED(err.name,
                                                err.location.string(),
                                                std::string{ reason });
                   },
               },
               result);
  }

  tui::debug("unit index holds %zu units", index.size());
  return index;
}

unit_index unit_index::from_units(std::vector<unit> const &units) {
  unit_index index;
  for (auto const &u : units) { index.add(u); }
  return index;
}

void unit_index::add(unit u) {
  u.root = normalize_root(u.root);
  if (units_.contains(u.name)) {
    throw std::runtime_error("duplicate unit name in index: " + u.name);
  }

  std::pair<std::string, std::string> key{ u.root.string(), u.name };
  roots_.insert(std::upper_bound(roots_.begin(), roots_.end(), key), key);
  units_.emplace(u.name, std::move(u));
}

unit const *unit_index::find(std::string_view name) const {
  auto const it{ units_.find(std::string{ name }) };
  return it == units_.end() ? nullptr : &it->second;
}

unit const *unit_index::owner_of(std::filesystem::path const &path) const {
  if (roots_.empty() || path.empty()) { return nullptr; }

  fs::path candidate{ normalize_root(path) };
  for (;;) {
    std::string const key{ candidate.string() };
    auto const it{ std::lower_bound(roots_.begin(),
                                    roots_.end(),
                                    key,
                                    [](auto const &entry, std::string const &k) {
                                      return entry.first < k;
                                    }) };
    if (it != roots_.end() && it->first == key) { return &units_.at(it->second); }

    if (!candidate.has_relative_path()) { return nullptr; }
    candidate = candidate.parent_path();
  }
}

std::set<std::string> unit_index_builtin_set(unit_index const &index,
                                             std::string_view reference,
                                             std::string_view site_dir) {
  std::set<std::string> builtins;
  if (reference.empty()) { return builtins; }

  unit const *const ref{ index.find(reference) };
  if (!ref) {
    throw std::runtime_error("built-in reference unit '" + std::string{ reference } +
                             "' is not in the unit index; cannot separate built-in "
                             "units from third-party units");
  }

  fs::path const base_root{ ref->root.parent_path() };
  fs::path const site_root{ normalize_root(base_root / fs::path{ site_dir }) };

  for (auto const &[name, u] : index.units()) {
    if (util_path_is_within(u.root, base_root) && !util_path_is_within(u.root, site_root)) {
      builtins.insert(name);
    }
  }

  LUAPACK_TRACE_BUILTIN_SET_COMPUTED(std::string{ reference },
                                     base_root.string(),
                                     static_cast<std::int64_t>(builtins.size()));
  tui::debug("built-in set: %zu units under %s", builtins.size(), base_root.c_str());
  return builtins;
}

}  // namespace luapack
