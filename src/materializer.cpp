#include "materializer.h"

#include "platform.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace luapack {

namespace fs = std::filesystem;

namespace {

void add_touch(std::map<fs::path, unsigned> &touched, fs::path const &raw, unsigned origin) {
  std::error_code ec;
  fs::path const resolved{ fs::canonical(raw, ec) };
  if (ec) {
    tui::debug("dropping %s: %s", raw.c_str(), ec.message().c_str());
    LUAPACK_TRACE_FILE_DROPPED(raw.string(), ec.message());
    return;
  }

  auto const status{ fs::status(resolved, ec) };
  if (ec || !(fs::is_regular_file(status) || fs::is_directory(status))) {
    LUAPACK_TRACE_FILE_DROPPED(resolved.string(), "not a regular file or directory");
    return;
  }

  touched[resolved] |= origin;
}

}  // namespace

std::vector<touched_file> materializer_collect(std::vector<fs::path> const &executed,
                                               std::set<fs::path> const &opened) {
  std::map<fs::path, unsigned> touched;
  for (auto const &p : executed) { add_touch(touched, p, TOUCH_EXECUTED); }
  for (auto const &p : opened) { add_touch(touched, p, TOUCH_OPENED); }

  std::vector<touched_file> result;
  result.reserve(touched.size());
  for (auto const &[path, origin] : touched) {
    result.push_back({ .path = path, .origin = origin });
  }
  return result;
}

std::vector<bundle_entry> materializer_build_list(std::vector<touched_file> const &touched,
                                                  classify_fn_t const &classify_fn) {
  std::map<fs::path, bundle_entry> by_source;
  std::vector<fs::path> directories;

  for (auto const &t : touched) {
    if (by_source.contains(t.path)) { continue; }

    auto c{ classify_fn(t.path) };
    if (!c) { continue; }

    std::error_code ec;
    if (fs::is_directory(t.path, ec)) { directories.push_back(t.path); }

    by_source.emplace(t.path,
                      bundle_entry{ .source = t.path,
                                    .destination = std::move(c->destination),
                                    .unit = std::move(c->unit) });
  }

  std::vector<bundle_entry> result;
  result.reserve(by_source.size());
  for (auto &[source, entry] : by_source) {
    bool const covered{ std::any_of(directories.begin(),
                                    directories.end(),
                                    [&](fs::path const &dir) {
                                      return dir != source && util_path_is_within(source, dir);
                                    }) };
    if (!covered) { result.push_back(std::move(entry)); }
  }

  std::sort(result.begin(), result.end(), [](bundle_entry const &a, bundle_entry const &b) {
    return a.destination != b.destination ? a.destination < b.destination
                                          : a.source < b.source;
  });
  return result;
}

void materializer_check_collisions(std::vector<bundle_entry> const &entries) {
  std::map<fs::path, fs::path const *> owners;
  for (auto const &entry : entries) {
    auto const [it, inserted]{ owners.emplace(entry.destination, &entry.source) };
    if (!inserted && *it->second != entry.source) {
      throw std::runtime_error("destination collision at " + entry.destination.string() +
                               ": " + it->second->string() + " and " +
                               entry.source.string());
    }
  }
}

void materialize(std::vector<bundle_entry> const &entries, std::string const &output_root) {
  materializer_check_collisions(entries);

  fs::path const root{ platform::expand_path(output_root) };

  std::uint64_t total{ 0 };
  for (auto const &entry : entries) { total += util_path_size(entry.source); }
  tui::info("bundling %zu entries (%s) into %s",
            entries.size(),
            util_format_bytes(total).c_str(),
            root.c_str());

  fs::create_directories(root);

  std::size_t index{ 0 };
  for (auto const &entry : entries) {
    ++index;
    fs::path const dest{ root / entry.destination };
    tui::info("copying %zu/%zu: %s", index, entries.size(), entry.destination.c_str());

    try {
      fs::create_directories(dest.parent_path());
      if (fs::is_directory(entry.source)) {
        fs::copy(entry.source, dest, fs::copy_options::recursive);
      } else {
        fs::copy_file(entry.source, dest, fs::copy_options::none);
      }
    } catch (fs::filesystem_error const &e) {
      throw std::runtime_error("failed to copy " + entry.source.string() + " to " +
                               dest.string() + ": " + e.what());
    }

    LUAPACK_TRACE_ENTRY_COPIED(entry.source.string(),
                               entry.destination.string(),
                               static_cast<std::int64_t>(util_path_size(dest)));
  }
}

}  // namespace luapack
