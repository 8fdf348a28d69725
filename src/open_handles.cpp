#include "open_handles.h"

#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace luapack {

namespace fs = std::filesystem;

namespace {

void keep_if_regular(fs::path const &p, path_set_t &out) {
  if (p.empty() || !p.is_absolute()) { return; }

  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) { return; }

  auto canonical{ fs::canonical(p, ec) };
  if (ec) { return; }
  out.insert(std::move(canonical));
}

void read_fd_table(fs::path const &fd_dir, path_set_t &out) {
  std::error_code ec;
  fs::directory_iterator it{ fd_dir, ec };
  if (ec) { throw std::runtime_error("cannot list " + fd_dir.string() + ": " + ec.message()); }

  fs::directory_iterator const end{};
  for (; it != end; it.increment(ec)) {
    if (ec) { throw std::runtime_error("cannot list " + fd_dir.string() + ": " + ec.message()); }

    // Descriptors close while we walk; a vanished link is not an error.
    if (auto target{ platform::read_link(it->path()) }) { keep_if_regular(*target, out); }
  }
}

// Pathname column of one maps line, empty for anonymous mappings. nullopt when the
// line does not have the five fixed columns.
std::optional<std::string> parse_maps_line(std::string const &line) {
  std::istringstream iss{ line };
  std::string address, perms, offset, device, inode;
  if (!(iss >> address >> perms >> offset >> device >> inode)) { return std::nullopt; }
  if (address.find('-') == std::string::npos || perms.size() != 4) { return std::nullopt; }

  std::string rest;
  std::getline(iss, rest);
  auto const start{ rest.find_first_not_of(' ') };
  if (start == std::string::npos) { return std::string{}; }
  return rest.substr(start);
}

void read_maps(fs::path const &maps_path, path_set_t &out) {
  std::ifstream in{ maps_path };
  if (!in) { throw std::runtime_error("cannot open " + maps_path.string()); }

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) { continue; }

    auto const pathname{ parse_maps_line(line) };
    if (!pathname) { throw std::runtime_error("malformed maps line: " + line); }
    if (pathname->empty() || pathname->front() != '/') { continue; }  // [heap], [vdso]...
    if (pathname->ends_with(" (deleted)")) { continue; }

    keep_if_regular(*pathname, out);
  }
}

}  // namespace

path_set_t open_handles_snapshot(platform::process_id pid,
                                 std::string_view label,
                                 fs::path const &proc_root) {
  fs::path const proc_dir{ proc_root / std::to_string(pid) };

  path_set_t result;
  try {
    read_fd_table(proc_dir / "fd", result);
    read_maps(proc_dir / "maps", result);
  } catch (std::exception const &e) {
    tui::warn("open-handle snapshot '%s' unavailable: %s",
              std::string{ label }.c_str(),
              e.what());
    LUAPACK_TRACE_SNAPSHOT_FAILED(std::string{ label }, std::string{ e.what() });
    return {};
  }

  tui::debug("open-handle snapshot '%s': %zu files", std::string{ label }.c_str(), result.size());
  LUAPACK_TRACE_SNAPSHOT_TAKEN(std::string{ label }, static_cast<std::int64_t>(result.size()));
  return result;
}

path_set_t open_handles_diff(path_set_t const &before, path_set_t const &after) {
  path_set_t result;
  std::set_difference(after.begin(),
                      after.end(),
                      before.begin(),
                      before.end(),
                      std::inserter(result, result.end()));
  return result;
}

}  // namespace luapack
