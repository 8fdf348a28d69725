#include "platform.h"

#include <pwd.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace luapack::platform {

process_id current_pid() { return static_cast<process_id>(::getpid()); }

std::optional<std::filesystem::path> read_link(std::filesystem::path const &link) {
  std::vector<char> buf(4096);
  ssize_t const len{ ::readlink(link.c_str(), buf.data(), buf.size() - 1) };
  if (len <= 0) { return std::nullopt; }
  buf[static_cast<size_t>(len)] = '\0';
  return std::filesystem::path{ buf.data() };
}

std::filesystem::path expand_path(std::string_view p) {
  if (p.empty() || p.front() != '~') { return std::filesystem::path{ p }; }

  auto const slash{ p.find('/') };
  std::string_view const user{ p.substr(1, slash == std::string_view::npos ? p.npos
                                                                           : slash - 1) };
  std::string_view const rest{ slash == std::string_view::npos ? std::string_view{}
                                                               : p.substr(slash) };

  std::string home;
  if (user.empty()) {
    if (char const *env{ std::getenv("HOME") }; env && *env) {
      home = env;
    } else if (passwd const *pw{ ::getpwuid(::getuid()) }; pw && pw->pw_dir) {
      home = pw->pw_dir;
    } else {
      throw std::runtime_error("cannot determine home directory for: " + std::string{ p });
    }
  } else {
    passwd const *pw{ ::getpwnam(std::string{ user }.c_str()) };
    if (!pw || !pw->pw_dir) { return std::filesystem::path{ p }; }  // unknown user: literal
    home = pw->pw_dir;
  }

  while (!home.empty() && home.back() == '/') { home.pop_back(); }
  std::string result{ home + std::string{ rest } };
  return std::filesystem::path{ result.empty() ? "/" : result };
}

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

}  // namespace luapack::platform
