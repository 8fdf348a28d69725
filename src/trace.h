#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace luapack {

namespace trace_events {

struct unit_resolved {
  std::string unit;
  std::string root;
};

struct unit_skipped {
  std::string unit;
  std::string location;
  std::string reason;
};

struct builtin_set_computed {
  std::string reference;
  std::string base_root;
  std::int64_t count;
};

struct hook_installed {
  std::string script;
};

struct hook_removed {
  std::string script;
  std::int64_t files_recorded;
};

struct run_start {
  std::string script;
};

struct run_complete {
  std::string script;
  std::int64_t duration_ms;
  bool ok;
};

struct snapshot_taken {
  std::string label;
  std::int64_t file_count;
};

struct snapshot_failed {
  std::string label;
  std::string reason;
};

struct file_classified {
  std::string source;
  std::string unit;  // empty for catch-all files
  std::string destination;
};

struct file_excluded {
  std::string source;
  std::string reason;  // "file_blacklist", "builtin", "unit_blacklist"
};

struct file_dropped {
  std::string source;
  std::string reason;
};

struct entry_copied {
  std::string source;
  std::string destination;
  std::int64_t bytes;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::unit_resolved,
                                   trace_events::unit_skipped,
                                   trace_events::builtin_set_computed,
                                   trace_events::hook_installed,
                                   trace_events::hook_removed,
                                   trace_events::run_start,
                                   trace_events::run_complete,
                                   trace_events::snapshot_taken,
                                   trace_events::snapshot_failed,
                                   trace_events::file_classified,
                                   trace_events::file_excluded,
                                   trace_events::file_dropped,
                                   trace_events::entry_copied>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

// Emits run_start on construction and run_complete on destruction. Call succeed()
// once the monitored program returned normally.
struct run_trace_scope {
  std::string script;
  std::chrono::steady_clock::time_point start;
  bool ok{ false };

  explicit run_trace_scope(std::string script_path);
  ~run_trace_scope();

  void succeed() { ok = true; }
};

}  // namespace luapack

#define LUAPACK_TRACE_UNLIKELY [[unlikely]]

#define LUAPACK_TRACE_EMIT(event_expr) \
  do { \
    if (::luapack::tui::g_trace_enabled) LUAPACK_TRACE_UNLIKELY { \
        ::luapack::tui::trace event_expr; \
      } \
  } while (0)

#define LUAPACK_TRACE_UNIT_RESOLVED(unit_value, root_value) \
  LUAPACK_TRACE_EMIT((::luapack::trace_events::unit_resolved{ \
      .unit = (unit_value), \
      .root = (root_value), \
  }))

#define LUAPACK_TRACE_UNIT_SKIPPED(unit_value, location_value, reason_value) \
  LUAPACK_TRACE_EMIT((::luapack::trace_events::unit_skipped{ \
      .unit = (unit_value), \
      .location = (location_value), \
      .reason = (reason_value), \
  }))

#define LUAPACK_TRACE_BUILTIN_SET_COMPUTED(reference_value, base_root_value, count_value) \
  LUAPACK_TRACE_EMIT((::luapack::trace_events::builtin_set_computed{ \
      .reference = (reference_value), \
      .base_root = (base_root_value), \
      .count = (count_value), \
  }))

#define LUAPACK_TRACE_HOOK_INSTALLED(script_value) \
  LUAPACK_TRACE_EMIT((::luapack::trace_events::hook_installed{ \
      .script = (script_value), \
  }))

#define LUAPACK_TRACE_HOOK_REMOVED(script_value, files_recorded_value) \
  LUAPACK_TRACE_EMIT((::luapack::trace_events::hook_removed{ \
      .script = (script_value), \
      .files_recorded = (files_recorded_value), \
  }))

#define LUAPACK_TRACE_SNAPSHOT_TAKEN(label_value, file_count_value) \
  LUAPACK_TRACE_EMIT((::luapack::trace_events::snapshot_taken{ \
      .label = (label_value), \
      .file_count = (file_count_value), \
  }))

#define LUAPACK_TRACE_SNAPSHOT_FAILED(label_value, reason_value) \
  LUAPACK_TRACE_EMIT((::luapack::trace_events::snapshot_failed{ \
      .label = (label_value), \
      .reason = (reason_value), \
  }))

#define LUAPACK_TRACE_FILE_CLASSIFIED(source_value, unit_value, destination_value) \
  LUAPACK_TRACE_EMIT((::luapack::trace_events::file_classified{ \
      .source = (source_value), \
      .unit = (unit_value), \
      .destination = (destination_value), \
  }))

#define LUAPACK_TRACE_FILE_EXCLUDED(source_value, reason_value) \
  LUAPACK_TRACE_EMIT((::luapack::trace_events::file_excluded{ \
      .source = (source_value), \
      .reason = (reason_value), \
  }))

#define LUAPACK_TRACE_FILE_DROPPED(source_value, reason_value) \
  LUAPACK_TRACE_EMIT((::luapack::trace_events::file_dropped{ \
      .source = (source_value), \
      .reason = (reason_value), \
  }))

#define LUAPACK_TRACE_ENTRY_COPIED(source_value, destination_value, bytes_value) \
  LUAPACK_TRACE_EMIT((::luapack::trace_events::entry_copied{ \
      .source = (source_value), \
      .destination = (destination_value), \
      .bytes = (bytes_value), \
  }))
