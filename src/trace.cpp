#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>
#include <utility>

namespace luapack {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};
  gmtime_r(&time, &result);
  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

}  // namespace

run_trace_scope::run_trace_scope(std::string script_path)
    : script{ std::move(script_path) }, start{ std::chrono::steady_clock::now() } {
  LUAPACK_TRACE_EMIT((trace_events::run_start{ .script = script }));
}

run_trace_scope::~run_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  LUAPACK_TRACE_EMIT((trace_events::run_complete{
      .script = script,
      .duration_ms = static_cast<std::int64_t>(duration_ms),
      .ok = ok,
  }));
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(unit_resolved),
          TRACE_NAME(unit_skipped),
          TRACE_NAME(builtin_set_computed),
          TRACE_NAME(hook_installed),
          TRACE_NAME(hook_removed),
          TRACE_NAME(run_start),
          TRACE_NAME(run_complete),
          TRACE_NAME(snapshot_taken),
          TRACE_NAME(snapshot_failed),
          TRACE_NAME(file_classified),
          TRACE_NAME(file_excluded),
          TRACE_NAME(file_dropped),
          TRACE_NAME(entry_copied),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::unit_resolved const &value) {
            std::ostringstream oss;
            oss << "unit_resolved unit=" << value.unit << " root=" << value.root;
            return oss.str();
          },
          [](trace_events::unit_skipped const &value) {
            std::ostringstream oss;
            oss << "unit_skipped unit=" << value.unit << " location=" << value.location
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::builtin_set_computed const &value) {
            std::ostringstream oss;
            oss << "builtin_set_computed reference=" << value.reference
                << " base_root=" << value.base_root << " count=" << value.count;
            return oss.str();
          },
          [](trace_events::hook_installed const &value) {
            std::ostringstream oss;
            oss << "hook_installed script=" << value.script;
            return oss.str();
          },
          [](trace_events::hook_removed const &value) {
            std::ostringstream oss;
            oss << "hook_removed script=" << value.script
                << " files_recorded=" << value.files_recorded;
            return oss.str();
          },
          [](trace_events::run_start const &value) {
            std::ostringstream oss;
            oss << "run_start script=" << value.script;
            return oss.str();
          },
          [](trace_events::run_complete const &value) {
            std::ostringstream oss;
            oss << "run_complete script=" << value.script
                << " duration_ms=" << value.duration_ms << " ok=" << bool_string(value.ok);
            return oss.str();
          },
          [](trace_events::snapshot_taken const &value) {
            std::ostringstream oss;
            oss << "snapshot_taken label=" << value.label
                << " file_count=" << value.file_count;
            return oss.str();
          },
          [](trace_events::snapshot_failed const &value) {
            std::ostringstream oss;
            oss << "snapshot_failed label=" << value.label << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::file_classified const &value) {
            std::ostringstream oss;
            oss << "file_classified source=" << value.source
                << " unit=" << (value.unit.empty() ? "<none>" : value.unit)
                << " destination=" << value.destination;
            return oss.str();
          },
          [](trace_events::file_excluded const &value) {
            std::ostringstream oss;
            oss << "file_excluded source=" << value.source << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::file_dropped const &value) {
            std::ostringstream oss;
            oss << "file_dropped source=" << value.source << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::entry_copied const &value) {
            std::ostringstream oss;
            oss << "entry_copied source=" << value.source
                << " destination=" << value.destination << " bytes=" << value.bytes;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::unit_resolved const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "root", value.root);
          },
          [&](trace_events::unit_skipped const &value) {
            append_kv(output, "unit", value.unit);
            append_kv(output, "location", value.location);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::builtin_set_computed const &value) {
            append_kv(output, "reference", value.reference);
            append_kv(output, "base_root", value.base_root);
            append_kv(output, "count", value.count);
          },
          [&](trace_events::hook_installed const &value) {
            append_kv(output, "script", value.script);
          },
          [&](trace_events::hook_removed const &value) {
            append_kv(output, "script", value.script);
            append_kv(output, "files_recorded", value.files_recorded);
          },
          [&](trace_events::run_start const &value) {
            append_kv(output, "script", value.script);
          },
          [&](trace_events::run_complete const &value) {
            append_kv(output, "script", value.script);
            append_kv(output, "duration_ms", value.duration_ms);
            append_kv(output, "ok", value.ok);
          },
          [&](trace_events::snapshot_taken const &value) {
            append_kv(output, "label", value.label);
            append_kv(output, "file_count", value.file_count);
          },
          [&](trace_events::snapshot_failed const &value) {
            append_kv(output, "label", value.label);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::file_classified const &value) {
            append_kv(output, "source", value.source);
            append_kv(output, "unit", value.unit);
            append_kv(output, "destination", value.destination);
          },
          [&](trace_events::file_excluded const &value) {
            append_kv(output, "source", value.source);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::file_dropped const &value) {
            append_kv(output, "source", value.source);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::entry_copied const &value) {
            append_kv(output, "source", value.source);
            append_kv(output, "destination", value.destination);
            append_kv(output, "bytes", value.bytes);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace luapack
