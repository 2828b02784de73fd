#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <exception>
#include <sstream>
#include <string>
#include <utility>

namespace strata {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm utc_tm{};
  gmtime_r(&timestamp, &utc_tm);

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
  out.append(",\"").append(key).append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.append(",\"").append(key).append("\":").append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.append(",\"").append(key).append("\":").append(bool_string(value));
}

}  // namespace

step_trace_scope::step_trace_scope(std::string step_name, std::string resource_key)
    : step{ std::move(step_name) },
      key{ std::move(resource_key) },
      start{ std::chrono::steady_clock::now() },
      uncaught_on_entry{ std::uncaught_exceptions() } {
  STRATA_TRACE_STEP_START(step, key);
}

step_trace_scope::~step_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  if (std::uncaught_exceptions() > uncaught_on_entry) {
    STRATA_TRACE_STEP_FAILED(step, key, static_cast<std::int64_t>(duration_ms));
  } else {
    STRATA_TRACE_STEP_COMPLETE(step, key, static_cast<std::int64_t>(duration_ms));
  }
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(step_start),
          TRACE_NAME(step_complete),
          TRACE_NAME(step_failed),
          TRACE_NAME(probe_result),
          TRACE_NAME(resource_adopted),
          TRACE_NAME(resource_created),
          TRACE_NAME(resource_updated),
          TRACE_NAME(resource_skipped),
          TRACE_NAME(conflict_recovered),
          TRACE_NAME(readiness_attempt),
          TRACE_NAME(deployment_published),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  std::ostringstream oss;
  oss << trace_event_name(event);

  std::visit(
      match{
          [&](trace_events::step_start const &value) {
            oss << " step=" << value.step << " key=" << value.key;
          },
          [&](trace_events::step_complete const &value) {
            oss << " step=" << value.step << " key=" << value.key
                << " duration_ms=" << value.duration_ms;
          },
          [&](trace_events::step_failed const &value) {
            oss << " step=" << value.step << " key=" << value.key
                << " duration_ms=" << value.duration_ms;
          },
          [&](trace_events::probe_result const &value) {
            oss << " kind=" << resource_kind_name(value.kind) << " key=" << value.key
                << " present=" << bool_string(value.present);
            if (!value.identity.empty()) { oss << " identity=" << value.identity; }
          },
          [&](trace_events::resource_adopted const &value) {
            oss << " kind=" << resource_kind_name(value.kind) << " key=" << value.key
                << " identity=" << value.identity;
          },
          [&](trace_events::resource_created const &value) {
            oss << " kind=" << resource_kind_name(value.kind) << " key=" << value.key
                << " identity=" << value.identity << " duration_ms=" << value.duration_ms;
          },
          [&](trace_events::resource_updated const &value) {
            oss << " kind=" << resource_kind_name(value.kind) << " key=" << value.key
                << " aspect=" << value.aspect;
          },
          [&](trace_events::resource_skipped const &value) {
            oss << " kind=" << resource_kind_name(value.kind) << " key=" << value.key
                << " reason=" << value.reason;
          },
          [&](trace_events::conflict_recovered const &value) {
            oss << " kind=" << resource_kind_name(value.kind) << " key=" << value.key
                << " detail=" << value.detail;
          },
          [&](trace_events::readiness_attempt const &value) {
            oss << " api_id=" << value.api_id << " attempt=" << value.attempt << "/"
                << value.max_attempts << " ready=" << bool_string(value.ready);
          },
          [&](trace_events::deployment_published const &value) {
            oss << " api_id=" << value.api_id << " stage=" << value.stage
                << " deployment_id=" << value.deployment_id;
          },
      },
      event);

  return oss.str();
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  auto const append_resource{ [&](resource_kind kind, std::string_view key) {
    append_kv(output, "kind", resource_kind_name(kind));
    append_kv(output, "key", key);
  } };

  std::visit(
      match{
          [&](trace_events::step_start const &value) {
            append_kv(output, "step", value.step);
            append_kv(output, "key", value.key);
          },
          [&](trace_events::step_complete const &value) {
            append_kv(output, "step", value.step);
            append_kv(output, "key", value.key);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::step_failed const &value) {
            append_kv(output, "step", value.step);
            append_kv(output, "key", value.key);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::probe_result const &value) {
            append_resource(value.kind, value.key);
            append_kv(output, "present", value.present);
            append_kv(output, "identity", value.identity);
          },
          [&](trace_events::resource_adopted const &value) {
            append_resource(value.kind, value.key);
            append_kv(output, "identity", value.identity);
          },
          [&](trace_events::resource_created const &value) {
            append_resource(value.kind, value.key);
            append_kv(output, "identity", value.identity);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::resource_updated const &value) {
            append_resource(value.kind, value.key);
            append_kv(output, "aspect", value.aspect);
          },
          [&](trace_events::resource_skipped const &value) {
            append_resource(value.kind, value.key);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::conflict_recovered const &value) {
            append_resource(value.kind, value.key);
            append_kv(output, "detail", value.detail);
          },
          [&](trace_events::readiness_attempt const &value) {
            append_kv(output, "api_id", value.api_id);
            append_kv(output, "attempt", static_cast<std::int64_t>(value.attempt));
            append_kv(output, "max_attempts", static_cast<std::int64_t>(value.max_attempts));
            append_kv(output, "ready", value.ready);
          },
          [&](trace_events::deployment_published const &value) {
            append_kv(output, "api_id", value.api_id);
            append_kv(output, "stage", value.stage);
            append_kv(output, "deployment_id", value.deployment_id);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace strata
