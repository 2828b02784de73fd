#pragma once

#include "resource.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace strata {

namespace trace_events {

struct step_start {
  std::string step;
  std::string key;
};

struct step_complete {
  std::string step;
  std::string key;
  std::int64_t duration_ms;
};

// Emitted instead of step_complete when the step exits by exception.
struct step_failed {
  std::string step;
  std::string key;
  std::int64_t duration_ms;
};

struct probe_result {
  resource_kind kind;
  std::string key;
  bool present;
  std::string identity;
};

struct resource_adopted {
  resource_kind kind;
  std::string key;
  std::string identity;
};

struct resource_created {
  resource_kind kind;
  std::string key;
  std::string identity;
  std::int64_t duration_ms;
};

struct resource_updated {
  resource_kind kind;
  std::string key;
  std::string aspect;  // "code" or "configuration"
};

struct resource_skipped {
  resource_kind kind;
  std::string key;
  std::string reason;
};

struct conflict_recovered {
  resource_kind kind;
  std::string key;
  std::string detail;
};

struct readiness_attempt {
  std::string api_id;
  int attempt;
  int max_attempts;
  bool ready;
};

struct deployment_published {
  std::string api_id;
  std::string stage;
  std::string deployment_id;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::step_start,
                                   trace_events::step_complete,
                                   trace_events::step_failed,
                                   trace_events::probe_result,
                                   trace_events::resource_adopted,
                                   trace_events::resource_created,
                                   trace_events::resource_updated,
                                   trace_events::resource_skipped,
                                   trace_events::conflict_recovered,
                                   trace_events::readiness_attempt,
                                   trace_events::deployment_published>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {

extern bool g_trace_enabled;
void trace(trace_event_t event);
inline bool trace_enabled() { return g_trace_enabled; }

}  // namespace tui

struct step_trace_scope {
  std::string step;
  std::string key;
  std::chrono::steady_clock::time_point start;
  int uncaught_on_entry;

  step_trace_scope(std::string step_name, std::string resource_key);
  ~step_trace_scope();
};

}  // namespace strata

#define STRATA_TRACE_UNLIKELY [[unlikely]]

#define STRATA_TRACE_EMIT(event_expr)                \
  do {                                               \
    if (::strata::tui::g_trace_enabled)              \
      STRATA_TRACE_UNLIKELY {                        \
        ::strata::tui::trace event_expr;             \
      }                                              \
  } while (0)

#define STRATA_TRACE_STEP_START(step_value, key_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::step_start{ \
      .step = (step_value),                              \
      .key = (key_value),                                \
  }))

#define STRATA_TRACE_STEP_COMPLETE(step_value, key_value, duration_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::step_complete{               \
      .step = (step_value),                                               \
      .key = (key_value),                                                 \
      .duration_ms = (duration_value),                                    \
  }))

#define STRATA_TRACE_STEP_FAILED(step_value, key_value, duration_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::step_failed{               \
      .step = (step_value),                                             \
      .key = (key_value),                                               \
      .duration_ms = (duration_value),                                  \
  }))

#define STRATA_TRACE_PROBE_RESULT(kind_value, key_value, present_value, identity_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::probe_result{                              \
      .kind = (kind_value),                                                             \
      .key = (key_value),                                                               \
      .present = (present_value),                                                       \
      .identity = (identity_value),                                                     \
  }))

#define STRATA_TRACE_RESOURCE_ADOPTED(kind_value, key_value, identity_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::resource_adopted{               \
      .kind = (kind_value),                                                  \
      .key = (key_value),                                                    \
      .identity = (identity_value),                                          \
  }))

#define STRATA_TRACE_RESOURCE_CREATED(kind_value, key_value, identity_value, duration_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::resource_created{                               \
      .kind = (kind_value),                                                                  \
      .key = (key_value),                                                                    \
      .identity = (identity_value),                                                          \
      .duration_ms = (duration_value),                                                       \
  }))

#define STRATA_TRACE_RESOURCE_UPDATED(kind_value, key_value, aspect_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::resource_updated{             \
      .kind = (kind_value),                                                \
      .key = (key_value),                                                  \
      .aspect = (aspect_value),                                            \
  }))

#define STRATA_TRACE_RESOURCE_SKIPPED(kind_value, key_value, reason_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::resource_skipped{             \
      .kind = (kind_value),                                                \
      .key = (key_value),                                                  \
      .reason = (reason_value),                                            \
  }))

#define STRATA_TRACE_CONFLICT_RECOVERED(kind_value, key_value, detail_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::conflict_recovered{             \
      .kind = (kind_value),                                                  \
      .key = (key_value),                                                    \
      .detail = (detail_value),                                              \
  }))

#define STRATA_TRACE_READINESS_ATTEMPT(api_value, attempt_value, max_value, ready_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::readiness_attempt{                          \
      .api_id = (api_value),                                                             \
      .attempt = (attempt_value),                                                        \
      .max_attempts = (max_value),                                                       \
      .ready = (ready_value),                                                            \
  }))

#define STRATA_TRACE_DEPLOYMENT_PUBLISHED(api_value, stage_value, deployment_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::deployment_published{                  \
      .api_id = (api_value),                                                        \
      .stage = (stage_value),                                                       \
      .deployment_id = (deployment_value),                                          \
  }))
