#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace strata {

namespace trace_events {

struct stack_loaded {
  std::string stack;
  std::string path;
  std::int64_t dependency_count;
};

struct dependency_added {
  std::string stack;
  std::string dependency;
};

struct run_phase {
  std::int64_t run_id;
  std::string phase;
};

struct stack_status {
  std::int64_t run_id;
  std::string stack;
  std::string status;
  std::string detail;
};

struct provider_call_start {
  std::string stack;
  std::string provider;
  std::string operation;
};

struct provider_call_complete {
  std::string stack;
  std::string provider;
  std::string operation;
  std::int64_t duration_ms;
  bool ok;
};

struct secret_bundle_decrypted {
  std::string path;
  std::int64_t entries;
};

struct cancel_requested {
  std::int64_t run_id;
  std::string stack;
  std::string prior_status;
};

struct preview_computed {
  std::string stack;
  std::int64_t create;
  std::int64_t update;
  std::int64_t remove;
  std::int64_t no_op;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::stack_loaded,
                                   trace_events::dependency_added,
                                   trace_events::run_phase,
                                   trace_events::stack_status,
                                   trace_events::provider_call_start,
                                   trace_events::provider_call_complete,
                                   trace_events::secret_bundle_decrypted,
                                   trace_events::cancel_requested,
                                   trace_events::preview_computed>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

// Emits provider_call_start on construction and provider_call_complete on
// destruction. Call succeeded() before leaving scope on the success path.
struct provider_call_trace_scope {
  std::string stack;
  std::string provider;
  std::string operation;
  std::chrono::steady_clock::time_point start;
  bool ok{ false };

  provider_call_trace_scope(std::string stack_name,
                            std::string provider_name,
                            std::string operation_name);
  ~provider_call_trace_scope();

  void succeeded() { ok = true; }
};

}  // namespace strata

#define STRATA_TRACE_UNLIKELY [[unlikely]]

#define STRATA_TRACE_EMIT(event_expr) \
  do { \
    if (::strata::tui::g_trace_enabled) STRATA_TRACE_UNLIKELY { \
        ::strata::tui::trace event_expr; \
      } \
  } while (0)

#define STRATA_TRACE_STACK_LOADED(stack_value, path_value, dependency_count_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::stack_loaded{ \
      .stack = (stack_value), \
      .path = (path_value), \
      .dependency_count = static_cast<std::int64_t>(dependency_count_value), \
  }))

#define STRATA_TRACE_DEPENDENCY_ADDED(stack_value, dependency_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::dependency_added{ \
      .stack = (stack_value), \
      .dependency = (dependency_value), \
  }))

#define STRATA_TRACE_RUN_PHASE(run_id_value, phase_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::run_phase{ \
      .run_id = static_cast<std::int64_t>(run_id_value), \
      .phase = std::string(phase_value), \
  }))

#define STRATA_TRACE_STACK_STATUS(run_id_value, stack_value, status_value, detail_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::stack_status{ \
      .run_id = static_cast<std::int64_t>(run_id_value), \
      .stack = (stack_value), \
      .status = std::string(status_value), \
      .detail = (detail_value), \
  }))

#define STRATA_TRACE_SECRET_BUNDLE_DECRYPTED(path_value, entries_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::secret_bundle_decrypted{ \
      .path = (path_value), \
      .entries = static_cast<std::int64_t>(entries_value), \
  }))

#define STRATA_TRACE_CANCEL_REQUESTED(run_id_value, stack_value, prior_status_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::cancel_requested{ \
      .run_id = static_cast<std::int64_t>(run_id_value), \
      .stack = (stack_value), \
      .prior_status = std::string(prior_status_value), \
  }))

#define STRATA_TRACE_PREVIEW_COMPUTED(stack_value, \
                                      create_value, \
                                      update_value, \
                                      remove_value, \
                                      no_op_value) \
  STRATA_TRACE_EMIT((::strata::trace_events::preview_computed{ \
      .stack = (stack_value), \
      .create = static_cast<std::int64_t>(create_value), \
      .update = static_cast<std::int64_t>(update_value), \
      .remove = static_cast<std::int64_t>(remove_value), \
      .no_op = static_cast<std::int64_t>(no_op_value), \
  }))
