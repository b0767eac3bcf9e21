#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

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
  out.append(",\"");
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.append(",\"");
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.append(",\"");
  out.append(key);
  out.append("\":");
  out.append(bool_string(value));
}

}  // namespace

provider_call_trace_scope::provider_call_trace_scope(std::string stack_name,
                                                     std::string provider_name,
                                                     std::string operation_name)
    : stack{ std::move(stack_name) },
      provider{ std::move(provider_name) },
      operation{ std::move(operation_name) },
      start{ std::chrono::steady_clock::now() } {
  STRATA_TRACE_EMIT((trace_events::provider_call_start{ .stack = stack,
                                                        .provider = provider,
                                                        .operation = operation }));
}

provider_call_trace_scope::~provider_call_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  STRATA_TRACE_EMIT((trace_events::provider_call_complete{
      .stack = stack,
      .provider = provider,
      .operation = operation,
      .duration_ms = static_cast<std::int64_t>(duration_ms),
      .ok = ok }));
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(stack_loaded),
                        TRACE_NAME(dependency_added),
                        TRACE_NAME(run_phase),
                        TRACE_NAME(stack_status),
                        TRACE_NAME(provider_call_start),
                        TRACE_NAME(provider_call_complete),
                        TRACE_NAME(secret_bundle_decrypted),
                        TRACE_NAME(cancel_requested),
                        TRACE_NAME(preview_computed),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  std::ostringstream oss;
  oss << trace_event_name(event);

  std::visit(
      match{
          [&](trace_events::stack_loaded const &value) {
            oss << " stack=" << value.stack << " path=" << value.path
                << " dependency_count=" << value.dependency_count;
          },
          [&](trace_events::dependency_added const &value) {
            oss << " stack=" << value.stack << " dependency=" << value.dependency;
          },
          [&](trace_events::run_phase const &value) {
            oss << " run=" << value.run_id << " phase=" << value.phase;
          },
          [&](trace_events::stack_status const &value) {
            oss << " run=" << value.run_id << " stack=" << value.stack
                << " status=" << value.status;
            if (!value.detail.empty()) { oss << " detail=" << value.detail; }
          },
          [&](trace_events::provider_call_start const &value) {
            oss << " stack=" << value.stack << " provider=" << value.provider
                << " operation=" << value.operation;
          },
          [&](trace_events::provider_call_complete const &value) {
            oss << " stack=" << value.stack << " provider=" << value.provider
                << " operation=" << value.operation
                << " duration_ms=" << value.duration_ms << " ok=" << bool_string(value.ok);
          },
          [&](trace_events::secret_bundle_decrypted const &value) {
            oss << " path=" << value.path << " entries=" << value.entries;
          },
          [&](trace_events::cancel_requested const &value) {
            oss << " run=" << value.run_id << " stack=" << value.stack
                << " prior_status=" << value.prior_status;
          },
          [&](trace_events::preview_computed const &value) {
            oss << " stack=" << value.stack << " create=" << value.create
                << " update=" << value.update << " delete=" << value.remove
                << " no_op=" << value.no_op;
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

  std::visit(
      match{
          [&](trace_events::stack_loaded const &value) {
            append_kv(output, "stack", value.stack);
            append_kv(output, "path", value.path);
            append_kv(output, "dependency_count", value.dependency_count);
          },
          [&](trace_events::dependency_added const &value) {
            append_kv(output, "stack", value.stack);
            append_kv(output, "dependency", value.dependency);
          },
          [&](trace_events::run_phase const &value) {
            append_kv(output, "run", value.run_id);
            append_kv(output, "phase", value.phase);
          },
          [&](trace_events::stack_status const &value) {
            append_kv(output, "run", value.run_id);
            append_kv(output, "stack", value.stack);
            append_kv(output, "status", value.status);
            append_kv(output, "detail", value.detail);
          },
          [&](trace_events::provider_call_start const &value) {
            append_kv(output, "stack", value.stack);
            append_kv(output, "provider", value.provider);
            append_kv(output, "operation", value.operation);
          },
          [&](trace_events::provider_call_complete const &value) {
            append_kv(output, "stack", value.stack);
            append_kv(output, "provider", value.provider);
            append_kv(output, "operation", value.operation);
            append_kv(output, "duration_ms", value.duration_ms);
            append_kv(output, "ok", value.ok);
          },
          [&](trace_events::secret_bundle_decrypted const &value) {
            append_kv(output, "path", value.path);
            append_kv(output, "entries", value.entries);
          },
          [&](trace_events::cancel_requested const &value) {
            append_kv(output, "run", value.run_id);
            append_kv(output, "stack", value.stack);
            append_kv(output, "prior_status", value.prior_status);
          },
          [&](trace_events::preview_computed const &value) {
            append_kv(output, "stack", value.stack);
            append_kv(output, "create", value.create);
            append_kv(output, "update", value.update);
            append_kv(output, "delete", value.remove);
            append_kv(output, "no_op", value.no_op);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace strata
