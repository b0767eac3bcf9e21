#include "errors.h"

#include <utility>

namespace strata {

namespace {

std::string format_cycle(std::vector<std::string> const &members) {
  std::string msg{ "Dependency cycle detected: " };
  for (auto const &m : members) { msg += m + " -> "; }
  msg += members.empty() ? std::string{ "<empty>" } : members.front();
  return msg;
}

}  // namespace

std::string_view error_kind_name(error_kind kind) {
  switch (kind) {
    case error_kind::config: return "config";
    case error_kind::parse_error: return "parse_error";
    case error_kind::stack_not_found: return "stack_not_found";
    case error_kind::not_initialized: return "not_initialized";
    case error_kind::already_initialized: return "already_initialized";
    case error_kind::run_conflict: return "run_conflict";
    case error_kind::invalid_params: return "invalid_params";
    case error_kind::profile_not_found: return "profile_not_found";
    case error_kind::key_load_error: return "key_load_error";
    case error_kind::decryption_error: return "decryption_error";
    case error_kind::missing_secret: return "missing_secret";
    case error_kind::dependency_cycle: return "dependency_cycle";
    case error_kind::provider_query_error: return "provider_query_error";
    case error_kind::provider_apply_error: return "provider_apply_error";
    case error_kind::cancelled: return "cancelled";
    case error_kind::no_active_run: return "no_active_run";
  }
  return "unknown";
}

strata_error::strata_error(error_kind kind, std::string const &message)
    : std::runtime_error{ message }, kind_{ kind } {}

config_error::config_error(std::string const &message)
    : strata_error{ error_kind::config, message } {}

dependency_cycle_error::dependency_cycle_error(std::vector<std::string> members)
    : strata_error{ error_kind::dependency_cycle, format_cycle(members) },
      members_{ std::move(members) } {}

provider_error::provider_error(error_kind kind,
                               std::string const &provider,
                               std::string const &stack,
                               std::string const &cause)
    : strata_error{ kind,
                    "provider '" + provider + "' " +
                        (kind == error_kind::provider_query_error ? "query" : "apply") +
                        " failed for stack '" + stack + "': " + cause },
      provider_{ provider },
      stack_{ stack },
      cause_{ cause } {}

cancelled_error::cancelled_error(std::string const &message)
    : strata_error{ error_kind::cancelled, message } {}

no_active_run_error::no_active_run_error(std::string const &message)
    : strata_error{ error_kind::no_active_run, message } {}

}  // namespace strata
