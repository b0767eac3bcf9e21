#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class error_kind {
  config,
  parse_error,
  stack_not_found,
  not_initialized,
  already_initialized,
  run_conflict,
  invalid_params,
  profile_not_found,
  key_load_error,
  decryption_error,
  missing_secret,
  dependency_cycle,
  provider_query_error,
  provider_apply_error,
  cancelled,
  no_active_run,
};

std::string_view error_kind_name(error_kind kind);

class strata_error : public std::runtime_error {
 public:
  strata_error(error_kind kind, std::string const &message);

  error_kind kind() const { return kind_; }

 private:
  error_kind kind_;
};

// User input must be fixed; never retried.
class config_error : public strata_error {
 public:
  using strata_error::strata_error;
  explicit config_error(std::string const &message);
};

// Missing or undecryptable credential material. Raised before any provider call.
class credential_error : public strata_error {
 public:
  using strata_error::strata_error;
};

class dependency_cycle_error : public strata_error {
 public:
  // members lists the cycle in traversal order, without repeating the first entry
  explicit dependency_cycle_error(std::vector<std::string> members);

  std::vector<std::string> const &members() const { return members_; }

 private:
  std::vector<std::string> members_;
};

class provider_error : public strata_error {
 public:
  provider_error(error_kind kind,
                 std::string const &provider,
                 std::string const &stack,
                 std::string const &cause);

  std::string const &provider() const { return provider_; }
  std::string const &stack() const { return stack_; }
  std::string const &cause() const { return cause_; }

 private:
  std::string provider_;
  std::string stack_;
  std::string cause_;
};

// A distinct terminal outcome, not a failure.
class cancelled_error : public strata_error {
 public:
  explicit cancelled_error(std::string const &message);
};

class no_active_run_error : public strata_error {
 public:
  explicit no_active_run_error(std::string const &message);
};

}  // namespace strata
