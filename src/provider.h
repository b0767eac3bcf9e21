#pragma once

#include "profile.h"
#include "stack_spec.h"
#include "util.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

class secret_view;

struct observed_resource {
  std::string type;
  std::string name;
  std::string fingerprint;

  std::string key() const { return type + "/" + name; }
  bool operator==(observed_resource const &) const = default;
};

struct observed_state {
  std::vector<observed_resource> resources;  // sorted by key

  bool operator==(observed_state const &) const = default;
};

struct apply_result {
  std::size_t created{ 0 };
  std::size_t updated{ 0 };
  std::size_t deleted{ 0 };
  std::size_t unchanged{ 0 };

  std::string describe() const;
};

// Handed to provider::apply. Providers call checkpoint() at every resource
// boundary; it throws cancelled_error once cancellation has been requested.
class apply_ctx : unmovable {
 public:
  explicit apply_ctx(std::function<bool()> cancel_requested);

  bool cancelled() const;
  void checkpoint() const;

 private:
  std::function<bool()> cancel_requested_;
};

// Implementations must tolerate concurrent calls for distinct stacks.
class provider : unmovable {
 public:
  virtual ~provider() = default;

  virtual std::string_view name() const = 0;
  virtual observed_state query_state(stack_spec const &stack) = 0;
  virtual observed_state refresh(stack_spec const &stack) { return query_state(stack); }
  virtual apply_result apply(stack_spec const &stack, apply_ctx &ctx) = 0;
};

struct provider_init {
  std::string binding;
  std::filesystem::path root;
  credential_map_t credentials;
};

using provider_factory_t = std::function<std::unique_ptr<provider>(provider_init const &)>;

class provider_registry {
 public:
  void add(std::string binding, provider_factory_t factory);
  bool contains(std::string_view binding) const;
  std::vector<std::string> bindings() const;

  // Throws config_error for an unknown binding.
  std::unique_ptr<provider> create(provider_init const &init) const;

 private:
  std::map<std::string, provider_factory_t, std::less<>> factories_;
};

// Registry with the built-in providers (fs).
provider_registry provider_registry_with_builtins();

// One provider instance per binding used by a set of stacks, created from the
// profile's credentials. Throws config_error if a stack names a binding that
// is not registered or not configured in the profile.
class provider_set : unmovable {
 public:
  provider_set(provider_registry const &registry,
               secret_view const &secrets,
               std::filesystem::path const &root,
               std::vector<stack_spec> const &stacks);

  provider &for_stack(stack_spec const &stack) const;

 private:
  std::map<std::string, std::unique_ptr<provider>, std::less<>> providers_;
};

// Traced wrappers. Failures are rethrown as provider_error carrying the
// provider, stack and cause.
observed_state provider_query_state(provider &p, stack_spec const &stack);
observed_state provider_refresh(provider &p, stack_spec const &stack);

}  // namespace strata
