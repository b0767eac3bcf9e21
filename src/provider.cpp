#include "provider.h"

#include "errors.h"
#include "fs_provider.h"
#include "secret_store.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace strata {

namespace {

void sort_resources(observed_state &state) {
  std::sort(state.resources.begin(),
            state.resources.end(),
            [](observed_resource const &a, observed_resource const &b) {
              return a.key() < b.key();
            });
}

template <typename Fn>
observed_state traced_query(provider &p,
                            stack_spec const &stack,
                            char const *operation,
                            Fn &&fn) {
  provider_call_trace_scope scope{ stack.name, std::string(p.name()), operation };
  try {
    auto state{ fn() };
    sort_resources(state);
    scope.succeeded();
    return state;
  } catch (provider_error const &) {
    throw;
  } catch (std::exception const &e) {
    throw provider_error(error_kind::provider_query_error,
                         std::string(p.name()),
                         stack.name,
                         e.what());
  }
}

}  // namespace

std::string apply_result::describe() const {
  return std::to_string(created) + " created, " + std::to_string(updated) + " updated, " +
         std::to_string(deleted) + " deleted";
}

apply_ctx::apply_ctx(std::function<bool()> cancel_requested)
    : cancel_requested_{ std::move(cancel_requested) } {}

bool apply_ctx::cancelled() const { return cancel_requested_ && cancel_requested_(); }

void apply_ctx::checkpoint() const {
  if (cancelled()) { throw cancelled_error("cancelled at provider call boundary"); }
}

void provider_registry::add(std::string binding, provider_factory_t factory) {
  if (!factories_.emplace(binding, std::move(factory)).second) {
    throw std::runtime_error("provider_registry: duplicate binding '" + binding + "'");
  }
}

bool provider_registry::contains(std::string_view binding) const {
  return factories_.find(binding) != factories_.end();
}

std::vector<std::string> provider_registry::bindings() const {
  std::vector<std::string> out;
  for (auto const &[name, factory] : factories_) { out.push_back(name); }
  return out;
}

std::unique_ptr<provider> provider_registry::create(provider_init const &init) const {
  auto const it{ factories_.find(init.binding) };
  if (it == factories_.end()) {
    throw config_error("unknown provider '" + init.binding + "'");
  }
  return it->second(init);
}

provider_registry provider_registry_with_builtins() {
  provider_registry registry;
  registry.add(std::string(kFsProviderName), [](provider_init const &init) {
    return std::make_unique<fs_provider>(init);
  });
  return registry;
}

provider_set::provider_set(provider_registry const &registry,
                           secret_view const &secrets,
                           std::filesystem::path const &root,
                           std::vector<stack_spec> const &stacks) {
  for (auto const &stack : stacks) {
    if (providers_.find(stack.provider) != providers_.end()) { continue; }

    if (!registry.contains(stack.provider)) {
      std::string known;
      for (auto const &b : registry.bindings()) { known += (known.empty() ? "" : ", ") + b; }
      throw config_error("stack '" + stack.name + "' uses unknown provider '" +
                         stack.provider + "' (registered: " + known + ")");
    }

    provider_init init{ .binding = stack.provider,
                        .root = root,
                        .credentials = secrets.provider_credentials(stack.provider) };
    tui::debug("Binding provider %s", stack.provider.c_str());
    providers_.emplace(stack.provider, registry.create(init));
  }
}

provider &provider_set::for_stack(stack_spec const &stack) const {
  auto const it{ providers_.find(stack.provider) };
  if (it == providers_.end()) {
    throw std::runtime_error("provider_set: no provider bound for stack '" + stack.name + "'");
  }
  return *it->second;
}

observed_state provider_query_state(provider &p, stack_spec const &stack) {
  return traced_query(p, stack, "query_state", [&] { return p.query_state(stack); });
}

observed_state provider_refresh(provider &p, stack_spec const &stack) {
  return traced_query(p, stack, "refresh", [&] { return p.refresh(stack); });
}

}  // namespace strata
