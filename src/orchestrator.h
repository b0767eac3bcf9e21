#pragma once

#include "preview.h"
#include "provider.h"
#include "provision_run.h"
#include "secret_store.h"
#include "util.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace strata {

struct init_params {
  std::optional<std::filesystem::path> root;  // discovered when absent
  std::string profile{ "default" };
  std::optional<std::filesystem::path> stacks_dir;  // relative to root
  std::size_t max_parallelism{ 0 };  // 0 = library default

  bool operator==(init_params const &) const = default;
};

// The closed set of options recognized by provision and preview.
class provision_flags {
 public:
  provision_flags() = default;
  provision_flags(bool skip_refresh, bool skip_preview)
      : skip_refresh_{ skip_refresh }, skip_preview_{ skip_preview } {}

  bool skip_refresh() const { return skip_refresh_; }
  bool skip_preview() const { return skip_preview_; }

 private:
  bool skip_refresh_{ false };
  bool skip_preview_{ false };
};

// Immutable request parameters, validated at construction (invalid_params).
class provision_params {
 public:
  provision_params(std::vector<std::string> stacks = {},
                   provision_flags flags = {},
                   std::optional<std::filesystem::path> stacks_dir = std::nullopt,
                   std::optional<std::string> profile = std::nullopt);

  std::vector<std::string> const &stacks() const { return stacks_; }  // empty = all
  provision_flags const &flags() const { return flags_; }
  std::optional<std::filesystem::path> const &stacks_dir() const { return stacks_dir_; }
  std::optional<std::string> const &profile() const { return profile_; }

 private:
  std::vector<std::string> stacks_;
  provision_flags flags_;
  std::optional<std::filesystem::path> stacks_dir_;
  std::optional<std::string> profile_;
};

struct stack_params {
  std::vector<std::string> stacks;  // empty = every stack of every active run
};

// A stack's recorded state as its provider reports it.
struct stack_outputs {
  std::string stack;
  std::string provider;
  observed_state state;
};

struct provision_options {
  // Shown the preview before apply; returning false cancels with no mutation.
  // Absent means approve.
  std::function<bool(std::vector<preview_result> const &)> confirm;
  std::shared_ptr<cancellation_token const> token;
};

class orchestrator : unmovable {
 public:
  explicit orchestrator(provider_registry registry = provider_registry_with_builtins());
  ~orchestrator();

  // Idempotent for equal params; otherwise already_initialized.
  void init(init_params const &params);
  bool initialized() const;

  std::filesystem::path const &root() const;
  std::string const &profile() const;
  secret_store &secrets();

  // Stacks root for a request: params, then init, then the profile's
  // STACKS_DIR, then <root>/.strata/stacks.
  std::filesystem::path stacks_root(provision_params const &params);

  provision_report provision(provision_params const &params,
                             provision_options const &options = {});

  std::vector<preview_result> preview_provision(provision_params const &params);

  // Applies an empty desired state to the selected stacks (all when none are
  // named), each stack only after every selected stack depending on it has
  // been destroyed. Dependencies pulled in by the selection are left alone.
  provision_report destroy(provision_params const &params,
                           provision_options const &options = {});

  // Read-only: recorded state of each selected stack, in dependency order.
  std::vector<stack_outputs> outputs(provision_params const &params);

  // Returns the number of stacks affected; throws no_active_run_error when
  // nothing pending or running matches.
  std::size_t cancel(stack_params const &params);

 private:
  struct resolved_stacks;
  enum class run_mode { provision, destroy };

  void require_initialized() const;
  void check_profile(provision_params const &params) const;
  std::uint64_t next_run_id();
  resolved_stacks resolve(provision_params const &params, std::uint64_t run_id);
  void register_run(std::shared_ptr<provision_run> const &run);
  void unregister_run(std::shared_ptr<provision_run> const &run);
  provision_report execute(provision_params const &params,
                           provision_options const &options,
                           run_mode mode);
  void apply(provision_run &run, provider_set const &providers, run_mode mode) const;

  provider_registry registry_;

  mutable std::mutex mutex_;
  std::optional<init_params> params_;
  std::filesystem::path root_;
  std::unique_ptr<secret_store> secrets_;
  std::vector<std::shared_ptr<provision_run>> active_runs_;
  std::uint64_t next_run_id_{ 1 };
};

}  // namespace strata
