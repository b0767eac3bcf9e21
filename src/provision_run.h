#pragma once

#include "preview.h"
#include "provider.h"
#include "stack_spec.h"
#include "util.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class stack_status { pending, running, succeeded, failed, cancelled, skipped };

std::string_view stack_status_name(stack_status status);
bool stack_status_terminal(stack_status status);

enum class run_phase {
  idle,
  initializing,
  loading,
  refreshing,
  previewing,
  applying,
  completed,
  failed,
  cancelled,
};

std::string_view run_phase_name(run_phase phase);

// Set from any thread (including a signal handler) to stop a whole run.
class cancellation_token {
 public:
  void request() noexcept { requested_.store(true, std::memory_order_relaxed); }
  bool requested() const noexcept { return requested_.load(std::memory_order_relaxed); }

 private:
  std::atomic<bool> requested_{ false };
};

struct stack_outcome {
  std::string stack;
  stack_status status{ stack_status::pending };
  std::string detail;  // failure cause, skip reason, or apply summary
  std::optional<apply_result> result;
};

struct provision_report {
  std::uint64_t run_id{ 0 };
  run_phase phase{ run_phase::idle };
  std::vector<stack_outcome> stacks;  // dependency order
  std::vector<preview_result> previews;  // empty when the preview gate was skipped
  bool previewed{ false };

  // True only when every targeted stack succeeded.
  bool ok() const;
  stack_outcome const *find(std::string_view stack) const;
};

// Live state of one provision call. Every transition happens under one mutex;
// cancellation is monotonic, so a stack flagged while running can only end
// cancelled or failed.
class provision_run : unmovable {
 public:
  provision_run(std::uint64_t id,
                std::vector<stack_spec> stacks,
                std::shared_ptr<cancellation_token const> token = nullptr);

  std::uint64_t id() const { return id_; }
  std::vector<stack_spec> const &stacks() const { return stacks_; }

  run_phase phase() const;
  void set_phase(run_phase phase);

  bool contains(std::string_view stack) const;
  stack_status status(std::string_view stack) const;
  bool cancel_requested(std::string_view stack) const;

  // pending -> running. Returns false (and records cancelled) if the stack
  // was cancelled before it could start.
  bool try_start(std::string const &stack);

  // running -> terminal. A succeeded result is recorded as cancelled when
  // cancellation was requested for the stack.
  void finish(std::string const &stack,
              stack_status status,
              std::string detail,
              std::optional<apply_result> result = std::nullopt);

  // pending -> skipped
  void skip(std::string const &stack, std::string reason);

  // pending -> failed, for a stack whose state could not be read before apply.
  void fail_pending(std::string const &stack, std::string detail);

  // Cancel matching stacks (all when names is empty): pending stacks become
  // cancelled at once, running stacks are flagged. Returns how many stacks
  // were affected; terminal stacks are untouched.
  std::size_t cancel(std::vector<std::string> const &names);

  // Every pending stack becomes cancelled. Used when the preview is declined.
  void cancel_pending(std::string const &reason);

  // Final phase from stack outcomes: completed if all succeeded, failed if
  // any failed, otherwise cancelled.
  run_phase settle();

  provision_report report() const;

 private:
  struct entry {
    stack_status status{ stack_status::pending };
    bool cancel_flag{ false };
    std::string detail;
    std::optional<apply_result> result;
  };

  void set_status(std::string const &stack, entry &e, stack_status status);

  std::uint64_t const id_;
  std::vector<stack_spec> const stacks_;
  std::shared_ptr<cancellation_token const> token_;

  mutable std::mutex mutex_;
  run_phase phase_{ run_phase::idle };
  std::map<std::string, entry, std::less<>> entries_;
};

}  // namespace strata
