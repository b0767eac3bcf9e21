#include "provision_run.h"

#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace strata {

std::string_view stack_status_name(stack_status status) {
  switch (status) {
    case stack_status::pending: return "pending";
    case stack_status::running: return "running";
    case stack_status::succeeded: return "succeeded";
    case stack_status::failed: return "failed";
    case stack_status::cancelled: return "cancelled";
    case stack_status::skipped: return "skipped";
  }
  return "unknown";
}

bool stack_status_terminal(stack_status status) {
  return status != stack_status::pending && status != stack_status::running;
}

std::string_view run_phase_name(run_phase phase) {
  switch (phase) {
    case run_phase::idle: return "idle";
    case run_phase::initializing: return "initializing";
    case run_phase::loading: return "loading";
    case run_phase::refreshing: return "refreshing";
    case run_phase::previewing: return "previewing";
    case run_phase::applying: return "applying";
    case run_phase::completed: return "completed";
    case run_phase::failed: return "failed";
    case run_phase::cancelled: return "cancelled";
  }
  return "unknown";
}

bool provision_report::ok() const {
  return phase == run_phase::completed &&
         std::all_of(stacks.begin(), stacks.end(), [](stack_outcome const &s) {
           return s.status == stack_status::succeeded;
         });
}

stack_outcome const *provision_report::find(std::string_view stack) const {
  for (auto const &s : stacks) {
    if (s.stack == stack) { return &s; }
  }
  return nullptr;
}

provision_run::provision_run(std::uint64_t id,
                             std::vector<stack_spec> stacks,
                             std::shared_ptr<cancellation_token const> token)
    : id_{ id }, stacks_{ std::move(stacks) }, token_{ std::move(token) } {
  for (auto const &s : stacks_) { entries_.emplace(s.name, entry{}); }
}

run_phase provision_run::phase() const {
  std::lock_guard lock{ mutex_ };
  return phase_;
}

void provision_run::set_phase(run_phase phase) {
  std::lock_guard lock{ mutex_ };
  phase_ = phase;
  tui::debug("run %llu: %s",
             static_cast<unsigned long long>(id_),
             std::string(run_phase_name(phase)).c_str());
  STRATA_TRACE_RUN_PHASE(id_, run_phase_name(phase));
}

bool provision_run::contains(std::string_view stack) const {
  std::lock_guard lock{ mutex_ };
  return entries_.find(stack) != entries_.end();
}

stack_status provision_run::status(std::string_view stack) const {
  std::lock_guard lock{ mutex_ };
  auto const it{ entries_.find(stack) };
  if (it == entries_.end()) {
    throw std::runtime_error("provision_run: unknown stack '" + std::string(stack) + "'");
  }
  return it->second.status;
}

bool provision_run::cancel_requested(std::string_view stack) const {
  if (token_ && token_->requested()) { return true; }
  std::lock_guard lock{ mutex_ };
  auto const it{ entries_.find(stack) };
  return it != entries_.end() && it->second.cancel_flag;
}

void provision_run::set_status(std::string const &stack, entry &e, stack_status status) {
  e.status = status;
  auto const name{ std::string(stack_status_name(status)) };

  switch (status) {
    case stack_status::running: tui::info("[%s] applying", stack.c_str()); break;
    case stack_status::succeeded:
      tui::info("[%s] succeeded: %s", stack.c_str(), e.detail.c_str());
      break;
    case stack_status::failed:
      tui::error("[%s] failed: %s", stack.c_str(), e.detail.c_str());
      break;
    case stack_status::cancelled:
    case stack_status::skipped:
      tui::warn("[%s] %s: %s", stack.c_str(), name.c_str(), e.detail.c_str());
      break;
    case stack_status::pending: break;
  }

  STRATA_TRACE_STACK_STATUS(id_, stack, name, e.detail);
}

bool provision_run::try_start(std::string const &stack) {
  std::lock_guard lock{ mutex_ };
  auto &e{ entries_.at(stack) };
  if (e.status != stack_status::pending) { return false; }

  if (e.cancel_flag || (token_ && token_->requested())) {
    e.detail = "cancelled before start";
    set_status(stack, e, stack_status::cancelled);
    return false;
  }

  set_status(stack, e, stack_status::running);
  return true;
}

void provision_run::finish(std::string const &stack,
                           stack_status status,
                           std::string detail,
                           std::optional<apply_result> result) {
  std::lock_guard lock{ mutex_ };
  auto &e{ entries_.at(stack) };
  if (e.status != stack_status::running) {
    throw std::runtime_error("provision_run: finish on stack '" + stack + "' that is " +
                             std::string(stack_status_name(e.status)));
  }

  bool const cancelled{ e.cancel_flag || (token_ && token_->requested()) };
  if (status == stack_status::succeeded && cancelled) {
    status = stack_status::cancelled;
    detail = "cancellation requested during apply (" + detail + ")";
  }

  e.detail = std::move(detail);
  e.result = std::move(result);
  set_status(stack, e, status);
}

void provision_run::skip(std::string const &stack, std::string reason) {
  std::lock_guard lock{ mutex_ };
  auto &e{ entries_.at(stack) };
  if (e.status != stack_status::pending) { return; }
  e.detail = std::move(reason);
  set_status(stack, e, stack_status::skipped);
}

void provision_run::fail_pending(std::string const &stack, std::string detail) {
  std::lock_guard lock{ mutex_ };
  auto &e{ entries_.at(stack) };
  if (e.status != stack_status::pending) { return; }
  e.detail = std::move(detail);
  set_status(stack, e, stack_status::failed);
}

std::size_t provision_run::cancel(std::vector<std::string> const &names) {
  std::lock_guard lock{ mutex_ };

  std::size_t affected{ 0 };
  for (auto &[stack, e] : entries_) {
    if (!names.empty() && std::find(names.begin(), names.end(), stack) == names.end()) {
      continue;
    }

    if (e.status == stack_status::pending) {
      STRATA_TRACE_CANCEL_REQUESTED(id_, stack, stack_status_name(e.status));
      e.cancel_flag = true;
      e.detail = "cancelled before start";
      set_status(stack, e, stack_status::cancelled);
      ++affected;
    } else if (e.status == stack_status::running) {
      STRATA_TRACE_CANCEL_REQUESTED(id_, stack, stack_status_name(e.status));
      if (!e.cancel_flag) {
        e.cancel_flag = true;
        tui::warn("[%s] cancellation requested", stack.c_str());
      }
      ++affected;
    }
  }
  return affected;
}

void provision_run::cancel_pending(std::string const &reason) {
  std::lock_guard lock{ mutex_ };
  for (auto &[stack, e] : entries_) {
    if (e.status != stack_status::pending) { continue; }
    e.cancel_flag = true;
    e.detail = reason;
    set_status(stack, e, stack_status::cancelled);
  }
}

run_phase provision_run::settle() {
  run_phase final_phase{ run_phase::completed };
  {
    std::lock_guard lock{ mutex_ };
    bool any_failed{ false };
    bool all_succeeded{ true };
    for (auto const &[stack, e] : entries_) {
      if (e.status == stack_status::failed) { any_failed = true; }
      if (e.status != stack_status::succeeded) { all_succeeded = false; }
    }
    if (any_failed) {
      final_phase = run_phase::failed;
    } else if (!all_succeeded) {
      final_phase = run_phase::cancelled;
    }
  }
  set_phase(final_phase);
  return final_phase;
}

provision_report provision_run::report() const {
  std::lock_guard lock{ mutex_ };

  provision_report r;
  r.run_id = id_;
  r.phase = phase_;
  for (auto const &s : stacks_) {
    auto const &e{ entries_.at(s.name) };
    r.stacks.push_back(stack_outcome{ .stack = s.name,
                                      .status = e.status,
                                      .detail = e.detail,
                                      .result = e.result });
  }
  return r;
}

}  // namespace strata
