#include "preview.h"

#include "trace.h"
#include "tui.h"

#include <algorithm>

namespace strata {

std::string_view op_kind_name(op_kind kind) {
  switch (kind) {
    case op_kind::create: return "create";
    case op_kind::update: return "update";
    case op_kind::remove: return "delete";
    case op_kind::no_op: return "no-op";
  }
  return "unknown";
}

std::size_t preview_result::count(op_kind kind) const {
  auto const it{ counts.find(kind) };
  return it == counts.end() ? 0 : it->second;
}

bool preview_result::has_changes() const {
  return count(op_kind::create) + count(op_kind::update) + count(op_kind::remove) > 0;
}

std::string preview_summary(std::string_view stack,
                            std::map<op_kind, std::size_t> const &counts) {
  std::string body;
  for (auto const kind : { op_kind::create, op_kind::update, op_kind::remove }) {
    auto const it{ counts.find(kind) };
    if (it == counts.end() || it->second == 0) { continue; }
    if (!body.empty()) { body += ", "; }
    body += std::to_string(it->second) + " to " + std::string(op_kind_name(kind));
  }
  return std::string(stack) + ": " + (body.empty() ? std::string{ "no changes" } : body);
}

preview_result preview_diff(stack_spec const &desired, observed_state const &observed) {
  preview_result result;
  result.stack = desired.name;
  for (auto const kind : kOpKinds) { result.counts[kind] = 0; }

  std::map<std::string, observed_resource const *> current;
  for (auto const &r : observed.resources) { current.emplace(r.key(), &r); }

  std::map<std::string, resource_change> changes;
  for (auto const &r : desired.resources) {
    auto const it{ current.find(r.key()) };
    op_kind op{ op_kind::create };
    if (it != current.end()) {
      op = it->second->fingerprint == resource_fingerprint(r) ? op_kind::no_op
                                                              : op_kind::update;
    }
    changes.emplace(r.key(), resource_change{ op, r.type, r.name });
  }

  for (auto const &[key, r] : current) {
    if (!changes.contains(key)) {
      changes.emplace(key, resource_change{ op_kind::remove, r->type, r->name });
    }
  }

  for (auto &[key, change] : changes) {
    ++result.counts[change.op];
    result.changes.push_back(std::move(change));
  }

  result.summary = preview_summary(result.stack, result.counts);
  return result;
}

std::vector<preview_result> preview_stacks(std::vector<stack_spec> const &stacks,
                                           provider_set const &providers,
                                           observed_cache_t const *refreshed) {
  std::vector<preview_result> results;
  results.reserve(stacks.size());

  for (auto const &stack : stacks) {
    observed_state observed;
    bool cached{ false };
    if (refreshed) {
      if (auto const it{ refreshed->find(stack.name) }; it != refreshed->end()) {
        observed = it->second;
        cached = true;
      }
    }
    if (!cached) { observed = provider_query_state(providers.for_stack(stack), stack); }

    auto result{ preview_diff(stack, observed) };
    STRATA_TRACE_PREVIEW_COMPUTED(result.stack,
                                  result.count(op_kind::create),
                                  result.count(op_kind::update),
                                  result.count(op_kind::remove),
                                  result.count(op_kind::no_op));
    tui::debug("%s", result.summary.c_str());
    results.push_back(std::move(result));
  }

  return results;
}

}  // namespace strata
