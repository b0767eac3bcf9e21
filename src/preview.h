#pragma once

#include "provider.h"
#include "stack_spec.h"

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

enum class op_kind { create, update, remove, no_op };

inline constexpr std::array<op_kind, 4> kOpKinds{ op_kind::create,
                                                  op_kind::update,
                                                  op_kind::remove,
                                                  op_kind::no_op };

std::string_view op_kind_name(op_kind kind);  // "create", "update", "delete", "no-op"

struct resource_change {
  op_kind op;
  std::string type;
  std::string name;

  bool operator==(resource_change const &) const = default;
};

struct preview_result {
  std::string stack;
  std::map<op_kind, std::size_t> counts;  // every kind present
  std::vector<resource_change> changes;   // sorted by type/name, no-ops included
  std::string summary;

  std::size_t count(op_kind kind) const;
  bool has_changes() const;

  bool operator==(preview_result const &) const = default;
};

// "<stack>: N to create, N to update, N to delete" listing only non-zero kinds,
// or "<stack>: no changes".
std::string preview_summary(std::string_view stack,
                            std::map<op_kind, std::size_t> const &counts);

// Pure classification of desired against observed resources by fingerprint.
preview_result preview_diff(stack_spec const &desired, observed_state const &observed);

using observed_cache_t = std::map<std::string, observed_state>;

// One result per stack in input order. Stacks found in refreshed use that
// state; the rest are queried from their provider. Never mutates anything.
// Throws provider_error(provider_query_error) if state cannot be read.
std::vector<preview_result> preview_stacks(std::vector<stack_spec> const &stacks,
                                           provider_set const &providers,
                                           observed_cache_t const *refreshed = nullptr);

}  // namespace strata
