#pragma once

#include "provider.h"

#include <filesystem>
#include <string_view>

namespace strata {

inline constexpr std::string_view kFsProviderName{ "fs" };

// Local provider that records managed resources in
// <state_dir>/<stack>.state, one "type name fingerprint" line per resource.
// Only fingerprints are persisted, never property values. State is rewritten
// atomically after every resource operation, so a cancelled or failed apply
// leaves a consistent record of what was done.
//
// Credentials: state_dir (required; relative paths resolve against the
// project root).
class fs_provider : public provider {
 public:
  explicit fs_provider(provider_init const &init);

  std::string_view name() const override { return kFsProviderName; }
  observed_state query_state(stack_spec const &stack) override;
  apply_result apply(stack_spec const &stack, apply_ctx &ctx) override;

  std::filesystem::path const &state_dir() const { return state_dir_; }
  std::filesystem::path state_path(std::string const &stack) const;

 private:
  std::filesystem::path state_dir_;
};

observed_state fs_provider_parse_state(std::string_view text, std::string const &source);
std::string fs_provider_format_state(observed_state const &state);

}  // namespace strata
