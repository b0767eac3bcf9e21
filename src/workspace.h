#pragma once

#include <filesystem>
#include <optional>

namespace strata {

// Walk up from start to the first directory containing .git or .strata.
std::optional<std::filesystem::path> workspace_find_root(std::filesystem::path const &start);

// Explicit root if given (must exist), otherwise discovery from the current
// directory. Throws config_error when neither yields a directory.
std::filesystem::path workspace_resolve_root(
    std::optional<std::filesystem::path> const &explicit_root);

}  // namespace strata
