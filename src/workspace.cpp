#include "workspace.h"

#include "errors.h"
#include "tui.h"

namespace strata {

std::optional<std::filesystem::path> workspace_find_root(std::filesystem::path const &start) {
  namespace fs = std::filesystem;

  std::error_code ec;
  auto cur{ fs::weakly_canonical(fs::absolute(start), ec) };
  if (ec) { cur = fs::absolute(start); }

  for (;;) {
    if (fs::is_directory(cur / ".strata", ec)) { return cur; }
    if (fs::exists(cur / ".git", ec)) { return cur; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

std::filesystem::path workspace_resolve_root(
    std::optional<std::filesystem::path> const &explicit_root) {
  if (explicit_root) {
    auto const path{ std::filesystem::absolute(*explicit_root) };
    if (!std::filesystem::is_directory(path)) {
      throw config_error("project root not found: " + path.string());
    }
    return path;
  }

  if (auto const discovered{ workspace_find_root(std::filesystem::current_path()) }) {
    tui::debug("Discovered project root: %s", discovered->string().c_str());
    return *discovered;
  }
  throw config_error(
      "project root not found (no .strata or .git above the current directory); "
      "pass --root");
}

}  // namespace strata
