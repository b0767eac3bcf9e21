#include "stack_loader.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <deque>
#include <map>
#include <set>

namespace strata {

namespace {

std::string join(std::vector<std::string> const &names) {
  std::string out;
  for (auto const &n : names) {
    if (!out.empty()) { out += ", "; }
    out += n;
  }
  return out;
}

// Returns the members of one cycle among the stacks left over by Kahn's
// algorithm, starting from the smallest name and in dependency order.
std::vector<std::string> find_cycle(std::map<std::string, stack_spec const *> const &left) {
  std::vector<std::string> path;
  std::map<std::string, std::size_t> position;

  std::string cur{ left.begin()->first };
  for (;;) {
    if (auto const it{ position.find(cur) }; it != position.end()) {
      return { path.begin() + static_cast<std::ptrdiff_t>(it->second), path.end() };
    }
    position.emplace(cur, path.size());
    path.push_back(cur);

    // Every leftover node has at least one leftover dependency; follow the
    // smallest for determinism.
    std::string next;
    for (auto const &dep : left.at(cur)->dependencies) {
      if (left.contains(dep) && (next.empty() || dep < next)) { next = dep; }
    }
    cur = next;
  }
}

}  // namespace

std::vector<std::string> discover_stacks(std::filesystem::path const &root_dir) {
  namespace fs = std::filesystem;

  if (!fs::is_directory(root_dir)) {
    throw config_error("stacks directory not found: " + root_dir.string());
  }

  std::vector<std::string> names;
  for (auto const &entry : fs::directory_iterator(root_dir)) {
    if (!entry.is_directory()) { continue; }
    auto const name{ entry.path().filename().string() };
    if (!stack_name_valid(name)) { continue; }
    if (fs::is_regular_file(entry.path() / kStackFileName)) { names.push_back(name); }
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::vector<stack_spec> stack_loader_order(std::vector<stack_spec> stacks) {
  std::map<std::string, stack_spec const *> by_name;
  for (auto const &s : stacks) { by_name.emplace(s.name, &s); }

  std::map<std::string, std::size_t> pending_deps;
  std::map<std::string, std::vector<std::string>> dependents;
  for (auto const &s : stacks) {
    pending_deps[s.name] = s.dependencies.size();
    for (auto const &dep : s.dependencies) {
      if (dep == s.name) { throw dependency_cycle_error({ s.name }); }
      if (!by_name.contains(dep)) {
        throw config_error(error_kind::stack_not_found,
                           "stack '" + s.name + "' depends on unknown stack '" + dep + "'");
      }
      dependents[dep].push_back(s.name);
    }
  }

  std::set<std::string> ready;
  for (auto const &[name, count] : pending_deps) {
    if (count == 0) { ready.insert(name); }
  }

  std::vector<stack_spec> ordered;
  ordered.reserve(stacks.size());
  while (!ready.empty()) {
    auto const name{ *ready.begin() };
    ready.erase(ready.begin());
    ordered.push_back(*by_name.at(name));
    by_name.erase(name);

    for (auto const &dependent : dependents[name]) {
      if (--pending_deps[dependent] == 0) { ready.insert(dependent); }
    }
  }

  if (!by_name.empty()) { throw dependency_cycle_error(find_cycle(by_name)); }
  return ordered;
}

std::vector<stack_spec> load_stacks(std::filesystem::path const &root_dir,
                                    std::vector<std::string> const &selector) {
  auto const available{ discover_stacks(root_dir) };
  std::set<std::string> const available_set{ available.begin(), available.end() };

  tui::debug("Found %zu stack(s) under %s", available.size(), root_dir.string().c_str());

  std::deque<std::string> queue;
  if (selector.empty()) {
    queue.assign(available.begin(), available.end());
  } else {
    for (auto const &name : selector) {
      if (!available_set.contains(name)) {
        throw config_error(error_kind::stack_not_found,
                           "stack not found: " + name + " (available: " +
                               (available.empty() ? std::string{ "none" } : join(available)) +
                               ")");
      }
      queue.push_back(name);
    }
  }

  std::vector<stack_spec> loaded;
  std::set<std::string> seen;
  while (!queue.empty()) {
    auto const name{ queue.front() };
    queue.pop_front();
    if (!seen.insert(name).second) { continue; }

    auto const path{ root_dir / name / kStackFileName };
    auto spec{ stack_spec_parse(name, path) };
    STRATA_TRACE_STACK_LOADED(spec.name, path.string(), spec.dependencies.size());

    for (auto const &dep : spec.dependencies) {
      if (!available_set.contains(dep)) {
        throw config_error(error_kind::stack_not_found,
                           "stack '" + name + "' depends on unknown stack '" + dep + "'");
      }
      STRATA_TRACE_DEPENDENCY_ADDED(spec.name, dep);
      queue.push_back(dep);
    }
    loaded.push_back(std::move(spec));
  }

  auto ordered{ stack_loader_order(std::move(loaded)) };
  tui::debug("Loaded %zu stack(s)", ordered.size());
  return ordered;
}

}  // namespace strata
