#include "fs_provider.h"

#include "errors.h"
#include "platform.h"
#include "tui.h"

#include <algorithm>
#include <map>
#include <sstream>
#include <stdexcept>

namespace strata {

namespace {

using state_map_t = std::map<std::string, observed_resource>;

state_map_t to_map(observed_state const &state) {
  state_map_t out;
  for (auto const &r : state.resources) { out.emplace(r.key(), r); }
  return out;
}

observed_state from_map(state_map_t const &m) {
  observed_state out;
  for (auto const &[key, r] : m) { out.resources.push_back(r); }
  return out;
}

observed_state read_state(std::filesystem::path const &path) {
  if (!std::filesystem::exists(path)) { return {}; }
  auto const bytes{ util_load_file(path) };
  return fs_provider_parse_state(
      std::string_view{ reinterpret_cast<char const *>(bytes.data()), bytes.size() },
      path.string());
}

void write_state(std::filesystem::path const &path, state_map_t const &state) {
  auto const text{ fs_provider_format_state(from_map(state)) };
  util_write_file_atomic(path, text.data(), text.size());
}

}  // namespace

observed_state fs_provider_parse_state(std::string_view text, std::string const &source) {
  observed_state state;

  std::size_t line_no{ 0 };
  for (auto const raw : util_split_lines(text)) {
    ++line_no;
    auto const line{ util_trim(raw) };
    if (line.empty()) { continue; }

    std::istringstream iss{ std::string(line) };
    observed_resource r;
    std::string extra;
    if (!(iss >> r.type >> r.name >> r.fingerprint) || (iss >> extra)) {
      throw std::runtime_error(source + ":" + std::to_string(line_no) +
                               ": expected 'type name fingerprint'");
    }
    if (r.type.find('/') != std::string::npos || r.name.find('/') != std::string::npos) {
      throw std::runtime_error(source + ":" + std::to_string(line_no) +
                               ": resource type and name must not contain '/'");
    }
    state.resources.push_back(std::move(r));
  }

  std::sort(state.resources.begin(),
            state.resources.end(),
            [](observed_resource const &a, observed_resource const &b) {
              return a.key() < b.key();
            });
  return state;
}

std::string fs_provider_format_state(observed_state const &state) {
  std::string out;
  for (auto const &r : state.resources) {
    out += r.type + " " + r.name + " " + r.fingerprint + "\n";
  }
  return out;
}

fs_provider::fs_provider(provider_init const &init) {
  auto const it{ init.credentials.find("state_dir") };
  if (it == init.credentials.end() || it->second.empty()) {
    throw config_error("provider 'fs': state_dir is required");
  }

  std::filesystem::path dir{ platform::expand_path(it->second) };
  state_dir_ = dir.is_relative() ? init.root / dir : dir;
}

std::filesystem::path fs_provider::state_path(std::string const &stack) const {
  return state_dir_ / (stack + ".state");
}

observed_state fs_provider::query_state(stack_spec const &stack) {
  return read_state(state_path(stack.name));
}

apply_result fs_provider::apply(stack_spec const &stack, apply_ctx &ctx) {
  std::filesystem::create_directories(state_dir_);

  auto const path{ state_path(stack.name) };
  auto path_lock{ path };
  path_lock += ".lock";
  platform::file_lock lock{ path_lock };

  auto state{ to_map(read_state(path)) };

  std::map<std::string, resource_spec const *> desired;
  for (auto const &r : stack.resources) { desired.emplace(r.key(), &r); }

  apply_result result;
  for (auto const &[key, spec] : desired) {
    auto const fingerprint{ resource_fingerprint(*spec) };
    auto const it{ state.find(key) };
    if (it != state.end() && it->second.fingerprint == fingerprint) {
      ++result.unchanged;
      continue;
    }

    ctx.checkpoint();
    bool const create{ it == state.end() };
    state[key] = observed_resource{ spec->type, spec->name, fingerprint };
    write_state(path, state);
    ++(create ? result.created : result.updated);
    tui::debug("fs: %s %s in stack %s", create ? "created" : "updated", key.c_str(),
               stack.name.c_str());
  }

  for (auto it{ state.begin() }; it != state.end();) {
    if (desired.contains(it->first)) {
      ++it;
      continue;
    }

    ctx.checkpoint();
    auto const key{ it->first };
    it = state.erase(it);
    write_state(path, state);
    ++result.deleted;
    tui::debug("fs: deleted %s in stack %s", key.c_str(), stack.name.c_str());
  }

  if (!std::filesystem::exists(path)) { write_state(path, state); }
  return result;
}

}  // namespace strata
