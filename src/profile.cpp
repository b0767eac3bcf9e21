#include "profile.h"

#include "errors.h"
#include "platform.h"
#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace strata {

namespace {

cipher_key_t load_key_file(std::filesystem::path const &path, std::string const &ctx) {
  std::vector<unsigned char> bytes;
  try {
    bytes = util_load_file(path);
  } catch (std::exception const &e) {
    throw credential_error(error_kind::key_load_error,
                           ctx + ": cannot read key file " + path.string() + ": " +
                               e.what());
  }

  std::string text{ bytes.begin(), bytes.end() };
  cipher_zeroize(bytes.data(), bytes.size());

  try {
    auto const key{ cipher_key_from_hex(text) };
    cipher_zeroize(text.data(), text.size());
    return key;
  } catch (std::exception const &e) {
    cipher_zeroize(text.data(), text.size());
    throw credential_error(error_kind::key_load_error,
                           ctx + ": invalid key file " + path.string() + ": " + e.what());
  }
}

std::map<std::string, credential_map_t> read_providers(sol::state &lua,
                                                       std::string const &ctx) {
  std::map<std::string, credential_map_t> out;

  sol::object const providers_obj = lua["PROVIDERS"];
  if (!providers_obj.valid() || providers_obj.get_type() == sol::type::lua_nil) {
    return out;
  }
  if (providers_obj.get_type() != sol::type::table) {
    throw std::runtime_error(ctx + ": PROVIDERS must be a table");
  }

  sol::table const providers{ providers_obj.as<sol::table>() };
  for (auto const &[k, v] : providers) {
    if (k.get_type() != sol::type::string) {
      throw std::runtime_error(ctx + ": PROVIDERS keys must be provider names");
    }
    auto const name{ k.as<std::string>() };
    if (v.get_type() != sol::type::table) {
      throw std::runtime_error(ctx + ": PROVIDERS." + name + " must be a table");
    }
    out.emplace(name, sol_util_get_string_map(providers, name, ctx + ": PROVIDERS"));
  }
  return out;
}

}  // namespace

bool profile_name_valid(std::string_view name) {
  if (name.empty()) { return false; }
  for (char const c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
      return false;
    }
  }
  return true;
}

std::filesystem::path profile_config_path(std::filesystem::path const &root,
                                          std::string_view name) {
  return root / kProfileDir / ("cfg." + std::string(name) + ".lua");
}

profile profile_load(std::filesystem::path const &root, std::string_view name) {
  if (!profile_name_valid(name)) {
    throw config_error(error_kind::invalid_params,
                       "invalid profile name '" + std::string(name) +
                           "' (letters, digits, '-' and '_' only)");
  }

  auto const path{ profile_config_path(root, name) };
  if (!std::filesystem::exists(path)) {
    throw credential_error(error_kind::profile_not_found,
                           "profile '" + std::string(name) + "' not found: " +
                               path.string() + " does not exist (run 'strata secrets init')");
  }

  tui::debug("Loading profile %s from %s", std::string(name).c_str(), path.string().c_str());

  auto const ctx{ path.string() };
  auto lua{ sol_util_make_lua_state() };
  if (auto const err{ sol_util_run_file(*lua, path) }) {
    throw config_error(error_kind::parse_error, ctx + ": " + *err);
  }

  profile p;
  p.name = std::string(name);
  p.config_path = path;

  std::optional<std::string> key_hex;
  std::optional<std::string> key_path;
  try {
    sol::table const globals = lua->globals();
    key_hex = sol_util_get_optional<std::string>(globals, "KEY", ctx);
    key_path = sol_util_get_optional<std::string>(globals, "KEY_PATH", ctx);
    if (auto const dir{ sol_util_get_optional<std::string>(globals, "STACKS_DIR", ctx) }) {
      p.stacks_dir = root / platform::expand_path(*dir);
    }
    p.providers = read_providers(*lua, ctx);
  } catch (strata_error const &) {
    throw;
  } catch (std::exception const &e) {
    throw config_error(error_kind::parse_error, e.what());
  }

  if (key_hex && key_path) {
    throw credential_error(error_kind::key_load_error,
                           ctx + ": KEY and KEY_PATH are mutually exclusive");
  }

  if (key_hex) {
    try {
      p.key = cipher_key_from_hex(*key_hex);
    } catch (std::exception const &e) {
      throw credential_error(error_kind::key_load_error, ctx + ": invalid KEY: " + e.what());
    }
    cipher_zeroize(key_hex->data(), key_hex->size());
  } else if (key_path) {
    std::filesystem::path resolved;
    try {
      resolved = platform::expand_path(*key_path);
    } catch (std::exception const &e) {
      throw credential_error(error_kind::key_load_error,
                             ctx + ": cannot expand KEY_PATH: " + e.what());
    }
    if (resolved.is_relative()) { resolved = path.parent_path() / resolved; }
    p.key = load_key_file(resolved, ctx);
  } else {
    throw credential_error(error_kind::key_load_error,
                           ctx + ": no key material (set KEY or KEY_PATH)");
  }

  p.key_id = cipher_key_id(p.key);
  tui::debug("Profile %s uses key %s", p.name.c_str(), p.key_id.c_str());
  return p;
}

}  // namespace strata
