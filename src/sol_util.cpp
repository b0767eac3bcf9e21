#include "sol_util.h"

namespace strata {

namespace {

std::string scalar_to_string(sol::object const &value,
                             std::string const &where,
                             std::string_view context) {
  switch (value.get_type()) {
    case sol::type::string: return value.as<std::string>();
    case sol::type::boolean: return value.as<bool>() ? "true" : "false";
    case sol::type::number: {
      double const d{ value.as<double>() };
      auto const i{ static_cast<long long>(d) };
      if (static_cast<double>(i) == d) { return std::to_string(i); }
      return std::to_string(d);
    }
    default:
      throw std::runtime_error(std::string(context) + ": " + where +
                               " must be a string, number or boolean");
  }
}

}  // namespace

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::string,
                      sol::lib::table,
                      sol::lib::math,
                      sol::lib::os);
  return lua;
}

std::optional<std::string> sol_util_run_file(sol::state &lua,
                                             std::filesystem::path const &path) {
  sol::protected_function_result const result{
    lua.safe_script_file(path.string(), sol::script_pass_on_error)
  };
  if (result.valid()) { return std::nullopt; }
  sol::error err = result;
  return std::string{ err.what() };
}

std::vector<std::string> sol_util_get_string_array(sol::table const &table,
                                                   std::string_view key,
                                                   std::string_view context) {
  std::vector<std::string> out;
  auto const arr{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!arr) { return out; }

  sol::table entries{ *arr };
  for (size_t i{ 1 }; i <= entries.size(); ++i) {
    sol::object const entry = entries[i];
    if (entry.get_type() != sol::type::string) {
      throw std::runtime_error(std::string(context) + ": " + std::string(key) + "[" +
                               std::to_string(i) + "] must be a string");
    }
    out.push_back(entry.as<std::string>());
  }
  return out;
}

std::map<std::string, std::string> sol_util_get_string_map(sol::table const &table,
                                                           std::string_view key,
                                                           std::string_view context) {
  std::map<std::string, std::string> out;
  auto const tbl{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!tbl) { return out; }

  for (auto const &[k, v] : *tbl) {
    if (k.get_type() != sol::type::string) {
      throw std::runtime_error(std::string(context) + ": " + std::string(key) +
                               " keys must be strings");
    }
    auto const name{ k.as<std::string>() };
    out.emplace(name, scalar_to_string(v, std::string(key) + "." + name, context));
  }
  return out;
}

}  // namespace strata
