#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace strata {

inline constexpr char kStackFileName[]{ "stack.lua" };

struct resource_spec {
  std::string type;
  std::string name;
  std::map<std::string, std::string> properties;

  // Unambiguous: type and name never contain '/'.
  std::string key() const { return type + "/" + name; }
  bool operator==(resource_spec const &) const = default;
};

// One stack, parsed from <stacks_root>/<name>/stack.lua:
//
//   DEPENDENCIES = { "network" }
//   PROVIDER = "fs"
//   RESOURCES = {
//     { type = "bucket", name = "logs", properties = { region = "eu", owner = "${stack:name}" } },
//   }
struct stack_spec {
  std::string name;
  std::filesystem::path path;  // the stack.lua file
  std::vector<std::string> dependencies;
  std::string provider;
  std::vector<resource_spec> resources;  // declaration order
};

bool stack_name_valid(std::string_view name);

// Throws config_error(parse_error) naming the file.
stack_spec stack_spec_parse(std::string const &name, std::filesystem::path const &path);

// SHA-256 of the canonical form of a resource (type, name, sorted properties).
std::string resource_fingerprint(resource_spec const &resource);

}  // namespace strata
