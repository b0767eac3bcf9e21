#pragma once

#include "stack_spec.h"

#include <filesystem>
#include <string>
#include <vector>

namespace strata {

// Every immediate subdirectory of root_dir holding a stack.lua is a stack
// named after the directory. An empty selector loads all of them; otherwise
// the named stacks plus their transitive dependencies are loaded.
//
// The result is topologically sorted (dependencies first) with ties broken by
// ascending name.
//
// Throws config_error (stack_not_found, parse_error, config) or
// dependency_cycle_error.
std::vector<stack_spec> load_stacks(std::filesystem::path const &root_dir,
                                    std::vector<std::string> const &selector);

// Names of all stack directories under root_dir, sorted. Does not parse.
std::vector<std::string> discover_stacks(std::filesystem::path const &root_dir);

// Kahn's algorithm with a name-ordered ready set. Exposed for tests.
std::vector<stack_spec> stack_loader_order(std::vector<stack_spec> stacks);

}  // namespace strata
