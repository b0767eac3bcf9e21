#pragma once

#include "util.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace strata {

// Options that precede the subcommand on the command line.
struct cmd_globals {
  std::optional<std::filesystem::path> root;
  std::string profile{ "default" };
};

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;

  // Returns false when the command ran but did not fully succeed.
  virtual bool execute() = 0;

  template <typename config>
  static ptr_t create(config const &cfg, cmd_globals const &globals);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, cmd_globals const &globals) {
  return std::make_unique<typename config::cmd_t>(cfg, globals);
}

}  // namespace strata
