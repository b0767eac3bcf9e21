#pragma once

#include "cmd.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata {

class cmd_outputs : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_outputs> {
    std::vector<std::string> stacks;
    std::optional<std::filesystem::path> stacks_dir;
  };

  cmd_outputs(cfg cfg, cmd_globals globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace strata
