#pragma once

#include "cmd.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata {

class cmd_preview : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_preview> {
    std::vector<std::string> stacks;
    std::optional<std::filesystem::path> stacks_dir;
    bool skip_refresh{ false };
  };

  cmd_preview(cfg cfg, cmd_globals globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace strata
