#pragma once

#include "cmd.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata {

class cmd_destroy : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_destroy> {
    std::vector<std::string> stacks;
    std::optional<std::filesystem::path> stacks_dir;
    bool skip_refresh{ false };
    bool skip_preview{ false };
    bool yes{ false };
    std::size_t jobs{ 0 };
  };

  cmd_destroy(cfg cfg, cmd_globals globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace strata
