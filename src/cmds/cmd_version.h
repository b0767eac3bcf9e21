#pragma once

#include "cmd.h"

namespace strata {

class cmd_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_version> {};

  cmd_version(cfg cfg, cmd_globals globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace strata
