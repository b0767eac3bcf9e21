#pragma once

#include "cmd.h"

#include <filesystem>
#include <optional>
#include <string>

namespace strata {

class cmd_secrets : public cmd {
 public:
  enum class action { init, encrypt, list, remove };

  struct cfg : cmd_cfg<cmd_secrets> {
    action act{ action::list };
    std::filesystem::path input;   // encrypt: plaintext NAME=value file
    std::filesystem::path output;  // encrypt: sealed bundle destination
    std::optional<std::filesystem::path> stacks_dir;  // list
    std::filesystem::path bundle;  // remove: sealed bundle to edit
    std::string name;              // remove: secret to drop
  };

  cmd_secrets(cfg cfg, cmd_globals globals);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  void do_init() const;
  void do_encrypt() const;
  void do_list() const;
  void do_remove() const;

  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace strata
