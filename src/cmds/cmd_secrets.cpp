#include "cmd_secrets.h"

#include "cipher.h"
#include "cmd_common.h"
#include "orchestrator.h"
#include "secret_store.h"
#include "tui.h"
#include "util.h"
#include "workspace.h"

#include <filesystem>
#include <string>

namespace strata {

namespace fs = std::filesystem;

cmd_secrets::cmd_secrets(cfg cfg, cmd_globals globals)
    : cfg_{ std::move(cfg) }, globals_{ std::move(globals) } {}

bool cmd_secrets::execute() {
  switch (cfg_.act) {
    case action::init: do_init(); break;
    case action::encrypt: do_encrypt(); break;
    case action::list: do_list(); break;
    case action::remove: do_remove(); break;
  }
  return true;
}

void cmd_secrets::do_init() const {
  // A fresh workspace has no .strata yet, so fall back to the current directory.
  fs::path root;
  if (globals_.root) {
    root = workspace_resolve_root(globals_.root);
  } else if (auto found{ workspace_find_root(fs::current_path()) }) {
    root = *found;
  } else {
    root = fs::current_path();
  }

  auto const cfg_path{ secret_store::generate_profile(root, globals_.profile) };
  tui::info("Edit %s to configure providers", cfg_path.string().c_str());
}

void cmd_secrets::do_encrypt() const {
  secret_store store{ workspace_resolve_root(globals_.root), globals_.profile };
  store.read_profile_config();

  auto bytes{ util_load_file(cfg_.input) };
  std::string plaintext(reinterpret_cast<char const *>(bytes.data()), bytes.size());
  cipher_zeroize(bytes.data(), bytes.size());

  try {
    store.encrypt_bundle(plaintext, cfg_.output);
  } catch (...) {
    cipher_zeroize(plaintext.data(), plaintext.size());
    throw;
  }
  cipher_zeroize(plaintext.data(), plaintext.size());

  tui::info("Sealed %s -> %s (key %s)",
            cfg_.input.string().c_str(),
            cfg_.output.string().c_str(),
            store.loaded_profile().key_id.c_str());
}

void cmd_secrets::do_list() const {
  orchestrator orch;
  orch.init(cmd_make_init_params(globals_));

  auto const stacks_root{ orch.stacks_root(provision_params{ {}, {}, cfg_.stacks_dir }) };
  auto const secrets{ orch.secrets().read_secret_files(stacks_root) };
  for (auto const &name : secrets.names()) { tui::print_stdout("%s\n", name.c_str()); }
}

void cmd_secrets::do_remove() const {
  secret_store store{ workspace_resolve_root(globals_.root), globals_.profile };
  store.read_profile_config();
  (void)store.remove_secret(cfg_.bundle, cfg_.name);
}

}  // namespace strata
