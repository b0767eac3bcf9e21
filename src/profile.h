#pragma once

#include "cipher.h"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace strata {

using credential_map_t = std::map<std::string, std::string>;

// Per-profile configuration, loaded from <root>/.strata/cfg.<name>.lua:
//
//   KEY_PATH = "dev.key"                  -- or KEY = "<64 hex chars>", not both
//   STACKS_DIR = "infra/stacks"           -- optional, relative to the root
//   PROVIDERS = {
//     fs = { state_dir = ".strata/state/dev", token = "${secret:FS_TOKEN}" },
//   }
//
// KEY_PATH expands ~ and $VAR and is resolved relative to the config file.
struct profile {
  std::string name;
  std::filesystem::path config_path;
  cipher_key_t key{};
  std::string key_id;
  std::map<std::string, credential_map_t> providers;
  std::optional<std::filesystem::path> stacks_dir;
};

inline constexpr char kProfileDir[]{ ".strata" };

bool profile_name_valid(std::string_view name);

std::filesystem::path profile_config_path(std::filesystem::path const &root,
                                          std::string_view name);

// Throws credential_error (profile_not_found, key_load_error) or
// config_error (parse_error) naming the file.
profile profile_load(std::filesystem::path const &root, std::string_view name);

}  // namespace strata
