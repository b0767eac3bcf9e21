#pragma once

#include "profile.h"
#include "util.h"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

inline constexpr char kSecretBundleExtension[]{ ".secrets" };

using secret_map_t = std::map<std::string, std::string, std::less<>>;

// Secrets decrypted from one stacks root, bound to the profile they were read
// under. The underlying map is published once and never changes, so a view
// stays valid and consistent for the lifetime of the store that produced it.
class secret_view {
 public:
  std::filesystem::path const &stacks_root() const { return *stacks_root_; }

  std::optional<std::string> get(std::string_view name) const;
  std::vector<std::string> names() const;  // sorted

  // Substitute ${secret:NAME}; unknown names throw credential_error.
  std::string resolve_placeholders(std::string_view text) const;

  // The profile's PROVIDERS entry with secret placeholders resolved. Unknown
  // provider is a config_error.
  credential_map_t provider_credentials(std::string_view provider) const;

 private:
  friend class secret_store;
  secret_view(profile const &prof,
              std::filesystem::path const &stacks_root,
              secret_map_t const &secrets)
      : profile_{ &prof }, stacks_root_{ &stacks_root }, secrets_{ &secrets } {}

  profile const *profile_;
  std::filesystem::path const *stacks_root_;
  secret_map_t const *secrets_;
};

// Profile key material plus the decrypted contents of the secret bundles under
// each stacks root read so far. Plaintext is held in memory only and wiped on
// destruction.
class secret_store : unmovable {
 public:
  secret_store(std::filesystem::path root, std::string profile_name);
  ~secret_store();

  std::string const &profile_name() const { return profile_name_; }

  // Loads once; later calls are no-ops.
  void read_profile_config();

  // Decrypts every *.secrets file below stacks_root. All-or-nothing: a failure
  // publishes nothing for that root and leaves other roots untouched. A root
  // is decrypted at most once; later calls return the same view.
  secret_view read_secret_files(std::filesystem::path const &stacks_root);

  profile const &loaded_profile() const;

  // Seal plaintext (NAME=value lines, validated first) under the loaded
  // profile's key and atomically write it to out_path.
  void encrypt_bundle(std::string_view plaintext,
                      std::filesystem::path const &out_path) const;

  // Remove one secret from a bundle and reseal the rest in place; a bundle
  // left empty is deleted. Unknown names throw credential_error
  // (missing_secret). Returns the number of secrets remaining. Views already
  // published keep the contents they were read with.
  std::size_t remove_secret(std::filesystem::path const &bundle_path,
                            std::string_view name) const;

  // Create <root>/.strata/<name>.key (0600) and cfg.<name>.lua referencing
  // it. Refuses to overwrite either file. Returns the config path.
  static std::filesystem::path generate_profile(std::filesystem::path const &root,
                                                std::string const &profile_name);

 private:
  static void wipe(secret_map_t &secrets);
  profile const &require_profile() const;  // caller holds mutex_

  std::filesystem::path root_;
  std::string profile_name_;

  mutable std::mutex mutex_;
  std::optional<profile> profile_;
  std::map<std::filesystem::path, secret_map_t> secrets_;  // by stacks root
};

// Parse NAME=value lines. Blank lines and lines starting with '#' are
// ignored. Throws config_error(parse_error) naming source and line.
std::vector<std::pair<std::string, std::string>> secret_store_parse_plaintext(
    std::string_view text,
    std::string const &source);

}  // namespace strata
