#include "secret_store.h"

#include "cipher.h"
#include "errors.h"
#include "placeholders.h"
#include "platform.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace strata {

namespace {

constexpr char kSecretNamespace[]{ "secret" };

bool secret_name_valid(std::string_view name) {
  if (name.empty()) { return false; }
  if (!std::isalpha(static_cast<unsigned char>(name.front())) && name.front() != '_') {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

template <typename Map>
std::string resolve_with(Map const &secrets, std::string_view text) {
  return placeholders_expand(text, kSecretNamespace, [&](std::string_view name) {
    auto const it{ secrets.find(name) };
    if (it == secrets.end()) {
      throw credential_error(error_kind::missing_secret,
                             "unknown secret '" + std::string(name) + "'");
    }
    return it->second;
  });
}

std::vector<std::filesystem::path> find_bundles(std::filesystem::path const &stacks_root) {
  namespace fs = std::filesystem;

  std::vector<fs::path> bundles;
  if (!fs::is_directory(stacks_root)) { return bundles; }

  for (auto const &entry : fs::recursive_directory_iterator(stacks_root)) {
    if (entry.is_regular_file() && entry.path().extension() == kSecretBundleExtension) {
      bundles.push_back(entry.path());
    }
  }
  std::sort(bundles.begin(), bundles.end());
  return bundles;
}

// Decrypts and parses one bundle. Plaintext buffers are wiped before return.
std::vector<std::pair<std::string, std::string>> open_bundle(
    profile const &prof,
    std::string const &profile_name,
    std::filesystem::path const &path) {
  auto const sealed{ util_load_file(path) };

  std::vector<unsigned char> plaintext;
  try {
    plaintext = cipher_open(prof.key, profile_name, sealed);
  } catch (credential_error const &e) {
    throw credential_error(e.kind(), path.string() + ": " + e.what());
  }

  std::string text{ plaintext.begin(), plaintext.end() };
  cipher_zeroize(plaintext.data(), plaintext.size());

  std::vector<std::pair<std::string, std::string>> entries;
  try {
    entries = secret_store_parse_plaintext(text, path.string());
  } catch (...) {
    cipher_zeroize(text.data(), text.size());
    throw;
  }
  cipher_zeroize(text.data(), text.size());
  return entries;
}

void wipe_entries(std::vector<std::pair<std::string, std::string>> &entries) {
  for (auto &[name, value] : entries) { cipher_zeroize(value.data(), value.size()); }
  entries.clear();
}

}  // namespace

std::vector<std::pair<std::string, std::string>> secret_store_parse_plaintext(
    std::string_view text,
    std::string const &source) {
  std::vector<std::pair<std::string, std::string>> entries;

  std::size_t line_no{ 0 };
  for (auto const raw : util_split_lines(text)) {
    ++line_no;
    auto const line{ util_trim(raw) };
    if (line.empty() || line.front() == '#') { continue; }

    auto const eq{ line.find('=') };
    auto const name{ eq == std::string_view::npos ? std::string_view{}
                                                  : util_trim(line.substr(0, eq)) };
    if (!secret_name_valid(name)) {
      throw config_error(error_kind::parse_error,
                         source + ":" + std::to_string(line_no) + ": expected NAME=value");
    }

    entries.emplace_back(std::string(name), std::string(util_trim(line.substr(eq + 1))));
  }
  return entries;
}

std::optional<std::string> secret_view::get(std::string_view name) const {
  if (auto const it{ secrets_->find(name) }; it != secrets_->end()) { return it->second; }
  return std::nullopt;
}

std::vector<std::string> secret_view::names() const {
  std::vector<std::string> out;
  out.reserve(secrets_->size());
  for (auto const &[name, value] : *secrets_) { out.push_back(name); }
  return out;
}

std::string secret_view::resolve_placeholders(std::string_view text) const {
  return resolve_with(*secrets_, text);
}

credential_map_t secret_view::provider_credentials(std::string_view provider) const {
  auto const it{ profile_->providers.find(std::string(provider)) };
  if (it == profile_->providers.end()) {
    throw config_error("profile '" + profile_->name + "' has no PROVIDERS entry for '" +
                       std::string(provider) + "'");
  }

  credential_map_t resolved;
  for (auto const &[key, value] : it->second) {
    resolved.emplace(key, resolve_with(*secrets_, value));
  }
  return resolved;
}

secret_store::secret_store(std::filesystem::path root, std::string profile_name)
    : root_{ std::move(root) }, profile_name_{ std::move(profile_name) } {}

secret_store::~secret_store() {
  for (auto &[stacks_root, secrets] : secrets_) { wipe(secrets); }
  if (profile_) { cipher_zeroize(profile_->key.data(), profile_->key.size()); }
}

void secret_store::wipe(secret_map_t &secrets) {
  for (auto &[name, value] : secrets) { cipher_zeroize(value.data(), value.size()); }
  secrets.clear();
}

profile const &secret_store::require_profile() const {
  if (!profile_) {
    throw std::runtime_error("secret_store: profile '" + profile_name_ + "' not loaded");
  }
  return *profile_;
}

void secret_store::read_profile_config() {
  std::lock_guard lock{ mutex_ };
  if (profile_) { return; }
  profile_ = profile_load(root_, profile_name_);
}

secret_view secret_store::read_secret_files(std::filesystem::path const &stacks_root) {
  read_profile_config();

  std::lock_guard lock{ mutex_ };
  if (auto const it{ secrets_.find(stacks_root) }; it != secrets_.end()) {
    return secret_view{ *profile_, it->first, it->second };
  }

  secret_map_t staged;
  std::map<std::string, std::filesystem::path> origin;
  try {
    for (auto const &path : find_bundles(stacks_root)) {
      auto entries{ open_bundle(*profile_, profile_name_, path) };
      std::size_t const count{ entries.size() };

      for (auto &[name, value] : entries) {
        if (auto const prior{ origin.find(name) }; prior != origin.end()) {
          std::string msg{ "duplicate secret '" + name + "' in " + path.string() +
                           " (already defined in " + prior->second.string() + ")" };
          wipe_entries(entries);
          throw config_error(std::move(msg));
        }
        origin.emplace(name, path);
        staged.emplace(name, std::move(value));
      }
      wipe_entries(entries);

      tui::debug("Decrypted %zu secret(s) from %s", count, path.string().c_str());
      STRATA_TRACE_SECRET_BUNDLE_DECRYPTED(path.string(), count);
    }
  } catch (...) {
    wipe(staged);
    throw;
  }

  auto const it{ secrets_.emplace(stacks_root, std::move(staged)).first };
  return secret_view{ *profile_, it->first, it->second };
}

profile const &secret_store::loaded_profile() const {
  std::lock_guard lock{ mutex_ };
  return require_profile();
}

void secret_store::encrypt_bundle(std::string_view plaintext,
                                  std::filesystem::path const &out_path) const {
  auto const entries{ secret_store_parse_plaintext(plaintext, "<plaintext>") };
  if (entries.empty()) { throw config_error("refusing to encrypt an empty secret bundle"); }

  std::vector<unsigned char> sealed;
  {
    std::lock_guard lock{ mutex_ };
    sealed = cipher_seal(require_profile().key, profile_name_, plaintext.data(),
                         plaintext.size());
  }

  if (out_path.has_parent_path()) {
    std::filesystem::create_directories(out_path.parent_path());
  }
  util_write_file_atomic(out_path, sealed.data(), sealed.size());
  tui::info("Encrypted %zu secret(s) to %s", entries.size(), out_path.string().c_str());
}

std::size_t secret_store::remove_secret(std::filesystem::path const &bundle_path,
                                       std::string_view name) const {
  std::lock_guard lock{ mutex_ };
  auto const &prof{ require_profile() };

  auto entries{ open_bundle(prof, profile_name_, bundle_path) };
  auto const it{ std::find_if(entries.begin(), entries.end(), [&](auto const &e) {
    return e.first == name;
  }) };
  if (it == entries.end()) {
    wipe_entries(entries);
    throw credential_error(error_kind::missing_secret,
                           "secret '" + std::string(name) + "' not found in " +
                               bundle_path.string());
  }
  cipher_zeroize(it->second.data(), it->second.size());
  entries.erase(it);

  if (entries.empty()) {
    std::filesystem::remove(bundle_path);
    tui::info("Removed '%.*s'; deleted empty bundle %s",
              static_cast<int>(name.size()),
              name.data(),
              bundle_path.string().c_str());
    return 0;
  }

  std::string text;
  for (auto const &[key, value] : entries) { text += key + "=" + value + "\n"; }
  std::size_t const remaining{ entries.size() };
  wipe_entries(entries);

  std::vector<unsigned char> sealed;
  try {
    sealed = cipher_seal(prof.key, profile_name_, text.data(), text.size());
  } catch (...) {
    cipher_zeroize(text.data(), text.size());
    throw;
  }
  cipher_zeroize(text.data(), text.size());

  util_write_file_atomic(bundle_path, sealed.data(), sealed.size());
  tui::info("Removed '%.*s' from %s (%zu remaining)",
            static_cast<int>(name.size()),
            name.data(),
            bundle_path.string().c_str(),
            remaining);
  return remaining;
}

std::filesystem::path secret_store::generate_profile(std::filesystem::path const &root,
                                                     std::string const &profile_name) {
  if (!profile_name_valid(profile_name)) {
    throw config_error(error_kind::invalid_params,
                       "invalid profile name '" + profile_name +
                           "' (letters, digits, '-' and '_' only)");
  }

  auto const cfg_path{ profile_config_path(root, profile_name) };
  auto const key_path{ cfg_path.parent_path() / (profile_name + ".key") };

  for (auto const &p : { cfg_path, key_path }) {
    if (std::filesystem::exists(p)) {
      throw config_error("refusing to overwrite existing " + p.string());
    }
  }

  std::filesystem::create_directories(cfg_path.parent_path());

  auto key{ cipher_generate_key() };
  auto key_hex{ util_bytes_to_hex(key.data(), key.size()) + "\n" };
  platform::create_private_file(key_path, key_hex.data(), key_hex.size());
  cipher_zeroize(key_hex.data(), key_hex.size());

  std::string const cfg{ "-- strata profile '" + profile_name +
                         "'\n"
                         "KEY_PATH = \"" +
                         profile_name +
                         ".key\"\n"
                         "\n"
                         "PROVIDERS = {\n"
                         "  fs = { state_dir = \".strata/state/" +
                         profile_name +
                         "\" },\n"
                         "}\n" };
  util_write_file_atomic(cfg_path, cfg.data(), cfg.size());

  tui::info("Created profile '%s' (key %s)",
            profile_name.c_str(),
            cipher_key_id(key).c_str());
  cipher_zeroize(key.data(), key.size());
  return cfg_path;
}

}  // namespace strata
