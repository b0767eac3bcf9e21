#include "secret_store.h"

#include "cipher.h"
#include "errors.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct secret_store_fixture {
  strata::test::temp_dir tmp{ "secret-store" };
  fs::path stacks{ tmp / "stacks" };

  secret_store_fixture() {
    strata::secret_store::generate_profile(tmp.path(), "dev");
    fs::create_directories(stacks);
  }

  std::unique_ptr<strata::secret_store> make_store(std::string profile = "dev") {
    auto store{ std::make_unique<strata::secret_store>(tmp.path(), std::move(profile)) };
    store->read_profile_config();
    return store;
  }

  void seal(fs::path const &out, std::string_view plaintext) {
    make_store()->encrypt_bundle(plaintext, out);
  }
};

void expect_kind(strata::error_kind kind, auto &&fn) {
  try {
    fn();
    FAIL("expected strata_error");
  } catch (strata::strata_error const &e) {
    CHECK(e.kind() == kind);
  }
}

}  // namespace

TEST_CASE("secret_store_parse_plaintext") {
  auto const entries{ strata::secret_store_parse_plaintext(
      "# comment\n\nTOKEN = abc \r\nURL=https://x/?a=b\n", "t") };
  REQUIRE(entries.size() == 2);
  CHECK(entries[0] == std::pair<std::string, std::string>{ "TOKEN", "abc" });
  CHECK(entries[1] == std::pair<std::string, std::string>{ "URL", "https://x/?a=b" });

  CHECK_THROWS_WITH_AS(strata::secret_store_parse_plaintext("A=1\nnot a pair\n", "t"),
                       "t:2: expected NAME=value",
                       strata::config_error);
  CHECK_THROWS_AS(strata::secret_store_parse_plaintext("1BAD=x\n", "t"),
                  strata::config_error);
}

TEST_CASE("secret_store::generate_profile writes a private key and refuses to overwrite") {
  strata::test::temp_dir tmp{ "secret-gen" };
  auto const cfg{ strata::secret_store::generate_profile(tmp.path(), "dev") };
  CHECK(cfg == tmp / ".strata" / "cfg.dev.lua");

  auto const key_path{ tmp / ".strata" / "dev.key" };
  REQUIRE(fs::exists(key_path));
  auto const perms{ fs::status(key_path).permissions() };
  CHECK((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);

  CHECK_THROWS_AS(strata::secret_store::generate_profile(tmp.path(), "dev"),
                  strata::config_error);

  strata::secret_store store{ tmp.path(), "dev" };
  store.read_profile_config();
  CHECK(store.loaded_profile().providers.contains("fs"));
}

TEST_CASE_FIXTURE(secret_store_fixture, "read_secret_files decrypts every bundle") {
  seal(stacks / "net" / "net.secrets", "DB_PASSWORD=hunter2\n");
  seal(stacks / "shared.secrets", "API_TOKEN=t0k3n\n");

  auto store{ make_store() };
  auto const secrets{ store->read_secret_files(stacks) };
  CHECK(secrets.stacks_root() == stacks);

  CHECK(secrets.names() == std::vector<std::string>{ "API_TOKEN", "DB_PASSWORD" });
  CHECK(secrets.get("DB_PASSWORD") == "hunter2");
  CHECK_FALSE(secrets.get("MISSING").has_value());
  CHECK(secrets.resolve_placeholders("pw=${secret:DB_PASSWORD}") == "pw=hunter2");
}

TEST_CASE_FIXTURE(secret_store_fixture, "read_secret_files with no bundles is empty") {
  auto store{ make_store() };
  CHECK(store->read_secret_files(stacks).names().empty());
  CHECK(store->read_secret_files(tmp / "does-not-exist").names().empty());
}

TEST_CASE_FIXTURE(secret_store_fixture, "read_secret_files decrypts a root once") {
  seal(stacks / "a.secrets", "TOKEN=1\n");
  auto store{ make_store() };
  auto const first{ store->read_secret_files(stacks) };

  // Later changes on disk do not alter what was published for the root
  seal(stacks / "b.secrets", "OTHER=2\n");
  auto const second{ store->read_secret_files(stacks) };
  CHECK(second.names() == std::vector<std::string>{ "TOKEN" });
  CHECK(&first.stacks_root() == &second.stacks_root());
}

TEST_CASE_FIXTURE(secret_store_fixture, "read_secret_files is all-or-nothing") {
  seal(stacks / "a.secrets", "GOOD=1\n");

  // Sealed under a different profile key
  auto const foreign{ tmp / "foreign" };
  strata::secret_store::generate_profile(tmp.path(), "prod");
  seal(foreign / "a.secrets", "ALSO_GOOD=1\n");
  make_store("prod")->encrypt_bundle("OTHER=2\n", foreign / "b.secrets");

  auto store{ make_store() };
  expect_kind(strata::error_kind::decryption_error,
              [&] { (void)store->read_secret_files(foreign); });

  // Nothing was published for the failed root, so the next read retries it
  expect_kind(strata::error_kind::decryption_error,
              [&] { (void)store->read_secret_files(foreign); });

  auto const secrets{ store->read_secret_files(stacks) };
  CHECK(secrets.names() == std::vector<std::string>{ "GOOD" });
}

TEST_CASE_FIXTURE(secret_store_fixture, "failed read of another root keeps published secrets") {
  seal(stacks / "a.secrets", "GOOD=1\n");
  auto store{ make_store() };
  auto const secrets{ store->read_secret_files(stacks) };

  auto const other{ tmp / "other" };
  strata::test::write_file(other / "x.secrets", "STRSEC01 garbage garbage garbage garbage");
  expect_kind(strata::error_kind::decryption_error,
              [&] { (void)store->read_secret_files(other); });

  CHECK(secrets.get("GOOD") == "1");
  CHECK(secrets.resolve_placeholders("${secret:GOOD}") == "1");
  CHECK(store->read_secret_files(stacks).names() == std::vector<std::string>{ "GOOD" });
}

TEST_CASE_FIXTURE(secret_store_fixture, "tampered bundle is a decryption error") {
  seal(stacks / "a.secrets", "GOOD=1\n");
  auto bytes{ strata::util_load_file(stacks / "a.secrets") };
  bytes.back() ^= 0x01;
  strata::util_write_file_atomic(stacks / "a.secrets", bytes.data(), bytes.size());

  auto store{ make_store() };
  try {
    (void)store->read_secret_files(stacks);
    FAIL("expected credential_error");
  } catch (strata::credential_error const &e) {
    CHECK(e.kind() == strata::error_kind::decryption_error);
    CHECK(std::string(e.what()).find("a.secrets") != std::string::npos);
  }
}

TEST_CASE_FIXTURE(secret_store_fixture, "duplicate secret names across bundles") {
  seal(stacks / "a.secrets", "TOKEN=1\n");
  seal(stacks / "b.secrets", "TOKEN=2\n");

  auto store{ make_store() };
  expect_kind(strata::error_kind::config, [&] { (void)store->read_secret_files(stacks); });

  fs::remove(stacks / "b.secrets");
  CHECK(store->read_secret_files(stacks).get("TOKEN") == "1");
}

TEST_CASE_FIXTURE(secret_store_fixture, "plaintext is never written to disk") {
  seal(stacks / "a.secrets", "TOKEN=plainvalue\n");
  auto const on_disk{ strata::test::read_file(stacks / "a.secrets") };
  CHECK(on_disk.find("plainvalue") == std::string::npos);
  CHECK(on_disk.rfind("STRSEC01", 0) == 0);
}

TEST_CASE_FIXTURE(secret_store_fixture, "resolve_placeholders rejects unknown secrets") {
  auto store{ make_store() };
  auto const secrets{ store->read_secret_files(stacks) };
  expect_kind(strata::error_kind::missing_secret,
              [&] { (void)secrets.resolve_placeholders("${secret:NOPE}"); });
  CHECK(secrets.resolve_placeholders("plain") == "plain");
}

TEST_CASE_FIXTURE(secret_store_fixture, "provider_credentials resolves secrets") {
  strata::test::write_file(
      tmp / ".strata" / "cfg.dev.lua",
      "KEY_PATH = 'dev.key'\n"
      "PROVIDERS = { fs = { state_dir = 'st', token = '${secret:TOKEN}' } }\n");
  seal(stacks / "a.secrets", "TOKEN=abc\n");

  auto store{ make_store() };
  auto const secrets{ store->read_secret_files(stacks) };

  auto const creds{ secrets.provider_credentials("fs") };
  CHECK(creds.at("token") == "abc");
  CHECK(creds.at("state_dir") == "st");
  CHECK_THROWS_AS(secrets.provider_credentials("cloud"), strata::config_error);
}

TEST_CASE_FIXTURE(secret_store_fixture, "encrypt_bundle validates plaintext") {
  auto store{ make_store() };
  CHECK_THROWS_AS(store->encrypt_bundle("just text\n", stacks / "x.secrets"),
                  strata::config_error);
  CHECK_THROWS_AS(store->encrypt_bundle("# only comments\n", stacks / "x.secrets"),
                  strata::config_error);
  CHECK_FALSE(fs::exists(stacks / "x.secrets"));
}

TEST_CASE_FIXTURE(secret_store_fixture, "remove_secret reseals the remaining secrets") {
  auto const bundle{ stacks / "a.secrets" };
  seal(bundle, "A=1\nB=2\n");
  auto store{ make_store() };

  expect_kind(strata::error_kind::missing_secret,
              [&] { (void)store->remove_secret(bundle, "C"); });

  CHECK(store->remove_secret(bundle, "A") == 1);
  auto const on_disk{ strata::test::read_file(bundle) };
  CHECK(on_disk.rfind("STRSEC01", 0) == 0);
  CHECK(on_disk.find("B=2") == std::string::npos);
  CHECK(make_store()->read_secret_files(stacks).names() == std::vector<std::string>{ "B" });

  CHECK(store->remove_secret(bundle, "B") == 0);
  CHECK_FALSE(fs::exists(bundle));
}

TEST_CASE_FIXTURE(secret_store_fixture, "remove_secret requires the bundle's profile") {
  auto const bundle{ stacks / "a.secrets" };
  seal(bundle, "A=1\n");
  auto const before{ strata::util_load_file(bundle) };

  strata::secret_store::generate_profile(tmp.path(), "prod");
  expect_kind(strata::error_kind::decryption_error,
              [&] { (void)make_store("prod")->remove_secret(bundle, "A"); });
  CHECK(strata::util_load_file(bundle) == before);
}
