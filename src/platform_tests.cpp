#include "platform.h"

#include "doctest/doctest.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace strata {

namespace {

std::filesystem::path platform_temp_path(char const *tag) {
  return std::filesystem::temp_directory_path() /
         ("strata-platform-test-" + std::string(tag) + "-" +
          std::to_string(static_cast<long>(::getpid())));
}

}  // namespace

TEST_CASE("platform::expand_path empty path returns empty path") {
  CHECK(platform::expand_path("").empty());
}

TEST_CASE("platform::expand_path plain path returns unchanged") {
  CHECK(platform::expand_path("/absolute/path/to/something") ==
        "/absolute/path/to/something");
  CHECK(platform::expand_path("relative/path") == "relative/path");
}

TEST_CASE("platform::expand_path tilde slash expands to HOME") {
  char const *home{ std::getenv("HOME") };
  REQUIRE(home != nullptr);

  CHECK(platform::expand_path("~/keys/dev.key") ==
        std::filesystem::path{ home } / "keys" / "dev.key");
}

TEST_CASE("platform::expand_path with braced env var expands correctly") {
  char const *home{ std::getenv("HOME") };
  REQUIRE(home != nullptr);

  CHECK(platform::expand_path("${HOME}/test") == std::filesystem::path{ home } / "test");
}

TEST_CASE("platform::expand_path rejects undefined variables") {
  CHECK_THROWS_WITH(platform::expand_path("$STRATA_SURELY_UNDEFINED_VAR/x"),
                    doctest::Contains("undefined variable"));
}

TEST_CASE("platform::create_private_file writes owner-only file once") {
  auto const path{ platform_temp_path("private") };
  scoped_path_cleanup cleanup{ path };

  platform::create_private_file(path, "abc", 3);

  struct stat st{};
  REQUIRE(::stat(path.c_str(), &st) == 0);
  CHECK((st.st_mode & 0777) == 0600);
  CHECK(std::filesystem::file_size(path) == 3);

  CHECK_THROWS_AS(platform::create_private_file(path, "xyz", 3), std::system_error);
}

TEST_CASE("platform::file_lock is movable and reports ownership") {
  auto const path{ platform_temp_path("lock") };
  scoped_path_cleanup cleanup{ path };

  platform::file_lock lock{ path };
  CHECK(static_cast<bool>(lock));

  platform::file_lock moved{ std::move(lock) };
  CHECK(static_cast<bool>(moved));
}

}  // namespace strata
