#include "workspace.h"

#include "errors.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <filesystem>

namespace fs = std::filesystem;

namespace {

struct scoped_chdir {
  fs::path original;
  explicit scoped_chdir(fs::path const &target) : original{ fs::current_path() } {
    fs::current_path(target);
  }
  ~scoped_chdir() { fs::current_path(original); }
};

}  // namespace

TEST_CASE("workspace_find_root stops at the nearest .strata directory") {
  strata::test::temp_dir tmp{ "workspace" };
  fs::create_directories(tmp / "proj" / ".strata");
  fs::create_directories(tmp / "proj" / "stacks" / "net");

  auto const root{ strata::workspace_find_root(tmp / "proj" / "stacks" / "net") };
  REQUIRE(root.has_value());
  CHECK(fs::equivalent(*root, tmp / "proj"));
}

TEST_CASE("workspace_find_root accepts a .git file or directory") {
  strata::test::temp_dir tmp{ "workspace-git" };
  fs::create_directories(tmp / "repo" / "deep" / "er");
  strata::test::write_file(tmp / "repo" / ".git", "gitdir: elsewhere\n");

  auto const root{ strata::workspace_find_root(tmp / "repo" / "deep" / "er") };
  REQUIRE(root.has_value());
  CHECK(fs::equivalent(*root, tmp / "repo"));
}

TEST_CASE("workspace_resolve_root") {
  strata::test::temp_dir tmp{ "workspace-resolve" };
  fs::create_directories(tmp / "a" / ".strata");
  fs::create_directories(tmp / "a" / "b");

  SUBCASE("explicit root must exist") {
    CHECK(strata::workspace_resolve_root(tmp.path()) == fs::absolute(tmp.path()));
    CHECK_THROWS_AS(strata::workspace_resolve_root(tmp / "missing"), strata::config_error);
  }

  SUBCASE("discovers from the current directory") {
    scoped_chdir cd{ tmp / "a" / "b" };
    CHECK(fs::equivalent(strata::workspace_resolve_root(std::nullopt), tmp / "a"));
  }
}
