#include "fs_provider.h"

#include "errors.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <atomic>
#include <string>

namespace {

struct fs_provider_fixture {
  strata::test::temp_dir tmp{ "fs-provider" };
  strata::fs_provider provider{ strata::provider_init{
      .binding = "fs",
      .root = tmp.path(),
      .credentials = { { "state_dir", "state" } } } };

  static strata::stack_spec make_stack(std::vector<strata::resource_spec> resources) {
    strata::stack_spec s;
    s.name = "web";
    s.provider = "fs";
    s.resources = std::move(resources);
    return s;
  }
};

}  // namespace

TEST_CASE("fs_provider requires state_dir") {
  CHECK_THROWS_WITH_AS(strata::fs_provider(strata::provider_init{ .binding = "fs" }),
                       "provider 'fs': state_dir is required",
                       strata::config_error);
}

TEST_CASE_FIXTURE(fs_provider_fixture, "relative state_dir resolves against the root") {
  CHECK(provider.state_dir() == tmp / "state");
  CHECK(provider.state_path("web") == tmp / "state" / "web.state");
}

TEST_CASE_FIXTURE(fs_provider_fixture, "query_state of a never-applied stack is empty") {
  CHECK(provider.query_state(make_stack({})).resources.empty());
}

TEST_CASE_FIXTURE(fs_provider_fixture, "apply creates, updates and deletes") {
  strata::apply_ctx ctx{ [] { return false; } };

  auto stack{ make_stack({ { "bucket", "logs", { { "region", "eu" } } },
                           { "queue", "jobs", {} } }) };
  auto r1{ provider.apply(stack, ctx) };
  CHECK(r1.created == 2);
  CHECK(r1.describe() == "2 created, 0 updated, 0 deleted");

  auto const observed{ provider.query_state(stack) };
  REQUIRE(observed.resources.size() == 2);
  CHECK(observed.resources[0].key() == "bucket/logs");
  CHECK(observed.resources[0].fingerprint ==
        strata::resource_fingerprint(stack.resources[0]));

  stack.resources[0].properties["region"] = "us";
  stack.resources.pop_back();
  auto r2{ provider.apply(stack, ctx) };
  CHECK(r2.updated == 1);
  CHECK(r2.deleted == 1);
  CHECK(r2.created == 0);

  auto r3{ provider.apply(stack, ctx) };
  CHECK(r3.unchanged == 1);
  CHECK(r3.created + r3.updated + r3.deleted == 0);
}

TEST_CASE_FIXTURE(fs_provider_fixture, "state file stores fingerprints, never values") {
  strata::apply_ctx ctx{ [] { return false; } };
  auto stack{ make_stack({ { "db", "main", { { "password", "hunter2" } } } }) };
  (void)provider.apply(stack, ctx);

  auto const text{ strata::test::read_file(provider.state_path("web")) };
  CHECK(text.find("hunter2") == std::string::npos);
  CHECK(text == "db main " + strata::resource_fingerprint(stack.resources[0]) + "\n");
}

TEST_CASE_FIXTURE(fs_provider_fixture, "cancellation stops at a resource boundary") {
  std::atomic<int> checks{ 0 };
  strata::apply_ctx ctx{ [&] { return ++checks > 1; } };

  auto stack{ make_stack({ { "a", "one", {} }, { "a", "two", {} }, { "a", "three", {} } }) };
  CHECK_THROWS_AS(provider.apply(stack, ctx), strata::cancelled_error);

  // The first resource was recorded before the stop request was observed
  auto const observed{ provider.query_state(stack) };
  REQUIRE(observed.resources.size() == 1);
  CHECK(observed.resources[0].key() == "a/one");
}

TEST_CASE("fs_provider_parse_state") {
  auto const state{ strata::fs_provider_parse_state("b y ff\n\na x ee\n", "s") };
  REQUIRE(state.resources.size() == 2);
  CHECK(state.resources[0].key() == "a/x");
  CHECK(strata::fs_provider_format_state(state) == "a x ee\nb y ff\n");

  CHECK_THROWS_WITH(strata::fs_provider_parse_state("only two\n", "s"),
                    "s:1: expected 'type name fingerprint'");
  CHECK_THROWS(strata::fs_provider_parse_state("a b c d\n", "s"));
  CHECK_THROWS_WITH(strata::fs_provider_parse_state("a/b c ff\n", "s"),
                    "s:1: resource type and name must not contain '/'");
  CHECK_THROWS(strata::fs_provider_parse_state("a b/c ff\n", "s"));
}
