#include "provider.h"

#include "errors.h"
#include "secret_store.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <vector>

namespace {

strata::stack_spec make_stack(std::string name, std::string provider) {
  strata::stack_spec s;
  s.name = std::move(name);
  s.provider = std::move(provider);
  return s;
}

struct provider_fixture {
  strata::test::temp_dir tmp{ "provider" };
  std::shared_ptr<strata::test::fake_provider_state> fake{
    std::make_shared<strata::test::fake_provider_state>()
  };
  strata::provider_registry registry{ strata::provider_registry_with_builtins() };
  std::unique_ptr<strata::secret_store> secrets;

  provider_fixture() {
    registry.add("fake", strata::test::fake_provider_factory(fake));
    strata::test::write_profile(tmp.path(), "dev", "fake = {}");
    secrets = std::make_unique<strata::secret_store>(tmp.path(), "dev");
    secrets->read_profile_config();
  }

  strata::secret_view view() { return secrets->read_secret_files(tmp / "stacks"); }
};

}  // namespace

TEST_CASE("apply_result describe") {
  strata::apply_result r{ .created = 2, .updated = 1, .deleted = 0, .unchanged = 4 };
  CHECK(r.describe() == "2 created, 1 updated, 0 deleted");
}

TEST_CASE("apply_ctx checkpoint throws once cancellation is requested") {
  bool flag{ false };
  strata::apply_ctx ctx{ [&flag] { return flag; } };
  CHECK_FALSE(ctx.cancelled());
  CHECK_NOTHROW(ctx.checkpoint());

  flag = true;
  CHECK(ctx.cancelled());
  CHECK_THROWS_AS(ctx.checkpoint(), strata::cancelled_error);
}

TEST_CASE("apply_ctx without a predicate never cancels") {
  strata::apply_ctx ctx{ nullptr };
  CHECK_FALSE(ctx.cancelled());
  CHECK_NOTHROW(ctx.checkpoint());
}

TEST_CASE("provider_registry") {
  auto registry{ strata::provider_registry_with_builtins() };
  CHECK(registry.contains("fs"));
  CHECK_FALSE(registry.contains("fake"));

  auto fake{ std::make_shared<strata::test::fake_provider_state>() };
  registry.add("fake", strata::test::fake_provider_factory(fake));
  CHECK(registry.bindings() == std::vector<std::string>{ "fake", "fs" });
  CHECK_THROWS(registry.add("fake", strata::test::fake_provider_factory(fake)));

  auto p{ registry.create(strata::provider_init{ .binding = "fake" }) };
  REQUIRE(p);
  CHECK(p->name() == "fake");

  CHECK_THROWS_AS(registry.create(strata::provider_init{ .binding = "aws" }),
                  strata::config_error);
}

TEST_CASE_FIXTURE(provider_fixture, "provider_set binds one instance per provider") {
  std::vector<strata::stack_spec> const stacks{ make_stack("a", "fake"),
                                                make_stack("b", "fake") };
  strata::provider_set set{ registry, view(), tmp.path(), stacks };
  CHECK(&set.for_stack(stacks[0]) == &set.for_stack(stacks[1]));
  CHECK_THROWS(set.for_stack(make_stack("c", "fs")));
}

TEST_CASE_FIXTURE(provider_fixture, "provider_set rejects an unregistered provider") {
  std::vector<strata::stack_spec> const stacks{ make_stack("a", "gcp") };
  CHECK_THROWS_WITH_AS(
      strata::provider_set(registry, view(), tmp.path(), stacks),
      "stack 'a' uses unknown provider 'gcp' (registered: fake, fs)",
      strata::config_error);
}

TEST_CASE_FIXTURE(provider_fixture, "provider_set requires profile credentials") {
  // fs is registered but the dev profile has no PROVIDERS.fs entry.
  std::vector<strata::stack_spec> const stacks{ make_stack("a", "fs") };
  CHECK_THROWS_AS(strata::provider_set(registry, view(), tmp.path(), stacks),
                  strata::config_error);
}

TEST_CASE_FIXTURE(provider_fixture, "traced queries sort and wrap failures") {
  fake->states["a"].resources = { { "bucket", "z", "f1" },
                                  { "bucket", "a", "f2" },
                                  { "acl", "m", "f3" } };
  std::vector<strata::stack_spec> const stacks{ make_stack("a", "fake") };
  strata::provider_set set{ registry, view(), tmp.path(), stacks };

  auto const state{ strata::provider_query_state(set.for_stack(stacks[0]), stacks[0]) };
  REQUIRE(state.resources.size() == 3);
  CHECK(state.resources[0].key() == "acl/m");
  CHECK(state.resources[1].key() == "bucket/a");
  CHECK(state.resources[2].key() == "bucket/z");
  CHECK(fake->query_calls == 1);

  CHECK(strata::provider_refresh(set.for_stack(stacks[0]), stacks[0]) == state);
  CHECK(fake->refresh_calls == 1);

  fake->fail_query.insert("a");
  try {
    strata::provider_refresh(set.for_stack(stacks[0]), stacks[0]);
    FAIL("expected provider_error");
  } catch (strata::provider_error const &e) {
    CHECK(e.kind() == strata::error_kind::provider_query_error);
    CHECK(e.provider() == "fake");
    CHECK(e.stack() == "a");
    CHECK(e.cause() == "simulated query failure");
    CHECK(std::string(e.what()) ==
          "provider 'fake' query failed for stack 'a': simulated query failure");
  }
}
