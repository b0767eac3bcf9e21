#include "preview.h"

#include "errors.h"
#include "secret_store.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <memory>

namespace {

strata::stack_spec make_stack(std::string name, std::vector<strata::resource_spec> resources) {
  strata::stack_spec s;
  s.name = std::move(name);
  s.provider = "fake";
  s.resources = std::move(resources);
  return s;
}

strata::observed_resource observe(strata::resource_spec const &r) {
  return { r.type, r.name, strata::resource_fingerprint(r) };
}

struct preview_fixture {
  strata::test::temp_dir tmp{ "preview" };
  std::shared_ptr<strata::test::fake_provider_state> fake{
    std::make_shared<strata::test::fake_provider_state>()
  };
  strata::provider_registry registry;
  std::unique_ptr<strata::secret_store> secrets;

  preview_fixture() {
    strata::test::write_profile(tmp.path(), "dev", "fake = {}");
    registry.add("fake", strata::test::fake_provider_factory(fake));
    secrets = std::make_unique<strata::secret_store>(tmp.path(), "dev");
    secrets->read_profile_config();
  }

  strata::secret_view view() { return secrets->read_secret_files(tmp / "stacks"); }
};

}  // namespace

TEST_CASE("op_kind_name") {
  CHECK(strata::op_kind_name(strata::op_kind::create) == "create");
  CHECK(strata::op_kind_name(strata::op_kind::update) == "update");
  CHECK(strata::op_kind_name(strata::op_kind::remove) == "delete");
  CHECK(strata::op_kind_name(strata::op_kind::no_op) == "no-op");
}

TEST_CASE("preview_summary lists only non-zero kinds in fixed order") {
  using strata::op_kind;
  CHECK(strata::preview_summary("web", { { op_kind::create, 2 }, { op_kind::update, 1 },
                                         { op_kind::remove, 0 }, { op_kind::no_op, 4 } }) ==
        "web: 2 to create, 1 to update");
  CHECK(strata::preview_summary("web", { { op_kind::remove, 3 } }) == "web: 3 to delete");
  CHECK(strata::preview_summary("web", { { op_kind::no_op, 3 } }) == "web: no changes");
  CHECK(strata::preview_summary("web", {}) == "web: no changes");
}

TEST_CASE("preview_diff classifies by fingerprint") {
  strata::resource_spec const keep{ "bucket", "keep", { { "a", "1" } } };
  strata::resource_spec const change{ "bucket", "change", { { "a", "1" } } };
  strata::resource_spec const fresh{ "bucket", "fresh", {} };
  auto change_before{ change };
  change_before.properties["a"] = "0";

  strata::observed_state observed{ { observe(keep),
                                     observe(change_before),
                                     { "bucket", "gone", "ff" } } };
  auto const result{ strata::preview_diff(make_stack("s", { keep, change, fresh }), observed) };

  CHECK(result.count(strata::op_kind::create) == 1);
  CHECK(result.count(strata::op_kind::update) == 1);
  CHECK(result.count(strata::op_kind::remove) == 1);
  CHECK(result.count(strata::op_kind::no_op) == 1);
  CHECK(result.has_changes());
  CHECK(result.summary == "s: 1 to create, 1 to update, 1 to delete");

  REQUIRE(result.changes.size() == 4);
  CHECK(result.changes[0] == strata::resource_change{ strata::op_kind::update, "bucket", "change" });
  CHECK(result.changes[1] == strata::resource_change{ strata::op_kind::create, "bucket", "fresh" });
  CHECK(result.changes[2] == strata::resource_change{ strata::op_kind::remove, "bucket", "gone" });
  CHECK(result.changes[3] == strata::resource_change{ strata::op_kind::no_op, "bucket", "keep" });
}

TEST_CASE("preview_diff of an empty stack against empty state has every kind at zero") {
  auto const result{ strata::preview_diff(make_stack("empty", {}), {}) };
  CHECK(result.counts.size() == 4);
  CHECK_FALSE(result.has_changes());
  CHECK(result.summary == "empty: no changes");
}

TEST_CASE_FIXTURE(preview_fixture, "preview_stacks: two to create, one to update") {
  strata::resource_spec const existing{ "vm", "api", { { "size", "small" } } };
  auto wanted{ existing };
  wanted.properties["size"] = "large";
  fake->states["app"] = strata::observed_state{ { observe(existing) } };

  std::vector<strata::stack_spec> const stacks{
    make_stack("app", { wanted, { "vm", "worker", {} }, { "dns", "api", {} } })
  };
  strata::provider_set providers{ registry, view(), tmp.path(), stacks };

  auto const results{ strata::preview_stacks(stacks, providers) };
  REQUIRE(results.size() == 1);
  CHECK(results[0].count(strata::op_kind::create) == 2);
  CHECK(results[0].count(strata::op_kind::update) == 1);
  CHECK(results[0].count(strata::op_kind::remove) == 0);
  CHECK(results[0].summary == "app: 2 to create, 1 to update");
}

TEST_CASE_FIXTURE(preview_fixture, "preview_stacks preserves input order and is repeatable") {
  std::vector<strata::stack_spec> const stacks{ make_stack("zeta", { { "a", "b", {} } }),
                                                make_stack("alpha", {}) };
  strata::provider_set providers{ registry, view(), tmp.path(), stacks };

  auto const first{ strata::preview_stacks(stacks, providers) };
  auto const second{ strata::preview_stacks(stacks, providers) };
  REQUIRE(first.size() == 2);
  CHECK(first[0].stack == "zeta");
  CHECK(first[1].stack == "alpha");
  CHECK(first == second);
  CHECK(fake->applied.empty());
}

TEST_CASE_FIXTURE(preview_fixture, "preview_stacks uses refreshed state when given") {
  std::vector<strata::stack_spec> const stacks{ make_stack("app", { { "a", "b", {} } }) };
  strata::provider_set providers{ registry, view(), tmp.path(), stacks };

  strata::observed_cache_t refreshed;
  refreshed["app"] = strata::observed_state{ { observe({ "a", "b", {} }) } };

  auto const results{ strata::preview_stacks(stacks, providers, &refreshed) };
  CHECK(fake->query_calls == 0);
  CHECK(results[0].summary == "app: no changes");
}

TEST_CASE_FIXTURE(preview_fixture, "preview_stacks wraps query failures") {
  fake->fail_query.insert("app");
  std::vector<strata::stack_spec> const stacks{ make_stack("app", {}) };
  strata::provider_set providers{ registry, view(), tmp.path(), stacks };

  try {
    (void)strata::preview_stacks(stacks, providers);
    FAIL("expected provider_error");
  } catch (strata::provider_error const &e) {
    CHECK(e.kind() == strata::error_kind::provider_query_error);
    CHECK(e.provider() == "fake");
    CHECK(e.stack() == "app");
    CHECK(e.cause() == "simulated query failure");
  }
}

TEST_CASE_FIXTURE(preview_fixture, "provider_set rejects unknown bindings") {
  auto stack{ make_stack("app", {}) };
  stack.provider = "cloud";
  CHECK_THROWS_AS(strata::provider_set(registry, view(), tmp.path(), { stack }),
                  strata::config_error);
}

TEST_CASE_FIXTURE(preview_fixture, "provider_set requires a profile entry for the binding") {
  registry.add("other", strata::test::fake_provider_factory(fake));
  auto stack{ make_stack("app", {}) };
  stack.provider = "other";
  CHECK_THROWS_AS(strata::provider_set(registry, view(), tmp.path(), { stack }),
                  strata::config_error);
}

TEST_CASE("provider_registry_with_builtins registers fs") {
  auto const registry{ strata::provider_registry_with_builtins() };
  CHECK(registry.contains("fs"));
  CHECK(registry.bindings() == std::vector<std::string>{ "fs" });
}

TEST_CASE("provider_registry rejects duplicate bindings") {
  strata::provider_registry registry;
  auto const fake{ std::make_shared<strata::test::fake_provider_state>() };
  registry.add("fake", strata::test::fake_provider_factory(fake));
  CHECK_THROWS(registry.add("fake", strata::test::fake_provider_factory(fake)));
}
