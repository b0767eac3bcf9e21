#include "stack_spec.h"

#include "errors.h"
#include "test_support.h"

#include "doctest/doctest.h"

#include <string>

namespace {

strata::stack_spec parse(strata::test::temp_dir const &tmp, std::string const &body) {
  auto const path{ tmp / "web" / "stack.lua" };
  strata::test::write_file(path, body);
  return strata::stack_spec_parse("web", path);
}

void expect_parse_error(strata::test::temp_dir const &tmp,
                        std::string const &body,
                        std::string const &fragment) {
  try {
    (void)parse(tmp, body);
    FAIL("expected parse_error");
  } catch (strata::config_error const &e) {
    CHECK(e.kind() == strata::error_kind::parse_error);
    std::string const what{ e.what() };
    CHECK_MESSAGE(what.find(fragment) != std::string::npos, what);
    CHECK_MESSAGE(what.find("stack.lua") != std::string::npos, what);
  }
}

}  // namespace

TEST_CASE("stack_spec_parse reads provider, dependencies and resources") {
  strata::test::temp_dir tmp{ "stack-spec" };
  auto const spec{ parse(tmp, R"(
DEPENDENCIES = { "network", "dns" }
PROVIDER = "fs"
RESOURCES = {
  { type = "bucket", name = "logs", properties = { region = "eu", owner = "${stack:name}" } },
  { type = "queue", name = "jobs" },
}
)") };

  CHECK(spec.name == "web");
  CHECK(spec.provider == "fs");
  CHECK(spec.dependencies == std::vector<std::string>{ "network", "dns" });
  REQUIRE(spec.resources.size() == 2);
  CHECK(spec.resources[0].key() == "bucket/logs");
  CHECK(spec.resources[0].properties.at("owner") == "web");
  CHECK(spec.resources[0].properties.at("region") == "eu");
  CHECK(spec.resources[1].properties.empty());
}

TEST_CASE("stack_spec_parse keeps secret placeholders for later resolution") {
  strata::test::temp_dir tmp{ "stack-spec-secret" };
  auto const spec{ parse(tmp,
                         "PROVIDER = 'fs'\n"
                         "RESOURCES = { { type = 'db', name = 'main', "
                         "properties = { password = '${secret:DB_PW}' } } }\n") };
  CHECK(spec.resources[0].properties.at("password") == "${secret:DB_PW}");
}

TEST_CASE("stack_spec_parse rejects malformed definitions") {
  strata::test::temp_dir tmp{ "stack-spec-errors" };

  SUBCASE("lua syntax") { expect_parse_error(tmp, "PROVIDER = = 'fs'\n", "stack.lua"); }
  SUBCASE("missing provider") {
    expect_parse_error(tmp, "RESOURCES = {}\n", "PROVIDER is required");
  }
  SUBCASE("dependency not a string") {
    expect_parse_error(tmp, "PROVIDER = 'fs'\nDEPENDENCIES = { 1 }\n", "DEPENDENCIES[1]");
  }
  SUBCASE("duplicate dependency") {
    expect_parse_error(tmp,
                       "PROVIDER = 'fs'\nDEPENDENCIES = { 'a', 'a' }\n",
                       "duplicate dependency 'a'");
  }
  SUBCASE("resource without name") {
    expect_parse_error(tmp,
                       "PROVIDER = 'fs'\nRESOURCES = { { type = 'x' } }\n",
                       "RESOURCES[1]: name is required");
  }
  SUBCASE("duplicate resource") {
    expect_parse_error(tmp,
                       "PROVIDER = 'fs'\nRESOURCES = { { type = 'x', name = 'a' }, "
                       "{ type = 'x', name = 'a' } }\n",
                       "duplicate resource x/a");
  }
  SUBCASE("whitespace in resource name") {
    expect_parse_error(tmp,
                       "PROVIDER = 'fs'\nRESOURCES = { { type = 'x', name = 'a b' } }\n",
                       "name must not be empty or contain whitespace");
  }
  SUBCASE("slash in resource type") {
    expect_parse_error(tmp,
                       "PROVIDER = 'fs'\nRESOURCES = { { type = 'x/y', name = 'a' } }\n",
                       "type must not be empty or contain whitespace or '/'");
  }
  SUBCASE("slash in resource name") {
    expect_parse_error(tmp,
                       "PROVIDER = 'fs'\nRESOURCES = { { type = 'x', name = 'y/a' } }\n",
                       "name must not be empty or contain whitespace or '/'");
  }
  SUBCASE("unknown stack placeholder") {
    expect_parse_error(tmp,
                       "PROVIDER = 'fs'\nRESOURCES = { { type = 'x', name = 'a', "
                       "properties = { p = '${stack:region}' } } }\n",
                       "${stack:region}");
  }
  SUBCASE("runtime error") { expect_parse_error(tmp, "error('nope')\n", "nope"); }
}

TEST_CASE("stack_name_valid") {
  CHECK(strata::stack_name_valid("network"));
  CHECK(strata::stack_name_valid("web-eu_1.v2"));
  CHECK_FALSE(strata::stack_name_valid(""));
  CHECK_FALSE(strata::stack_name_valid(".hidden"));
  CHECK_FALSE(strata::stack_name_valid("a b"));
}

TEST_CASE("resource_fingerprint depends on every field") {
  strata::resource_spec const base{ "bucket", "logs", { { "region", "eu" } } };
  auto const fp{ strata::resource_fingerprint(base) };
  CHECK(fp.size() == 64);
  CHECK(fp == strata::resource_fingerprint(base));

  auto changed{ base };
  changed.properties["region"] = "us";
  CHECK(strata::resource_fingerprint(changed) != fp);

  // Field boundaries are part of the canonical form
  strata::resource_spec const a{ "t", "n", { { "ab", "c" } } };
  strata::resource_spec const b{ "t", "n", { { "a", "bc" } } };
  CHECK(strata::resource_fingerprint(a) != strata::resource_fingerprint(b));
}
