#include "mutation.h"

#include "errors.h"
#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using strings = std::vector<std::string>;

namespace {

struct fixture {
  uvk::test::temp_dir scratch{ "mutation" };
  uvk::test::fake_env_builder builder;
  uvk::provisioner prov{ builder, scratch.path(), std::chrono::seconds{ 5 } };

  uvk::environment_lease make_env(strings deps) {
    uvk::interpreter_handle const interp{ .path = "/usr/bin/python3.11",
                                          .version = *uvk::python_version::parse("3.11.2") };
    return uvk::environment_lease{ prov, prov.create(interp, deps) };
  }
};

}  // namespace

TEST_CASE("normalize_package_name follows PEP 503") {
  CHECK(uvk::normalize_package_name("Foo_Bar") == "foo-bar");
  CHECK(uvk::normalize_package_name("zope.interface") == "zope-interface");
  CHECK(uvk::normalize_package_name("a--b__c") == "a-b-c");
  CHECK(uvk::normalize_package_name("NumPy") == "numpy");
}

TEST_CASE("requirement_name strips extras, specifiers and markers") {
  CHECK(uvk::requirement_name("numpy") == "numpy");
  CHECK(uvk::requirement_name("  Pandas>=2.0 ") == "pandas");
  CHECK(uvk::requirement_name("requests[socks]==2.31.0") == "requests");
  CHECK(uvk::requirement_name("typing_extensions; python_version<'3.11'") ==
        "typing-extensions");
  CHECK(uvk::requirement_name("scikit-learn~=1.4") == "scikit-learn");
}

TEST_CASE("freeze_lines drops blanks and comments") {
  CHECK(uvk::freeze_lines("# generated\nnumpy==1.26.4\n\r\n  pandas==2.2.0  \n") ==
        strings{ "numpy==1.26.4", "pandas==2.2.0" });
}

TEST_CASE("merge_dependencies replaces same-named entries in place") {
  CHECK(uvk::merge_dependencies({ "ipykernel", "numpy<2" }, { "numpy>=2", "polars" }) ==
        strings{ "ipykernel", "numpy>=2", "polars" });
  CHECK(uvk::merge_dependencies({ "ipykernel" }, { "ipykernel" }) == strings{ "ipykernel" });
  CHECK(uvk::merge_dependencies({}, { "a", "a" }) == strings{ "a" });
}

TEST_CASE("mutation_choose_strategy") {
  strings const declared{ "ipykernel", "numpy<2" };
  strings const installed{ "ipykernel==6.29.0", "numpy==1.26.4", "pyzmq==25.1.2" };
  auto const choose{ [&](uvk::mutation_policy policy, strings requested) {
    return uvk::mutation_choose_strategy(policy, declared, installed, requested);
  } };

  SUBCASE("auto") {
    CHECK(choose(uvk::mutation_policy::automatic, { "polars" }) ==
          uvk::mutation_strategy::live_patch);
    CHECK(choose(uvk::mutation_policy::automatic, { "numpy>=2" }) ==
          uvk::mutation_strategy::rebuild);
    CHECK(choose(uvk::mutation_policy::automatic, { "pyzmq==26.0" }) ==
          uvk::mutation_strategy::rebuild);
    CHECK(choose(uvk::mutation_policy::automatic, { "numpy<2" }) ==
          uvk::mutation_strategy::none);
    CHECK(choose(uvk::mutation_policy::automatic, { "polars", "NumPy>=2" }) ==
          uvk::mutation_strategy::rebuild);
  }

  SUBCASE("forced") {
    CHECK(choose(uvk::mutation_policy::live, { "numpy>=2" }) ==
          uvk::mutation_strategy::live_patch);
    CHECK(choose(uvk::mutation_policy::rebuild, { "polars" }) ==
          uvk::mutation_strategy::rebuild);
    CHECK(choose(uvk::mutation_policy::rebuild, { "ipykernel" }) ==
          uvk::mutation_strategy::none);
  }
}

TEST_CASE("mutation_handler live patches a disjoint addition") {
  fixture f;
  auto lease{ f.make_env({ "ipykernel" }) };
  uvk::mutation_handler handler{ f.prov, uvk::mutation_policy::automatic };

  auto const outcome{ handler.apply(lease.env(),
                                    { .specifiers = { "polars==1.2.0" },
                                      .source = uvk::dependency_source::live_magic }) };
  CHECK(outcome.strategy == uvk::mutation_strategy::live_patch);
  CHECK_FALSE(outcome.replacement);
  CHECK(lease->dependencies == strings{ "ipykernel", "polars==1.2.0" });
  CHECK(outcome.dependencies == lease->dependencies);
  CHECK(uvk::test::fake_env_builder::installed_packages(lease->root) ==
        strings{ "ipykernel==1.0", "polars==1.2.0" });
}

TEST_CASE("mutation_handler is a no-op for already declared dependencies") {
  fixture f;
  auto lease{ f.make_env({ "ipykernel", "numpy" }) };
  uvk::mutation_handler handler{ f.prov, uvk::mutation_policy::automatic };

  auto const outcome{ handler.apply(lease.env(), { .specifiers = { " numpy ", "ipykernel" } }) };
  CHECK(outcome.strategy == uvk::mutation_strategy::none);
  CHECK(f.builder.call_count("install") == 0);
  CHECK(f.builder.call_count("freeze") == 0);
}

TEST_CASE("mutation_handler rolls back a failed live patch") {
  fixture f;
  auto lease{ f.make_env({ "ipykernel", "numpy==1.26.4" }) };
  auto const before{ uvk::test::fake_env_builder::installed_packages(lease->root) };
  auto const declared_before{ lease->dependencies };
  f.builder.fail_on_package = "broken";

  uvk::mutation_handler handler{ f.prov, uvk::mutation_policy::automatic };
  try {
    static_cast<void>(
        handler.apply(lease.env(), { .specifiers = { "polars", "broken>=1", "zarr" } }));
    FAIL("expected mutation_error");
  } catch (uvk::mutation_error const &e) {
    CHECK(e.rolled_back());
    CHECK(e.environment_consistent());
    CHECK(e.cause().find("no matching distribution") != std::string::npos);
  }

  CHECK(lease->dependencies == declared_before);
  CHECK(uvk::test::fake_env_builder::installed_packages(lease->root) == before);
  CHECK(f.builder.call_count("sync") == 1);
}

TEST_CASE("mutation_handler reports a rollback that did not restore the environment") {
  fixture f;
  auto lease{ f.make_env({ "ipykernel" }) };
  f.builder.fail_on_package = "broken";
  f.builder.corrupt_sync = true;

  uvk::mutation_handler handler{ f.prov, uvk::mutation_policy::live };
  try {
    static_cast<void>(handler.apply(lease.env(), { .specifiers = { "broken" } }));
    FAIL("expected mutation_error");
  } catch (uvk::mutation_error const &e) {
    CHECK(e.rolled_back());
    CHECK_FALSE(e.environment_consistent());
  }
}

TEST_CASE("mutation_handler fails cleanly when the environment cannot be inspected") {
  fixture f;
  auto lease{ f.make_env({ "ipykernel" }) };
  fs::remove(lease->root / ".fake-packages");

  uvk::mutation_handler handler{ f.prov, uvk::mutation_policy::automatic };
  CHECK_THROWS_AS(handler.apply(lease.env(), { .specifiers = { "polars" } }),
                  uvk::mutation_error);
  CHECK(f.builder.call_count("install") == 0);
}

TEST_CASE("mutation_handler rebuilds on a conflicting request") {
  fixture f;
  auto lease{ f.make_env({ "ipykernel", "numpy<2" }) };
  uvk::mutation_handler handler{ f.prov, uvk::mutation_policy::automatic };

  auto outcome{ handler.apply(lease.env(),
                              { .specifiers = { "numpy==2.1.0" },
                                .source = uvk::dependency_source::inline_metadata }) };
  CHECK(outcome.strategy == uvk::mutation_strategy::rebuild);
  REQUIRE(outcome.replacement);
  CHECK(outcome.replacement->root != lease->root);
  CHECK(outcome.replacement->dependencies == strings{ "ipykernel", "numpy==2.1.0" });
  CHECK(outcome.dependencies == outcome.replacement->dependencies);
  CHECK(lease->dependencies == strings{ "ipykernel", "numpy<2" });
  CHECK(fs::exists(lease->root));

  auto const new_root{ outcome.replacement->root };
  lease = std::move(outcome.replacement);
  CHECK(lease->root == new_root);
}

TEST_CASE("mutation_handler keeps the old environment when a rebuild fails") {
  fixture f;
  auto lease{ f.make_env({ "ipykernel" }) };
  f.builder.fail_build = true;

  uvk::mutation_handler handler{ f.prov, uvk::mutation_policy::rebuild };
  try {
    static_cast<void>(handler.apply(lease.env(), { .specifiers = { "polars" } }));
    FAIL("expected mutation_error");
  } catch (uvk::mutation_error const &e) {
    CHECK_FALSE(e.rolled_back());
    CHECK(e.environment_consistent());
  }
  CHECK(fs::exists(lease->python()));
  CHECK(lease->dependencies == strings{ "ipykernel" });
  CHECK(f.builder.call_count("freeze") == 0);
}
