#include "resolver.h"

#include "errors.h"
#include "lockfile.h"
#include "test_support.h"

#include "doctest.h"

#include <string>
#include <vector>

namespace quarry {

namespace {

std::vector<dependency> deps(std::vector<std::string> const &texts) {
  std::vector<dependency> out;
  for (auto const &t : texts) { out.push_back(dependency::parse(t)); }
  return out;
}

std::map<std::string, std::string> chosen(resolved_graph const &g) {
  std::map<std::string, std::string> out;
  for (auto const &[name, node] : g.nodes) { out[name] = node.version.text(); }
  return out;
}

}  // namespace

TEST_CASE("resolve picks the highest version inside the range") {
  test::fake_registry reg;
  reg.add("foo", "1.0.0-1");
  reg.add("foo", "1.5.0-1");
  reg.add("foo", "2.0.0-1");

  auto const g{ resolve(reg, deps({ "foo >= 1.0, < 2.0" }), "5.4") };
  CHECK(chosen(g) == std::map<std::string, std::string>{ { "foo", "1.5.0-1" } });
  CHECK(g.at("foo").constraint_text == ">= 1.0, < 2.0");
}

TEST_CASE("resolve follows transitive dependencies in declaration order") {
  test::fake_registry reg;
  reg.add("app", "1.0-1", { "json ~> 1.2", "log >= 2" });
  reg.add("json", "1.2.0-1");
  reg.add("json", "1.2.9-1");
  reg.add("json", "1.3.0-1");
  reg.add("log", "2.1-1", { "lua >= 5.1" });

  auto const g{ resolve(reg, deps({ "app" }), "5.4") };
  CHECK(chosen(g) == std::map<std::string, std::string>{
                         { "app", "1.0-1" }, { "json", "1.2.9-1" }, { "log", "2.1-1" } });
  CHECK(g.at("app").dependencies == std::vector<std::string>{ "json", "log" });
  CHECK_FALSE(g.at("json").constraint_text);
}

TEST_CASE("resolve installs build dependencies ahead of the package") {
  test::fake_registry reg;
  reg.add("parser", "0.3-1", { "runtime-helper" }, R"(build_dependencies = { "generator >= 2" })");
  reg.add("runtime-helper", "1.0-1");
  reg.add("generator", "1.9-1");
  reg.add("generator", "2.4-1");

  auto const g{ resolve(reg, deps({ "parser" }), "5.4") };
  CHECK(chosen(g) == std::map<std::string, std::string>{ { "generator", "2.4-1" },
                                                         { "parser", "0.3-1" },
                                                         { "runtime-helper", "1.0-1" } });
  CHECK(g.at("parser").dependencies ==
        std::vector<std::string>{ "runtime-helper", "generator" });
  CHECK_NOTHROW(resolved_graph_verify(g));

  auto const lock{ lockfile::from_graph(g, "5.4", {}) };
  CHECK(lock.rocks.at("parser").dependencies.at("generator") == "2.4-1");
}

TEST_CASE("resolve reports conflicting constraints with their origins") {
  test::fake_registry reg;
  reg.add("foo", "1.0-1", { "bar == 1.0" });
  reg.add("bar", "1.0-1");
  reg.add("bar", "2.0-1");

  try {
    resolve(reg, deps({ "foo", "bar >= 2.0" }), "5.4");
    FAIL("expected constraint_conflict");
  } catch (constraint_conflict const &e) {
    CHECK(e.name() == "bar");
    REQUIRE(e.constraints().size() == 2);
    CHECK(e.constraints()[0].find("<root>") != std::string::npos);
    CHECK(e.constraints()[1].find("foo@1.0-1") != std::string::npos);
  }
}

TEST_CASE("resolve detects a direct cycle") {
  test::fake_registry reg;
  reg.add("a", "1.0-1", { "b" });
  reg.add("b", "1.0-1", { "a" });

  try {
    resolve(reg, deps({ "a" }), "5.4");
    FAIL("expected cyclic_dependency");
  } catch (cyclic_dependency const &e) {
    CHECK(e.cycle() == std::vector<std::string>{ "a", "b", "a" });
  }
}

TEST_CASE("resolve is deterministic") {
  test::fake_registry reg;
  reg.add("a", "1.0-1", { "c", "d >= 1" });
  reg.add("b", "2.0-1", { "d < 3" });
  reg.add("c", "0.1-1");
  reg.add("d", "1.0-1");
  reg.add("d", "2.5-1");
  reg.add("d", "3.0-1");

  auto const roots{ deps({ "b", "a" }) };
  auto const first{ resolve(reg, roots, "5.4") };
  auto const second{ resolve(reg, roots, "5.4") };
  CHECK(chosen(first) == chosen(second));
  CHECK(chosen(first).at("d") == "2.5-1");
  for (auto const &[name, node] : first.nodes) {
    CHECK(node.dependencies == second.at(name).dependencies);
  }
}

TEST_CASE("resolve re-resolves a name when a later constraint excludes its choice") {
  // c is chosen at 2.0 before m's tighter constraint arrives.
  test::fake_registry reg;
  reg.add("a", "1.0-1", { "c >= 1" });
  reg.add("b", "1.0-1", { "m" });
  reg.add("m", "1.0-1", { "c < 2" });
  reg.add("c", "1.0-1");
  reg.add("c", "2.0-1", { "stale" });
  reg.add("stale", "1.0-1");

  auto const g{ resolve(reg, deps({ "a", "b" }), "5.4") };
  CHECK(chosen(g) == std::map<std::string, std::string>{ { "a", "1.0-1" },
                                                         { "b", "1.0-1" },
                                                         { "c", "1.0-1" },
                                                         { "m", "1.0-1" } });
  CHECK_FALSE(g.contains("stale"));
}

TEST_CASE("resolve gives up after max_reresolutions") {
  test::fake_registry reg;
  reg.add("a", "1.0-1", { "c >= 1" });
  reg.add("b", "1.0-1", { "m" });
  reg.add("m", "1.0-1", { "c < 2" });
  reg.add("c", "1.0-1");
  reg.add("c", "2.0-1");

  CHECK_THROWS_AS(resolve(reg, deps({ "a", "b" }), "5.4",
                          resolve_options{ .max_reresolutions = 0 }),
                  resolution_did_not_converge);
}

TEST_CASE("resolve skips versions whose runtime constraint excludes the runtime") {
  test::fake_registry reg;
  reg.add("compat", "1.0-1", { "lua >= 5.1" });
  reg.add("compat", "2.0-1", { "lua >= 5.5" });

  auto const g{ resolve(reg, deps({ "compat" }), "5.4") };
  CHECK(g.at("compat").version.text() == "1.0-1");

  CHECK_THROWS_AS(resolve(reg, deps({ "lua >= 5.5" }), "5.4"), constraint_conflict);
}

TEST_CASE("resolve excludes development and pre-release versions unless asked") {
  test::fake_registry reg;
  reg.add("x", "1.0-1");
  reg.add("x", "1.1rc1-1");
  reg.add("x", "scm-1");

  CHECK(resolve(reg, deps({ "x" }), "5.4").at("x").version.text() == "1.0-1");
  CHECK(resolve(reg, deps({ "x" }), "5.4", resolve_options{ .allow_prerelease = true })
            .at("x")
            .version.text() == "1.1rc1-1");
  CHECK(resolve(reg, deps({ "x == scm" }), "5.4").at("x").version.text() == "scm-1");
}

TEST_CASE("resolve prefers locked versions") {
  test::fake_registry reg;
  reg.add("x", "1.0-1");
  reg.add("x", "1.2-1");
  reg.add("y", "3.0-1");
  reg.add("y", "3.1-1");

  lockfile_data locked{ .runtime = "5.4" };
  locked.rocks["x"] = lock_entry{ .version = "1.0-1" };
  locked.rocks["y"] = lock_entry{ .version = "3.0-1", .pinned = true };

  auto const roots{ deps({ "x", "y" }) };

  SUBCASE("install keeps every locked version") {
    auto const g{ resolve(reg, roots, "5.4", resolve_options{ .locked = &locked }) };
    CHECK(chosen(g) == std::map<std::string, std::string>{ { "x", "1.0-1" },
                                                           { "y", "3.0-1" } });
  }

  SUBCASE("lock update keeps only pinned versions") {
    auto const g{ resolve(reg, roots, "5.4",
                          resolve_options{ .locked = &locked, .unlock_all = true }) };
    CHECK(chosen(g) == std::map<std::string, std::string>{ { "x", "1.2-1" },
                                                           { "y", "3.0-1" } });
  }

  SUBCASE("a locked version outside the constraint is ignored") {
    auto const g{ resolve(reg, deps({ "x >= 1.1", "y" }), "5.4",
                          resolve_options{ .locked = &locked }) };
    CHECK(g.at("x").version.text() == "1.2-1");
  }
}

TEST_CASE("resolve propagates index errors") {
  test::fake_registry reg;
  reg.add("a", "1.0-1", { "missing" });
  CHECK_THROWS_AS(resolve(reg, deps({ "a" }), "5.4"), not_found);
}

TEST_CASE("every edge of a resolved graph satisfies its constraint") {
  test::fake_registry reg;
  reg.add("a", "1.0-1", { "b ~> 2", "c" });
  reg.add("b", "2.0-1");
  reg.add("b", "2.4-1");
  reg.add("b", "3.0-1");
  reg.add("c", "1.0-1", { "b >= 2.1" });

  auto const g{ resolve(reg, deps({ "a" }), "5.4") };
  for (auto const &[name, node] : g.nodes) {
    for (auto const &dep : node.descriptor->dependencies) {
      CHECK(dep.version_constraint.satisfied_by(g.at(dep.name).version));
    }
  }
  CHECK_NOTHROW(resolved_graph_verify(g));
}

}  // namespace quarry
