#include "cmds/cmd_add.h"
#include "cmds/cmd_common.h"
#include "cmds/cmd_install.h"
#include "cmds/cmd_lock_update.h"
#include "cmds/cmd_pin.h"
#include "cmds/cmd_remove.h"

#include "errors.h"
#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <map>
#include <string>
#include <vector>

namespace quarry {

namespace {

// A directory registry with local tarball sources and a project using it.
struct project_fixture : test::temp_dir_fixture {
  project_fixture() {
    globals.cache_root = root / "cache";
    globals.server = (root / "server").string();
    globals.manifest_path = root / "app" / "quarry.lua";
    globals.jobs = 2;
    write("app/quarry.lua", "-- @quarry lua \"5.4\"\nDEPENDENCIES = {\n  \"alpha\",\n}\n");
  }

  void publish(std::string const &name,
               std::string const &ver,
               std::vector<std::string> const &deps = {}) {
    auto const dir{ name + "-" + ver };
    auto const archive{ root / "dist" / (dir + ".tar.gz") };
    std::filesystem::create_directories(archive.parent_path());
    test::write_tar_gz(archive, { { dir + "/" + name + ".lua", "return '" + ver + "'\n" } });

    std::string rockspec{ "package = \"" + name + "\"\nversion = \"" + ver +
                          "\"\nsource = { url = \"" + archive.string() +
                          "\" }\ndependencies = {" };
    for (auto const &d : deps) { rockspec += " \"" + d + "\","; }
    rockspec += " }\nbuild = { type = \"builtin\", modules = { " + name + " = \"" + name +
                ".lua\" } }\n";
    write("server/" + name + "-" + ver + ".rockspec", rockspec);

    published[name].push_back(ver);
    std::string manifest{ "repository = {\n" };
    for (auto const &[pkg, versions] : published) {
      manifest += "  [\"" + pkg + "\"] = {\n";
      for (auto const &v : versions) {
        manifest += "    [\"" + v + "\"] = { { arch = \"rockspec\" } },\n";
      }
      manifest += "  },\n";
    }
    write("server/manifest-5.4", manifest + "}\n");
  }

  lockfile_data lock() const {
    auto data{ lockfile::load(root / "app" / "quarry.lock") };
    REQUIRE(data);
    return *data;
  }

  template <typename command>
  void run(typename command::cfg cfg = {}) {
    command c{ std::move(cfg), globals };
    c.execute();
  }

  void pin(std::string const &name, bool pinned) {
    cmd_pin::cfg cfg;
    cfg.name = name;
    cfg.pinned = pinned;
    run<cmd_pin>(cfg);
  }

  void add(std::string const &dep) {
    cmd_add::cfg cfg;
    cfg.dependency = dep;
    run<cmd_add>(cfg);
  }

  global_options globals;
  std::map<std::string, std::vector<std::string>> published;
};

}  // namespace

TEST_CASE_FIXTURE(project_fixture, "install, pin, lock update and remove") {
  publish("base", "1.0-1");
  publish("alpha", "1.0-1", { "base >= 1.0" });

  run<cmd_install>();
  CHECK(lock().rocks.at("alpha").version == "1.0-1");
  CHECK(lock().rocks.at("base").version == "1.0-1");
  CHECK(read("app/lua_modules/5.4/base@1.0-1/pkg/lua/base.lua") == "return '1.0-1'\n");

  // Locked versions win over newer releases.
  publish("base", "1.1-1");
  run<cmd_install>();
  CHECK(lock().rocks.at("base").version == "1.0-1");

  SUBCASE("pinned rocks survive lock update") {
    pin("base", true);
    CHECK(lock().rocks.at("base").pinned);
    run<cmd_lock_update>();
    CHECK(lock().rocks.at("base").version == "1.0-1");

    pin("base", false);
    cmd_lock_update::cfg update;
    update.names = { "base" };
    run<cmd_lock_update>(update);
    CHECK(lock().rocks.at("base").version == "1.1-1");
  }

  SUBCASE("remove uninstalls unreachable rocks") {
    publish("beta", "2.0-1");
    add("beta >= 2");
    CHECK(util_load_file_text(root / "app" / "quarry.lua").find("\"beta >= 2\"") !=
          std::string::npos);
    CHECK(lock().entrypoints == std::vector<std::string>{ "alpha", "beta" });

    cmd_remove::cfg remove;
    remove.name = "alpha";
    run<cmd_remove>(remove);
    auto const after{ lock() };
    CHECK(after.entrypoints == std::vector<std::string>{ "beta" });
    CHECK_FALSE(after.rocks.contains("alpha"));
    CHECK_FALSE(after.rocks.contains("base"));
    CHECK_FALSE(std::filesystem::exists(root / "app/lua_modules/5.4/base@1.0-1"));
    CHECK(std::filesystem::exists(root / "app/lua_modules/5.4/beta@2.0-1"));
  }

  SUBCASE("remove keeps the locked closure of a root whose constraint drifted") {
    publish("gamma", "1.0-1");
    publish("beta", "2.0-1", { "gamma" });
    add("beta >= 2");
    write("app/quarry.lua",
          "-- @quarry lua \"5.4\"\nDEPENDENCIES = {\n  \"alpha\",\n  \"beta >= 3\",\n}\n");

    cmd_remove::cfg remove;
    remove.name = "alpha";
    run<cmd_remove>(remove);
    auto const after{ lock() };
    CHECK_FALSE(after.rocks.contains("alpha"));
    CHECK(after.rocks.at("beta").version == "2.0-1");
    CHECK(after.rocks.at("gamma").version == "1.0-1");
    CHECK(after.entrypoints == std::vector<std::string>{ "beta" });
    CHECK(std::filesystem::exists(root / "app/lua_modules/5.4/beta@2.0-1"));
    CHECK(std::filesystem::exists(root / "app/lua_modules/5.4/gamma@1.0-1"));
  }
}

TEST_CASE_FIXTURE(project_fixture, "resolution failures leave the project untouched") {
  publish("alpha", "1.0-1", { "missing-dep" });
  CHECK_THROWS_AS(run<cmd_install>({}), not_found);
  CHECK_FALSE(std::filesystem::exists(root / "app" / "quarry.lock"));

  publish("gamma", "1.0-1");
  auto const before{ util_load_file_text(root / "app" / "quarry.lua") };
  CHECK_THROWS_AS(add("gamma >= 2"), constraint_conflict);
  CHECK(util_load_file_text(root / "app" / "quarry.lua") == before);
}

TEST_CASE_FIXTURE(project_fixture, "install failure reports the failing node") {
  write("server/alpha-1.0-1.rockspec",
        "package = \"alpha\"\nversion = \"1.0-1\"\n"
        "source = { url = \"" +
            (root / "nowhere.tar.gz").string() +
            "\" }\nbuild = { type = \"builtin\" }\n");
  write("server/manifest-5.4",
        "repository = { alpha = { [\"1.0-1\"] = { { arch = \"rockspec\" } } } }");

  try {
    run<cmd_install>();
    FAIL("expected install_failed");
  } catch (install_failed const &e) {
    REQUIRE(e.report().failures.size() == 1);
    CHECK(e.report().failures[0].name == "alpha");
    CHECK(exit_status_for(e) == exit_status::build);
  }
}

TEST_CASE("exit_status_for") {
  CHECK(exit_status_for(constraint_conflict("a", {})) == exit_status::resolution);
  CHECK(exit_status_for(not_found("x")) == exit_status::resolution);
  CHECK(exit_status_for(parse_error("bad", 0)) == exit_status::resolution);
  CHECK(exit_status_for(network_error("down", true)) == exit_status::network);
  CHECK(exit_status_for(compile_error("cc failed")) == exit_status::build);
  CHECK(exit_status_for(std::runtime_error("other")) == exit_status::failure);

  install_report report;
  report.failures.push_back({ .name = "a", .kind = error_kind::build });
  report.failures.push_back({ .name = "b", .kind = error_kind::integrity_violation });
  CHECK(install_failed{ report }.status() == exit_status::integrity);
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "session_context precedence") {
  auto const path{ write("p/quarry.lua",
                         "-- @quarry lua \"5.1\"\n-- @quarry cache \"c\"\n"
                         "DEPENDENCIES = {}\nVARIABLES = { CC = \"clang\" }\n") };
  auto const proj{ project::load(path) };

  auto const from_project{ session_context({}, *proj) };
  CHECK(from_project.runtime == "5.1");
  CHECK(from_project.cache_root == root / "p" / "c");
  CHECK(from_project.tree_root == root / "p" / "lua_modules");
  CHECK(from_project.variables.at("CC") == "clang");
  CHECK(from_project.variables.at("MAKE") == "make");

  global_options const flags{ .cache_root = root / "flag-cache",
                              .jobs = 7,
                              .server = "https://flags.example",
                              .lua = "5.4" };
  auto const from_flags{ session_context(flags, *proj) };
  CHECK(from_flags.runtime == "5.4");
  CHECK(from_flags.cache_root == root / "flag-cache");
  CHECK(from_flags.server == "https://flags.example");
  CHECK(from_flags.jobs == 7u);
}

}  // namespace quarry
