#include "rockspec.h"

#include "errors.h"
#include "integrity.h"

#include "doctest.h"

#include <atomic>
#include <chrono>

#include <string>
#include <variant>

namespace quarry {

namespace {

constexpr char const *kLuaFileSystem{ R"lua(
package = "LuaFileSystem"
version = "1.8.0-1"
source = {
  url = "git+https://github.com/keplerproject/luafilesystem",
  tag = "v1_8_0",
}
dependencies = {
  "lua >= 5.1",
}
build = {
  type = "builtin",
  modules = {
    lfs = "src/lfs.c",
  },
  copy_directories = { "docs" },
}
)lua" };

constexpr char const *kPenlight{ R"lua(
package = "penlight"
version = "1.13.1-1"
source = {
  url = "https://github.com/lunarmodules/penlight/archive/1.13.1.tar.gz",
  dir = "penlight-1.13.1",
  hash = "sha256-ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0=",
}
dependencies = { "luafilesystem >= 1.5", "lua >= 5.1, < 5.5" }
build = {
  type = "builtin",
  modules = {
    ["pl.init"] = "lua/pl/init.lua",
    ["pl.utils"] = "lua/pl/utils.lua",
  },
}
)lua" };

}  // namespace

TEST_CASE("rockspec: compiled extension") {
  auto const d{ rockspec_parse(kLuaFileSystem) };
  CHECK(d->name == "luafilesystem");
  CHECK(d->version.text() == "1.8.0-1");
  CHECK(d->dependencies.empty());
  REQUIRE(d->runtime_constraint.has_value());
  CHECK(d->runtime_constraint->satisfied_by(version::parse("5.4")));

  CHECK(d->source.is_git());
  CHECK(d->source.git_ref() == "v1_8_0");

  auto const *spec{ std::get_if<compiled_extension_spec>(&d->build) };
  REQUIRE(spec);
  REQUIRE(spec->native_modules.size() == 1);
  CHECK(spec->native_modules[0].module == "lfs");
  CHECK(spec->native_modules[0].sources == std::vector<std::string>{ "src/lfs.c" });
  CHECK(d->copy_directories == std::vector<std::string>{ "docs" });
  CHECK(build_spec_tag(d->build) == "builtin");
}

TEST_CASE("rockspec: builtin pure lua") {
  auto const d{ rockspec_parse(kPenlight) };
  REQUIRE(d->dependencies.size() == 1);
  CHECK(d->dependencies[0].name == "luafilesystem");
  CHECK(d->source.dir == "penlight-1.13.1");
  CHECK(d->source.hash == "sha256-ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0=");
  CHECK_FALSE(d->source.is_git());

  auto const *spec{ std::get_if<builtin_spec>(&d->build) };
  REQUIRE(spec);
  CHECK_FALSE(spec->autodetect);
  REQUIRE(spec->modules.size() == 2);
  CHECK(spec->modules[0].module == "pl.init");
  CHECK(spec->modules[1].path == "lua/pl/utils.lua");
}

TEST_CASE("rockspec: integrity covers the exact bytes") {
  auto const d{ rockspec_parse(kPenlight) };
  CHECK(d->rockspec_integrity == integrity::of_bytes(kPenlight));
}

TEST_CASE("rockspec: native module table form") {
  auto const d{ rockspec_parse(R"lua(
package = "luasocket"
version = "3.1.0-1"
source = { url = "https://example.com/luasocket-3.1.0.tar.gz" }
external_dependencies = { SSL = { header = "openssl/ssl.h", library = "ssl" } }
build = {
  type = "builtin",
  modules = {
    ["socket.core"] = {
      sources = { "src/luasocket.c", "src/timeout.c" },
      defines = { "LUASOCKET_DEBUG" },
      libraries = "ssl",
      incdirs = { "$(SSL_INCDIR)" },
    },
    socket = "src/socket.lua",
    ["mime.core"] = { "src/mime.c", "src/compat.c" },
  },
}
)lua") };

  auto const *spec{ std::get_if<compiled_extension_spec>(&d->build) };
  REQUIRE(spec);
  REQUIRE(spec->lua_modules.size() == 1);
  CHECK(spec->lua_modules[0].module == "socket");
  REQUIRE(spec->native_modules.size() == 2);
  CHECK(spec->native_modules[0].module == "mime.core");
  CHECK(spec->native_modules[0].sources.size() == 2);
  auto const &core{ spec->native_modules[1] };
  CHECK(core.module == "socket.core");
  CHECK(core.defines == std::vector<std::string>{ "LUASOCKET_DEBUG" });
  CHECK(core.libraries == std::vector<std::string>{ "ssl" });
  CHECK(core.incdirs == std::vector<std::string>{ "$(SSL_INCDIR)" });

  REQUIRE(d->external_dependencies.contains("SSL"));
  CHECK(d->external_dependencies.at("SSL").header == "openssl/ssl.h");
  CHECK(d->external_dependencies.at("SSL").library == "ssl");
}

TEST_CASE("rockspec: external tool variants") {
  SUBCASE("make") {
    auto const d{ rockspec_parse(R"lua(
package = "lpeg" version = "1.1.0-1"
source = { url = "https://example.com/lpeg.tar.gz" }
build = {
  type = "make",
  build_target = "linux",
  install_pass = false,
  build_variables = { CFLAGS = "$(CFLAGS) -DNDEBUG" },
  install_variables = { INST_LIBDIR = "$(LIBDIR)" },
}
)lua") };
    auto const *spec{ std::get_if<external_tool_spec>(&d->build) };
    REQUIRE(spec);
    CHECK(spec->tool == external_tool_kind::make);
    CHECK(spec->makefile == "Makefile");
    CHECK(spec->build_target == "linux");
    CHECK(spec->build_pass);
    CHECK_FALSE(spec->install_pass);
    CHECK(spec->install_target == "install");
    CHECK(spec->build_variables.at("CFLAGS") == "$(CFLAGS) -DNDEBUG");
    CHECK(spec->install_variables.at("INST_LIBDIR") == "$(LIBDIR)");
  }
  SUBCASE("cmake") {
    auto const d{ rockspec_parse(R"lua(
package = "x" version = "1.0-1"
source = { url = "https://example.com/x.tar.gz" }
build = { type = "cmake", variables = { BUILD_SHARED = "ON", LEVEL = 3 }, cmake = "project(x)" }
)lua") };
    auto const *spec{ std::get_if<external_tool_spec>(&d->build) };
    REQUIRE(spec);
    CHECK(spec->tool == external_tool_kind::cmake);
    CHECK(spec->variables.at("BUILD_SHARED") == "ON");
    CHECK(spec->variables.at("LEVEL") == "3");
    CHECK(spec->cmake_lists_content == "project(x)");
  }
  SUBCASE("command") {
    auto const d{ rockspec_parse(R"lua(
package = "x" version = "1.0-1"
source = { url = "https://example.com/x.tar.gz" }
build = { type = "command", build_command = "make all", install_command = "make install" }
)lua") };
    auto const *spec{ std::get_if<external_tool_spec>(&d->build) };
    REQUIRE(spec);
    CHECK(spec->tool == external_tool_kind::command);
    CHECK(spec->build_command == "make all");
    CHECK(spec->install_command == "make install");
    CHECK(build_spec_tag(d->build) == "command");
  }
}

TEST_CASE("rockspec: script and unsupported types") {
  auto const script{ rockspec_parse(R"lua(
package = "gen" version = "0.1-1"
source = { url = "https://example.com/gen.tar.gz" }
build = { type = "script", inline = "function build(ctx) end" }
)lua") };
  auto const *spec{ std::get_if<user_script_spec>(&script->build) };
  REQUIRE(spec);
  CHECK(spec->inline_code == "function build(ctx) end");
  CHECK_FALSE(spec->script.has_value());

  auto const rust{ rockspec_parse(R"lua(
package = "r" version = "0.1-1"
source = { url = "https://example.com/r.tar.gz" }
build = { type = "rust-mlua" }
)lua") };
  auto const *unsupported{ std::get_if<unsupported_build_spec>(&rust->build) };
  REQUIRE(unsupported);
  CHECK(unsupported->tag == "rust-mlua");
}

TEST_CASE("rockspec: treesitter parser") {
  auto const d{ rockspec_parse(R"lua(
package = "tree-sitter-demo" version = "0.0.1-1"
source = { url = "https://example.com/tree-sitter-demo.tar.gz" }
build_dependencies = { "luarocks-build-treesitter-parser >= 5" }
build = {
  type = "treesitter-parser",
  lang = "demo",
  generate = true,
  location = "grammar",
  queries = { ["highlights.scm"] = "(x) @y" },
}
)lua") };
  auto const *spec{ std::get_if<treesitter_parser_spec>(&d->build) };
  REQUIRE(spec);
  CHECK(spec->lang == "demo");
  CHECK(spec->parser);
  CHECK(spec->generate);
  CHECK(spec->location == "grammar");
  CHECK(spec->queries.at("highlights.scm") == "(x) @y");
  CHECK(build_spec_tag(d->build) == "treesitter-parser");

  REQUIRE(d->all_dependencies().size() == 1);
  CHECK(d->all_dependencies()[0].name == "luarocks-build-treesitter-parser");

  CHECK_THROWS_AS(rockspec_parse(R"lua(
package = "t" version = "0.1-1" source = { url = "x" }
build = { type = "treesitter-parser" }
)lua"),
                  parse_error);
  CHECK_THROWS_WITH_AS(rockspec_parse(R"lua(
package = "t" version = "0.1-1" source = { url = "x" }
build = { type = "treesitter-parser", lang = "t", queries = { ["../evil.scm"] = "" } }
)lua"),
                       doctest::Contains("escapes"),
                       parse_error);
}

TEST_CASE("rockspec: no build table autodetects modules") {
  auto const d{ rockspec_parse(R"lua(
package = "inspect" version = "3.1.3-0"
source = { url = "https://example.com/inspect.tar.gz" }
)lua") };
  auto const *spec{ std::get_if<builtin_spec>(&d->build) };
  REQUIRE(spec);
  CHECK(spec->autodetect);

  auto const none{ rockspec_parse(R"lua(
package = "docs" version = "1-1"
source = { url = "https://example.com/docs.tar.gz" }
build = { type = "none", install = { lua = { "docs.lua" }, bin = { ["docs-tool"] = "bin/tool" } } }
)lua") };
  auto const *none_spec{ std::get_if<builtin_spec>(&none->build) };
  REQUIRE(none_spec);
  CHECK_FALSE(none_spec->autodetect);
  CHECK(none->install.lua.at("docs") == "docs.lua");
  CHECK(none->install.bin.at("docs-tool") == "bin/tool");
}

TEST_CASE("rockspec: platform overrides merge into the base table") {
  constexpr char const *text{ R"lua(
package = "p" version = "1.0-1"
source = { url = "https://example.com/p.tar.gz" }
build = {
  type = "builtin",
  modules = { p = "p.lua" },
  platforms = {
    unix = { modules = { ["p.native"] = "p.c" } },
    macosx = { modules = { p = "p_mac.lua" } },
  },
}
)lua" };

  auto const on_linux{ rockspec_parse(text, "p.rockspec", { .os = "linux" }) };
  auto const *linux_spec{ std::get_if<compiled_extension_spec>(&on_linux->build) };
  REQUIRE(linux_spec);
  CHECK(linux_spec->lua_modules.at(0).path == "p.lua");

  auto const mac{ rockspec_parse(text, "p.rockspec", { .os = "macosx" }) };
  auto const *mac_spec{ std::get_if<compiled_extension_spec>(&mac->build) };
  REQUIRE(mac_spec);
  CHECK(mac_spec->lua_modules.at(0).path == "p_mac.lua");
}

TEST_CASE("rockspec: platform chain") {
  CHECK(rockspec_platform_chain("linux") == std::vector<std::string>{ "unix", "linux" });
  CHECK(rockspec_platform_chain("macosx").front() == "unix");
}

TEST_CASE("rockspec: runaway evaluation is cut off") {
  rockspec_options const opts{ .eval_timeout = std::chrono::milliseconds{ 50 } };

  SUBCASE("top-level loop") {
    CHECK_THROWS_WITH_AS(rockspec_parse("while true do end", "loop-1.0-1.rockspec", opts),
                         doctest::Contains("evaluation exceeded 50ms"),
                         parse_error);
  }
  SUBCASE("cancellation") {
    std::atomic_bool const cancel{ true };
    CHECK_THROWS_AS(rockspec_parse("while true do end",
                                   "loop-1.0-1.rockspec",
                                   rockspec_options{ .cancel = &cancel }),
                    cancelled);
  }
  SUBCASE("ordinary rockspecs are unaffected") {
    CHECK(rockspec_parse(R"(package = "a" version = "1.0-1" source = { url = "x" })",
                         "a-1.0-1.rockspec",
                         opts)
              ->name == "a");
  }
}

TEST_CASE("rockspec: errors are parse_errors") {
  SUBCASE("syntax error") {
    CHECK_THROWS_AS(rockspec_parse("package = "), parse_error);
  }
  SUBCASE("missing package") {
    CHECK_THROWS_WITH_AS(rockspec_parse(R"(version = "1.0-1" source = { url = "x" })"),
                         doctest::Contains("package is required"),
                         parse_error);
  }
  SUBCASE("bad version") {
    CHECK_THROWS_AS(rockspec_parse(R"(package = "a" version = "1.x" source = { url = "x" })"),
                    parse_error);
  }
  SUBCASE("missing source") {
    CHECK_THROWS_AS(rockspec_parse(R"(package = "a" version = "1.0-1")"), parse_error);
  }
  SUBCASE("bad dependency") {
    CHECK_THROWS_WITH_AS(rockspec_parse(R"lua(
package = "a" version = "1.0-1" source = { url = "x" }
dependencies = { "b >= nope" }
)lua"),
                         doctest::Contains("dependencies[1]"),
                         parse_error);
  }
  SUBCASE("version given as a number") {
    CHECK_THROWS_AS(rockspec_parse(R"(package = "a" version = 1 source = { url = "x" })"),
                    parse_error);
  }
  SUBCASE("script without body") {
    CHECK_THROWS_AS(rockspec_parse(R"lua(
package = "a" version = "1.0-1" source = { url = "x" } build = { type = "script" }
)lua"),
                    parse_error);
  }
  SUBCASE("tag and branch together") {
    CHECK_THROWS_AS(rockspec_parse(R"lua(
package = "a" version = "1.0-1" source = { url = "git://x", tag = "a", branch = "b" }
)lua"),
                    parse_error);
  }
  SUBCASE("malformed source hash") {
    CHECK_THROWS_AS(rockspec_parse(R"lua(
package = "a" version = "1.0-1" source = { url = "x", hash = "md5-abc" }
)lua"),
                    parse_error);
  }
  SUBCASE("sandbox has no io") {
    CHECK_THROWS_AS(rockspec_parse(R"(io.open("/etc/passwd"))"), parse_error);
  }
}

}  // namespace quarry
