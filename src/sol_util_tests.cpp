#include "sol_util.h"

#include "doctest.h"

#include <atomic>
#include <chrono>
#include <stdexcept>

namespace quarry {

TEST_CASE("sol_util_make_lua_state opens the standard libraries") {
  auto lua{ sol_util_make_lua_state() };
  REQUIRE(lua);

  lua->script("x = math.floor(7 / 2) .. string.upper('k') .. type(os.time)");
  std::string const x = (*lua)["x"];
  CHECK(x == "3Kfunction");
}

TEST_CASE("sol_util_make_lua_state error() carries a traceback") {
  auto lua{ sol_util_make_lua_state() };
  auto result = lua->safe_script("local function f() error('boom') end f()",
                                 sol::script_pass_on_error);
  CHECK_FALSE(result.valid());
  sol::error err = result;
  std::string const msg{ err.what() };
  CHECK(msg.find("boom") != std::string::npos);
  CHECK(msg.find("stack traceback:") != std::string::npos);
}

TEST_CASE("sol_util_make_sandboxed_state hides os, io and file loaders") {
  auto lua{ sol_util_make_sandboxed_state() };
  lua->script("r = tostring(os) .. tostring(io) .. tostring(dofile) .. tostring(loadfile)");
  std::string const r = (*lua)["r"];
  CHECK(r == "nilnilnilnil");

  lua->script("s = table.concat({ string.rep('a', 2), tostring(math.max(1, 3)) }, '-')");
  std::string const s = (*lua)["s"];
  CHECK(s == "aa-3");
}

TEST_CASE("sol_util_make_sandboxed_state load accepts text only") {
  auto lua{ sol_util_make_sandboxed_state() };
  lua->script(R"lua(
    local f = load("return 41 + 1")
    text_ok = f()
    local bin = string.dump(function() return 1 end)
    local g, err = load(bin)
    binary_rejected = (g == nil) and (err ~= nil)
  )lua");
  CHECK((*lua)["text_ok"].get<int>() == 42);
  CHECK((*lua)["binary_rejected"].get<bool>());
}

TEST_CASE("sol_util_run_script surfaces the Lua message") {
  auto lua{ sol_util_make_sandboxed_state() };
  CHECK_NOTHROW(sol_util_run_script(*lua, "a = 1", "ok"));
  try {
    sol_util_run_script(*lua, "this is not lua", "broken.lua");
    FAIL_CHECK("expected std::runtime_error");
  } catch (std::runtime_error const &e) {
    CHECK(std::string{ e.what() }.find("broken.lua") != std::string::npos);
  }
}

TEST_CASE("sol_util_get_optional reads typed fields") {
  auto lua{ sol_util_make_sandboxed_state() };
  lua->script("t = { flag = true, name = 'x', count = 3, nested = {} }");
  sol::table t = (*lua)["t"];

  CHECK(sol_util_get_optional<bool>(t, "flag", "t") == true);
  CHECK(sol_util_get_optional<std::string>(t, "name", "t") == "x");
  CHECK(sol_util_get_optional<int>(t, "count", "t") == 3);
  CHECK(sol_util_get_optional<sol::table>(t, "nested", "t").has_value());
  CHECK_FALSE(sol_util_get_optional<bool>(t, "missing", "t").has_value());
}

TEST_CASE("sol_util_get_optional rejects wrong types") {
  auto lua{ sol_util_make_sandboxed_state() };
  lua->script("t = { flag = 'yes', name = 12 }");
  sol::table t = (*lua)["t"];

  CHECK_THROWS_WITH_AS(sol_util_get_optional<bool>(t, "flag", "rockspec"),
                       "rockspec: flag must be a boolean",
                       std::runtime_error);
  CHECK_THROWS_WITH_AS(sol_util_get_optional<std::string>(t, "name", "rockspec"),
                       "rockspec: name must be a string",
                       std::runtime_error);
}

TEST_CASE("sol_util_get_required and get_or_default") {
  auto lua{ sol_util_make_sandboxed_state() };
  lua->script("t = { package = 'foo' }");
  sol::table t = (*lua)["t"];

  CHECK(sol_util_get_required<std::string>(t, "package", "rockspec") == "foo");
  CHECK_THROWS_WITH_AS(sol_util_get_required<std::string>(t, "version", "rockspec"),
                       "rockspec: version is required",
                       std::runtime_error);
  CHECK(sol_util_get_or_default<std::string>(t, "tag", "main", "rockspec") == "main");
}

TEST_CASE("sol_util_get_string_list") {
  auto lua{ sol_util_make_sandboxed_state() };
  lua->script("t = { deps = { 'a', 'b >= 1' }, one = 'c', bad = { 1 }, none = nil }");
  sol::table t = (*lua)["t"];

  CHECK(sol_util_get_string_list(t, "deps", "t") ==
        std::vector<std::string>{ "a", "b >= 1" });
  CHECK(sol_util_get_string_list(t, "one", "t") == std::vector<std::string>{ "c" });
  CHECK(sol_util_get_string_list(t, "none", "t").empty());
  CHECK_THROWS_WITH_AS(sol_util_get_string_list(t, "bad", "t"),
                       "t: bad[1] must be a string",
                       std::runtime_error);
}

TEST_CASE("sol_util_script_guard stops runaway chunks") {
  auto lua{ sol_util_make_sandboxed_state() };

  SUBCASE("deadline") {
    sol_util_script_guard const guard{ *lua, std::chrono::milliseconds{ 20 } };
    CHECK_THROWS_WITH_AS(sol_util_run_script(*lua, "while true do end", "loop"),
                         doctest::Contains("deadline exceeded"),
                         std::runtime_error);
    CHECK(guard.timed_out());
    CHECK_FALSE(guard.was_cancelled());
  }

  SUBCASE("cancellation") {
    std::atomic_bool const cancel{ true };
    sol_util_script_guard const guard{ *lua, std::chrono::minutes{ 1 }, &cancel };
    CHECK_THROWS_AS(sol_util_run_script(*lua, "while true do end", "loop"),
                    std::runtime_error);
    CHECK(guard.was_cancelled());
  }

  SUBCASE("hook is removed with the guard") {
    {
      sol_util_script_guard const guard{ *lua, std::chrono::milliseconds{ 0 } };
    }
    sol_util_run_script(*lua, "local n = 0 for i = 1, 100000 do n = n + i end", "sum");
  }
}

}  // namespace quarry
