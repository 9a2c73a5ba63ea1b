#include "util.h"

#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace quarry {

TEST_CASE("match dispatches on variant alternative") {
  using var_t = std::variant<int, std::string>;
  auto const visitor{ match{ [](int x) { return x * 2; },
                             [](std::string const &s) { return static_cast<int>(s.size()); } } };

  CHECK(std::visit(visitor, var_t{ 42 }) == 84);
  CHECK(std::visit(visitor, var_t{ std::string{ "hello" } }) == 5);
}

TEST_CASE("util_bytes_to_hex") {
  CHECK(util_bytes_to_hex("", 0).empty());

  unsigned char const data[]{ 0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF, 0x00 };
  CHECK(util_bytes_to_hex(data, sizeof data) == "0123456789abcdef00");
}

TEST_CASE("util_hex_to_bytes") {
  SUBCASE("mixed case") {
    auto const bytes{ util_hex_to_bytes("00aBfF") };
    REQUIRE(bytes.size() == 3);
    CHECK(bytes[0] == 0x00);
    CHECK(bytes[1] == 0xab);
    CHECK(bytes[2] == 0xff);
  }

  SUBCASE("odd length") { CHECK_THROWS_AS(util_hex_to_bytes("abc"), std::runtime_error); }

  SUBCASE("invalid character") {
    CHECK_THROWS_WITH_AS(util_hex_to_bytes("0g"),
                         doctest::Contains("position 1"),
                         std::runtime_error);
  }
}

TEST_CASE("util_hex_char_to_int") {
  CHECK(util_hex_char_to_int('0') == 0);
  CHECK(util_hex_char_to_int('a') == 10);
  CHECK(util_hex_char_to_int('F') == 15);
  CHECK(util_hex_char_to_int('z') == -1);
}

TEST_CASE("util_trim and util_to_lower") {
  CHECK(util_trim("  a b \t\n") == "a b");
  CHECK(util_trim(" \n ").empty());
  CHECK(util_trim("").empty());
  CHECK(util_to_lower("LuaSocket-3.0") == "luasocket-3.0");
}

TEST_CASE("util_substitute_vars") {
  std::map<std::string, std::string> const vars{ { "LUA_INCDIR", "/inc" },
                                                 { "CC", "cc" } };
  auto const lookup{ [&](std::string const &name) {
    auto const it{ vars.find(name) };
    return it == vars.end() ? std::string{} : it->second;
  } };

  CHECK(util_substitute_vars("$(CC) -I$(LUA_INCDIR) x.c", lookup) == "cc -I/inc x.c");
  CHECK(util_substitute_vars("$(UNKNOWN)-", lookup) == "-");
  CHECK(util_substitute_vars("$(unterminated", lookup) == "$(unterminated");
  CHECK(util_substitute_vars("$ ( plain", lookup) == "$ ( plain");
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "util file loading") {
  auto const path{ write("data.bin", std::string{ "a\0b", 3 }) };

  CHECK(util_load_file(path).size() == 3);
  CHECK(util_load_file_text(path) == std::string{ "a\0b", 3 });
  CHECK(util_load_file_text(write("empty", "")).empty());
  CHECK_THROWS_AS(util_load_file(root / "missing"), std::runtime_error);
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "util_write_file_atomic") {
  auto const path{ root / "nested" / "dir" / "out.txt" };

  util_write_file_atomic(path, "first");
  CHECK(util_load_file_text(path) == "first");

  util_write_file_atomic(path, "second");
  CHECK(util_load_file_text(path) == "second");

  std::vector<std::string> names;
  for (auto const &e : std::filesystem::directory_iterator(path.parent_path())) {
    names.push_back(e.path().filename().string());
  }
  CHECK(names == std::vector<std::string>{ "out.txt" });
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "scoped_path_cleanup") {
  auto const dir{ root / "scratch" };

  SUBCASE("removes on destruction") {
    std::filesystem::create_directories(dir / "sub");
    { scoped_path_cleanup const cleanup{ dir }; }
    CHECK_FALSE(std::filesystem::exists(dir));
  }

  SUBCASE("reset removes the previous path and tracks the new one") {
    write("scratch/file", "x");
    auto const other{ write("other/file", "y").parent_path() };
    {
      scoped_path_cleanup cleanup{ other };
      cleanup.reset(dir);
      CHECK_FALSE(std::filesystem::exists(other));
      CHECK(cleanup.path() == dir);
    }
    CHECK_FALSE(std::filesystem::exists(dir));
  }
}

}  // namespace quarry
