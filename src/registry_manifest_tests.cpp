#include "registry_manifest.h"

#include "errors.h"

#include "doctest.h"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace quarry {

namespace {

std::vector<std::string> texts(std::vector<version> const &vs) {
  std::vector<std::string> out;
  for (auto const &v : vs) { out.push_back(v.text()); }
  return out;
}

}  // namespace

TEST_CASE("registry_manifest_parse: versions with rockspecs, ascending") {
  auto const index{ registry_manifest_parse(R"lua(
commands = {}
repository = {
  inspect = {
    ["3.1.3-0"] = { { arch = "rockspec" } },
    ["3.1.2-0"] = { { arch = "rockspec" }, { arch = "all" } },
  },
  LuaFileSystem = {
    ["1.8.0-1"] = { { arch = "src" } },
    ["scm-1"] = { { arch = "rockspec" } },
    ["1.7.0-2"] = { { arch = "linux-x86_64" } },
  },
  binonly = {
    ["1.0-1"] = { { arch = "macosx-arm64" } },
  },
  weird = {
    ["not a version"] = { { arch = "rockspec" } },
  },
}
)lua") };

  CHECK(texts(index.at("inspect")) == std::vector<std::string>{ "3.1.2-0", "3.1.3-0" });
  CHECK(texts(index.at("luafilesystem")) ==
        std::vector<std::string>{ "scm-1", "1.8.0-1" });
  CHECK_FALSE(index.contains("binonly"));
  CHECK_FALSE(index.contains("weird"));
}

TEST_CASE("registry_manifest_parse: malformed input") {
  CHECK_THROWS_AS(registry_manifest_parse("repository = "), malformed_index);
  CHECK_THROWS_AS(registry_manifest_parse("x = 1"), malformed_index);
  CHECK_THROWS_AS(registry_manifest_parse("repository = { a = 1 }"), malformed_index);
  CHECK_THROWS_WITH_AS(registry_manifest_parse("x = 1", "manifest-5.3"),
                       doctest::Contains("manifest-5.3"),
                       malformed_index);
}

TEST_CASE("registry_manifest_parse: runaway evaluation is cut off") {
  CHECK_THROWS_WITH_AS(
      registry_manifest_parse("while true do end", "manifest-5.4", std::chrono::milliseconds{ 50 }),
      doctest::Contains("evaluation exceeded 50ms"),
      malformed_index);

  std::atomic_bool const cancel{ true };
  CHECK_THROWS_AS(
      registry_manifest_parse("while true do end", "manifest-5.4", std::nullopt, &cancel),
      cancelled);
}

}  // namespace quarry
