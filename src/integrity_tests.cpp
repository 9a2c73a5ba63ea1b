#include "integrity.h"

#include "errors.h"
#include "test_support.h"

#include "doctest.h"

#include <filesystem>

namespace quarry {

namespace {

constexpr char const *kAbcSri{ "sha256-ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0=" };

}  // namespace

TEST_CASE("integrity: bytes produce SRI strings") {
  CHECK(integrity::of_bytes("abc") == kAbcSri);
}

TEST_CASE("integrity: normalize accepts hex and SRI") {
  CHECK(integrity::normalize(kAbcSri) == kAbcSri);
  CHECK(integrity::normalize(
            "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD") ==
        kAbcSri);
  CHECK_THROWS_AS(integrity::normalize("md5-abc"), parse_error);
  CHECK_THROWS_AS(integrity::normalize("sha256-!!!"), parse_error);
}

TEST_CASE("integrity: verify reports expected and actual") {
  CHECK_NOTHROW(integrity::verify(kAbcSri, integrity::of_bytes("abc"), "foo"));
  try {
    integrity::verify(kAbcSri, integrity::of_bytes("abd"), "foo@1.0-1 source");
    FAIL_CHECK("expected integrity_violation");
  } catch (integrity_violation const &e) {
    CHECK(e.subject() == "foo@1.0-1 source");
    CHECK(e.expected() == kAbcSri);
    CHECK(e.actual() == integrity::of_bytes("abd"));
    CHECK(e.kind() == error_kind::integrity_violation);
  }
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "integrity: file hashes its bytes") {
  auto const f{ write("a.txt", "abc") };
  CHECK(integrity::of_path(f) == kAbcSri);
  CHECK(integrity::of_file(f) == kAbcSri);
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "integrity: directory digest is canonical") {
  write("tree/b.lua", "return 2");
  write("tree/a/x.lua", "return 1");

  auto const first{ integrity::of_path(root / "tree") };

  SUBCASE("stable across calls") { CHECK(integrity::of_path(root / "tree") == first); }

  SUBCASE("ignores .git") {
    write("tree/.git/HEAD", "ref: refs/heads/main");
    CHECK(integrity::of_path(root / "tree") == first);
  }

  SUBCASE("content change is detected") {
    write("tree/b.lua", "return 3");
    CHECK(integrity::of_path(root / "tree") != first);
  }

  SUBCASE("rename is detected") {
    std::filesystem::rename(root / "tree/b.lua", root / "tree/c.lua");
    CHECK(integrity::of_path(root / "tree") != first);
  }
}

}  // namespace quarry
