#include "extract.h"

#include "errors.h"
#include "test_support.h"

#include "doctest.h"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

namespace quarry {

namespace {

std::vector<std::string> collect_files_recursive(std::filesystem::path const &root) {
  std::vector<std::string> files;
  for (auto const &entry : std::filesystem::recursive_directory_iterator(root)) {
    if (entry.is_regular_file()) {
      files.push_back(std::filesystem::relative(entry.path(), root).generic_string());
    }
  }
  std::ranges::sort(files);
  return files;
}

test::archive_entries_t const kRockTree{
  { "lpeg-1.1.0/lpeg.c", "int x;\n" },
  { "lpeg-1.1.0/re.lua", "return {}\n" },
  { "lpeg-1.1.0/doc/index.html", "<html/>" },
};

}  // namespace

TEST_CASE_FIXTURE(test::temp_dir_fixture, "extract preserves structure") {
  auto const archive{ root / "lpeg.tar.gz" };
  test::write_tar_gz(archive, kRockTree);

  CHECK(extract(archive, root / "out") == 3);
  CHECK(collect_files_recursive(root / "out") ==
        std::vector<std::string>{ "lpeg-1.1.0/doc/index.html",
                                  "lpeg-1.1.0/lpeg.c",
                                  "lpeg-1.1.0/re.lua" });
  CHECK(read("out/lpeg-1.1.0/re.lua") == "return {}\n");
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "extract strips leading components") {
  auto const archive{ root / "lpeg.tar.gz" };
  test::write_tar_gz(archive, kRockTree);

  SUBCASE("one level") {
    CHECK(extract(archive, root / "out", { .strip_components = 1 }) == 3);
    CHECK(collect_files_recursive(root / "out") ==
          std::vector<std::string>{ "doc/index.html", "lpeg.c", "re.lua" });
  }
  SUBCASE("two levels keeps only deep files") {
    CHECK(extract(archive, root / "out", { .strip_components = 2 }) == 1);
    CHECK(collect_files_recursive(root / "out") ==
          std::vector<std::string>{ "index.html" });
  }
  SUBCASE("too many levels leaves nothing") {
    CHECK_THROWS_AS(extract(archive, root / "out", { .strip_components = 5 }),
                    std::runtime_error);
  }
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "extract refuses entries escaping destination") {
  auto const archive{ root / "evil.tar.gz" };
  test::write_tar_gz(archive, { { "ok.txt", "x" }, { "../../escape.txt", "y" } });

  CHECK_THROWS_AS(extract(archive, root / "out"), std::runtime_error);
  CHECK_FALSE(std::filesystem::exists(root / "escape.txt"));
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "extract rejects a corrupt archive") {
  write("broken.tar.gz", "this is not gzip data");
  CHECK_THROWS_AS(extract(root / "broken.tar.gz", root / "out"), std::runtime_error);
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "extract honours the cancel flag") {
  auto const archive{ root / "lpeg.tar.gz" };
  test::write_tar_gz(archive, kRockTree);
  std::atomic_bool cancel{ true };
  CHECK_THROWS_AS(extract(archive, root / "out", { .cancel = &cancel }), cancelled);
}

TEST_CASE("extract_is_archive_extension") {
  CHECK(extract_is_archive_extension("lpeg-1.1.0.tar.gz"));
  CHECK(extract_is_archive_extension("x.TGZ"));
  CHECK(extract_is_archive_extension("luasocket-3.1.0.zip"));
  CHECK(extract_is_archive_extension("/tmp/a/b.tar.bz2"));
  CHECK(extract_is_archive_extension("foo.src.rock"));
  CHECK_FALSE(extract_is_archive_extension("init.lua"));
  CHECK_FALSE(extract_is_archive_extension("README"));
  CHECK_FALSE(extract_is_archive_extension(".zip"));
}

TEST_CASE_FIXTURE(test::temp_dir_fixture,
                  "extract_source detects a single top-level directory") {
  auto const archive{ root / "lpeg.tar.gz" };
  test::write_tar_gz(archive, kRockTree);

  auto const src{ extract_source(archive, root / "work") };
  CHECK(src == root / "work" / "lpeg-1.1.0");
  CHECK(std::filesystem::exists(src / "lpeg.c"));
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "extract_source honours an explicit dir") {
  auto const archive{ root / "pkg.tar.gz" };
  test::write_tar_gz(archive, { { "a/x.lua", "" }, { "b/src/y.lua", "" } });

  CHECK(extract_source(archive, root / "work", std::string{ "b" }) == root / "work" / "b");
  CHECK_THROWS_AS(extract_source(archive, root / "work2", std::string{ "c" }),
                  missing_file);
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "extract_source with multiple top-level entries") {
  auto const archive{ root / "flat.tar.gz" };
  test::write_tar_gz(archive, { { "a.lua", "" }, { "b.lua", "" } });
  CHECK(extract_source(archive, root / "work") == root / "work");
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "extract_source copies plain files and trees") {
  SUBCASE("single lua file") {
    auto const file{ write("dl/inspect.lua", "return 1\n") };
    auto const src{ extract_source(file, root / "work") };
    CHECK(src == root / "work");
    CHECK(read("work/inspect.lua") == "return 1\n");
  }
  SUBCASE("checkout directory without .git") {
    write("co/.git/HEAD", "ref");
    write("co/src/m.lua", "return {}");
    auto const src{ extract_source(root / "co", root / "work") };
    CHECK(std::filesystem::exists(src / "src" / "m.lua"));
    CHECK_FALSE(std::filesystem::exists(src / ".git"));
  }
  SUBCASE("missing artifact") {
    CHECK_THROWS_AS(extract_source(root / "nope.lua", root / "work"), not_found);
  }
}

}  // namespace quarry
