#include "fetch.h"

#include "errors.h"
#include "libgit2_util.h"
#include "test_support.h"

#include "doctest.h"
#include "git2.h"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace quarry {

namespace {

// Commits every file under `dir` and tags the commit.
void git_commit_all(std::filesystem::path const &dir, char const *tag) {
  git_repository *repo{ nullptr };
  REQUIRE(git_repository_open(&repo, dir.string().c_str()) == 0);

  git_index *index{ nullptr };
  REQUIRE(git_repository_index(&index, repo) == 0);
  char *all{ const_cast<char *>("*") };
  git_strarray paths{ &all, 1 };
  REQUIRE(git_index_add_all(index, &paths, GIT_INDEX_ADD_DEFAULT, nullptr, nullptr) == 0);
  REQUIRE(git_index_write(index) == 0);

  git_oid tree_id{};
  REQUIRE(git_index_write_tree(&tree_id, index) == 0);
  git_tree *tree{ nullptr };
  REQUIRE(git_tree_lookup(&tree, repo, &tree_id) == 0);

  git_signature *sig{ nullptr };
  REQUIRE(git_signature_now(&sig, "quarry", "quarry@example.invalid") == 0);

  git_oid parent_id{};
  git_commit *parent{ nullptr };
  bool const has_parent{ git_reference_name_to_id(&parent_id, repo, "HEAD") == 0 };
  if (has_parent) { REQUIRE(git_commit_lookup(&parent, repo, &parent_id) == 0); }

  git_commit const *parents[]{ parent };
  git_oid commit_id{};
  REQUIRE(git_commit_create(&commit_id,
                            repo,
                            "HEAD",
                            sig,
                            sig,
                            nullptr,
                            tag,
                            tree,
                            has_parent ? 1 : 0,
                            parents) == 0);

  git_object *commit_obj{ nullptr };
  REQUIRE(git_object_lookup(&commit_obj, repo, &commit_id, GIT_OBJECT_COMMIT) == 0);
  git_oid tag_id{};
  REQUIRE(git_tag_create_lightweight(&tag_id, repo, tag, commit_obj, 0) == 0);

  git_object_free(commit_obj);
  if (parent) { git_commit_free(parent); }
  git_signature_free(sig);
  git_tree_free(tree);
  git_index_free(index);
  git_repository_free(repo);
}

}  // namespace

TEST_CASE("fetch_request_for picks the transport") {
  auto const dest{ std::filesystem::path{ "/tmp/x" } };
  CHECK(std::holds_alternative<fetch_request_url>(
      fetch_request_for("https://x.org/a.tar.gz", dest, "", std::nullopt)));
  CHECK(std::holds_alternative<fetch_request_git>(
      fetch_request_for("git+https://github.com/a/b", dest, "v1", std::nullopt)));
  CHECK(std::holds_alternative<fetch_request_file>(
      fetch_request_for("file:///srv/src", dest, "", std::nullopt)));
  CHECK(std::holds_alternative<fetch_request_file>(
      fetch_request_for("relative/src", dest, "", std::filesystem::path{ "/proj" })));
  CHECK_THROWS_AS(fetch_request_for("s3://bucket/key", dest, "", std::nullopt),
                  std::invalid_argument);
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "fetch copies local files") {
  write("src/a.tar.gz", "archive");
  auto const r{ fetch_single(fetch_request_file{ .source = "src/a.tar.gz",
                                                 .destination = root / "out" / "a.tar.gz",
                                                 .file_root = root }) };
  CHECK(r.resolved_source == root / "src" / "a.tar.gz");
  CHECK(read("out/a.tar.gz") == "archive");
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "fetch copies local directories recursively") {
  write("tree/lua/m.lua", "return {}");
  write("tree/README", "hi");
  fetch_single(fetch_request_file{ .source = (root / "tree").string(),
                                   .destination = root / "copy" });
  CHECK(read("copy/lua/m.lua") == "return {}");
  CHECK(read("copy/README") == "hi");
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "fetch reports missing local sources") {
  CHECK_THROWS_AS(fetch_single(fetch_request_file{ .source = (root / "nope").string(),
                                                   .destination = root / "out" }),
                  not_found);
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "fetch downloads file URLs through libcurl") {
  write("dl/pkg.zip", "zip-bytes");
  auto const r{ fetch_single(
      fetch_request_url{ .source = "file://" + (root / "dl" / "pkg.zip").string(),
                         .destination = root / "cache" / "pkg.zip" }) };
  CHECK(r.scheme == uri_scheme::LOCAL_FILE_ABSOLUTE);
  CHECK(read("cache/pkg.zip") == "zip-bytes");
}

TEST_CASE_FIXTURE(test::temp_dir_fixture, "fetch checks out a git tag") {
  libgit2_scope const git;

  git_repository *repo{ nullptr };
  REQUIRE(git_repository_init(&repo, (root / "origin").string().c_str(), 0) == 0);
  git_repository_free(repo);

  write("origin/init.lua", "return 1");
  git_commit_all(root / "origin", "v1.0");
  write("origin/init.lua", "return 2");
  git_commit_all(root / "origin", "v2.0");

  auto const url{ "git+file://" + (root / "origin").string() };

  SUBCASE("older tag") {
    fetch_single(fetch_request_git{ .source = url, .destination = root / "co", .ref = "v1.0" });
    CHECK(read("co/init.lua") == "return 1");
  }

  SUBCASE("default head") {
    fetch_single(fetch_request_git{ .source = url, .destination = root / "co", .ref = "" });
    CHECK(read("co/init.lua") == "return 2");
  }

  SUBCASE("unknown ref") {
    CHECK_THROWS_AS(fetch_single(fetch_request_git{ .source = url,
                                                    .destination = root / "co",
                                                    .ref = "v9.9" }),
                    not_found);
  }
}

}  // namespace quarry
