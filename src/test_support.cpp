#include "test_support.h"

#include "errors.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"
#include "doctest.h"

#include <fstream>
#include <memory>
#include <random>
#include <stdexcept>
#include <system_error>

namespace quarry::test {

temp_dir_fixture::temp_dir_fixture() {
  static std::mt19937_64 rng{ std::random_device{}() };
  auto const suffix{ std::to_string(rng()) };
  root = std::filesystem::temp_directory_path() / ("quarry-test-" + suffix);
  std::filesystem::create_directories(root);
}

temp_dir_fixture::~temp_dir_fixture() {
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  if (ec) {
    std::string const msg{ "Failed to clean up temp directory '" + root.string() +
                           "': " + ec.message() };
    FAIL_CHECK(msg.c_str());
  }
}

std::filesystem::path temp_dir_fixture::write(std::filesystem::path const &rel,
                                              std::string_view content) const {
  auto const path{ root / rel };
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out{ path, std::ios::binary };
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  return path;
}

std::string temp_dir_fixture::read(std::filesystem::path const &rel) const {
  return util_load_file_text(root / rel);
}

void write_tar_gz(std::filesystem::path const &archive_path,
                  archive_entries_t const &entries) {
  std::unique_ptr<archive, decltype(&archive_write_free)> a{ archive_write_new(),
                                                             archive_write_free };
  archive_write_add_filter_gzip(a.get());
  archive_write_set_format_pax_restricted(a.get());
  if (archive_write_open_filename(a.get(), archive_path.c_str()) != ARCHIVE_OK) {
    throw std::runtime_error(archive_error_string(a.get()));
  }

  for (auto const &[rel, content] : entries) {
    std::unique_ptr<archive_entry, decltype(&archive_entry_free)> e{ archive_entry_new(),
                                                                     archive_entry_free };
    archive_entry_set_pathname(e.get(), rel.c_str());
    archive_entry_set_size(e.get(), static_cast<la_int64_t>(content.size()));
    archive_entry_set_filetype(e.get(), AE_IFREG);
    archive_entry_set_perm(e.get(), 0644);
    archive_write_header(a.get(), e.get());
    archive_write_data(a.get(), content.data(), content.size());
  }

  archive_write_close(a.get());
}

void fake_registry::add(std::string const &name,
                        std::string const &ver,
                        std::vector<std::string> const &deps,
                        std::string const &extra) {
  std::string text{ "package = \"" + name + "\"\nversion = \"" + ver + "\"\n" +
                    "source = { url = \"https://example.invalid/" + name + "-" + ver +
                    ".tar.gz\" }\ndependencies = {" };
  for (auto const &d : deps) { text += " \"" + d + "\","; }
  text += " }\n" + extra + "\n";

  auto d{ rockspec_parse(text, name + "-" + ver + ".rockspec") };
  std::lock_guard const lock{ mutex_ };
  index_[name][d->version] = std::move(d);
}

std::vector<version> fake_registry::list_versions(std::string const &name) {
  std::lock_guard const lock{ mutex_ };
  auto const it{ index_.find(name) };
  if (it == index_.end()) { throw not_found("package '" + name + "'"); }

  std::vector<version> out;
  for (auto const &[v, d] : it->second) { out.push_back(v); }
  return out;
}

descriptor_ptr fake_registry::fetch_descriptor(std::string const &name,
                                               version const &v) {
  std::lock_guard const lock{ mutex_ };
  ++fetches_;
  auto const it{ index_.find(name) };
  if (it == index_.end()) { throw not_found("package '" + name + "'"); }
  auto const found{ it->second.find(v) };
  if (found == it->second.end()) { throw not_found(name + " " + v.text()); }
  return found->second;
}

int fake_registry::descriptor_fetches() const {
  std::lock_guard const lock{ mutex_ };
  return fetches_;
}

}  // namespace quarry::test
