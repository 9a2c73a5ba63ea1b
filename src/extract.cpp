#include "extract.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include "archive.h"
#include "archive_entry.h"

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace quarry {
namespace {

struct archive_reader : unmovable {
  archive_reader() : handle(archive_read_new()) {
    if (!handle) { throw std::runtime_error("archive_read_new failed"); }
    archive_read_support_filter_all(handle);
    archive_read_support_format_all(handle);
  }

  ~archive_reader() {
    if (handle) {
      archive_read_close(handle);
      archive_read_free(handle);
    }
  }

  archive *handle{ nullptr };
};

struct archive_writer : unmovable {
  archive_writer() : handle(archive_write_disk_new()) {
    if (!handle) { throw std::runtime_error("archive_write_disk_new failed"); }
    archive_write_disk_set_options(handle,
                                   ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                       ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                       ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                                       ARCHIVE_EXTRACT_SECURE_NOABSOLUTEPATHS);
    archive_write_disk_set_standard_lookup(handle);
  }

  ~archive_writer() {
    if (handle) {
      archive_write_close(handle);
      archive_write_free(handle);
    }
  }

  archive *handle{ nullptr };
};

std::string archive_message(archive *a) {
  char const *msg{ archive_error_string(a) };
  return msg ? msg : "unknown libarchive error";
}

// Drops the first `strip_count` components. nullopt when nothing is left.
std::optional<std::string> strip_path_components(char const *path, int strip_count) {
  if (!path) { return std::nullopt; }
  std::string_view rest{ path };
  while (!rest.empty() && rest.front() == '/') { rest.remove_prefix(1); }

  for (int i{ 0 }; i < strip_count; ++i) {
    auto const slash{ rest.find('/') };
    if (slash == std::string_view::npos) { return std::nullopt; }
    rest.remove_prefix(slash + 1);
    while (!rest.empty() && rest.front() == '/') { rest.remove_prefix(1); }
  }

  if (rest.empty()) { return std::nullopt; }
  return std::string{ rest };
}

bool escapes_root(std::string_view rel) {
  std::filesystem::path const p{ rel };
  if (p.is_absolute()) { return true; }
  for (auto const &part : p) {
    if (part == "..") { return true; }
  }
  return false;
}

void copy_entry_data(archive_reader &reader,
                     archive_writer &writer,
                     std::filesystem::path const &entry_path) {
  void const *buf{ nullptr };
  size_t size{ 0 };
  la_int64_t offset{ 0 };
  while (true) {
    int const r{ archive_read_data_block(reader.handle, &buf, &size, &offset) };
    if (r == ARCHIVE_EOF) { return; }
    if (r < ARCHIVE_OK) {
      throw std::runtime_error("failed to read " + entry_path.string() + ": " +
                               archive_message(reader.handle));
    }
    if (archive_write_data_block(writer.handle, buf, size, offset) < ARCHIVE_OK) {
      throw std::runtime_error("failed to write " + entry_path.string() + ": " +
                               archive_message(writer.handle));
    }
  }
}

}  // namespace

std::uint64_t extract(std::filesystem::path const &archive_path,
                      std::filesystem::path const &destination,
                      extract_options const &options) {
  archive_reader reader;
  archive_writer writer;

  if (archive_read_open_filename(reader.handle, archive_path.c_str(), 10240) !=
      ARCHIVE_OK) {
    throw std::runtime_error("failed to open archive " + archive_path.string() + ": " +
                             archive_message(reader.handle));
  }

  std::filesystem::create_directories(destination);

  archive_entry *entry{ nullptr };
  std::uint64_t files_extracted{ 0 };

  while (true) {
    if (options.cancel && options.cancel->load()) { throw cancelled(); }

    int const r{ archive_read_next_header(reader.handle, &entry) };
    if (r == ARCHIVE_EOF) { break; }
    if (r < ARCHIVE_WARN) {
      throw std::runtime_error("corrupt archive " + archive_path.string() + ": " +
                               archive_message(reader.handle));
    }

    auto const rel{ strip_path_components(archive_entry_pathname(entry),
                                          options.strip_components) };
    if (!rel) { continue; }
    if (escapes_root(*rel)) {
      throw std::runtime_error("archive entry escapes destination: " + *rel);
    }

    auto const full_path{ destination / *rel };
    archive_entry_set_pathname(entry, full_path.c_str());

    if (char const *link{ archive_entry_hardlink(entry) }) {
      auto const link_rel{ strip_path_components(link, options.strip_components) };
      if (!link_rel || escapes_root(*link_rel)) { continue; }
      archive_entry_set_hardlink(entry, (destination / *link_rel).c_str());
    }

    if (archive_write_header(writer.handle, entry) < ARCHIVE_OK) {
      throw std::runtime_error("failed to create " + full_path.string() + ": " +
                               archive_message(writer.handle));
    }

    bool const is_regular_file{ archive_entry_filetype(entry) == AE_IFREG };
    if (is_regular_file && archive_entry_size(entry) > 0) {
      copy_entry_data(reader, writer, full_path);
    }

    if (archive_write_finish_entry(writer.handle) < ARCHIVE_OK) {
      throw std::runtime_error("failed to finish " + full_path.string() + ": " +
                               archive_message(writer.handle));
    }

    if (is_regular_file) { ++files_extracted; }
  }

  if (files_extracted == 0) {
    throw std::runtime_error("no files extracted from " +
                             archive_path.filename().string() +
                             " (archive may be empty, corrupt, or unsupported)");
  }

  tui::debug("extract: %s -> %s (%llu files)",
             archive_path.filename().c_str(),
             destination.c_str(),
             static_cast<unsigned long long>(files_extracted));
  return files_extracted;
}

bool extract_is_archive_extension(std::filesystem::path const &path) {
  static constexpr std::array<std::string_view, 11> kArchiveExtensions{
    ".tar", ".tgz", ".tar.gz", ".tar.xz", ".tar.bz2", ".tbz2",
    ".txz", ".tar.zst", ".zip", ".rock", ".7z"
  };

  auto const name{ util_to_lower(path.filename().string()) };
  for (auto const ext : kArchiveExtensions) {
    if (name.size() > ext.size() && name.ends_with(ext)) { return true; }
  }
  return false;
}

std::filesystem::path extract_source(std::filesystem::path const &artifact,
                                     std::filesystem::path const &destination,
                                     std::optional<std::string> const &subdir,
                                     extract_options const &options) {
  std::filesystem::create_directories(destination);

  bool unpacked_archive{ false };
  if (std::filesystem::is_directory(artifact)) {
    std::filesystem::copy(artifact,
                          destination,
                          std::filesystem::copy_options::recursive |
                              std::filesystem::copy_options::copy_symlinks |
                              std::filesystem::copy_options::overwrite_existing);
    std::error_code ec;
    std::filesystem::remove_all(destination / ".git", ec);
    if (ec) {
      throw std::system_error(ec, "failed to drop .git from " + destination.string());
    }
  } else if (extract_is_archive_extension(artifact)) {
    extract(artifact, destination, options);
    unpacked_archive = true;
  } else if (std::filesystem::is_regular_file(artifact)) {
    std::filesystem::copy_file(artifact,
                               destination / artifact.filename(),
                               std::filesystem::copy_options::overwrite_existing);
  } else {
    throw not_found("source artifact " + artifact.string());
  }

  if (subdir && !subdir->empty()) {
    if (escapes_root(*subdir)) {
      throw std::runtime_error("source dir escapes the source tree: " + *subdir);
    }
    auto const root{ destination / *subdir };
    if (!std::filesystem::is_directory(root)) {
      throw missing_file(*subdir);
    }
    return root;
  }

  if (unpacked_archive) {
    std::optional<std::filesystem::path> only_dir;
    int entries{ 0 };
    for (auto const &e : std::filesystem::directory_iterator(destination)) {
      ++entries;
      if (e.is_directory()) { only_dir = e.path(); }
    }
    if (entries == 1 && only_dir) { return *only_dir; }
  }

  return destination;
}

}  // namespace quarry
