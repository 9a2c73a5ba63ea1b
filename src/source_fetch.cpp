#include "source_fetch.h"

#include "blake3_util.h"
#include "errors.h"
#include "extract.h"
#include "fetch.h"
#include "integrity.h"
#include "tui.h"
#include "uri.h"

#include <stdexcept>

namespace quarry {

namespace {

// Name of the artifact inside the cache entry: the declared file, else the last URL
// component ("repo.git" checks out into "repo").
std::string artifact_name(source_spec const &s) {
  if (s.file) { return *s.file; }
  auto name{ uri_extract_filename(s.url) };
  if (s.is_git() && name.ends_with(".git")) { name.resize(name.size() - 4); }
  return name.empty() ? std::string{ "source" } : name;
}

std::string location_key(source_spec const &s,
                         std::optional<std::filesystem::path> const &file_root) {
  auto const info{ uri_classify(s.url) };
  std::string location{ info.transport };
  if (info.scheme == uri_scheme::LOCAL_FILE_ABSOLUTE ||
      info.scheme == uri_scheme::LOCAL_FILE_RELATIVE) {
    location = uri_resolve_local_file_relative(info.canonical, file_root).string();
  }
  return blake3_key(location + "#" + s.git_ref().value_or(""));
}

}  // namespace

fetched_source source_fetch(cache &c,
                            package_descriptor const &d,
                            source_fetch_options const &opts) {
  auto const name{ artifact_name(d.source) };
  auto ensured{ c.ensure_source(location_key(d.source, opts.file_root)) };

  if (ensured.lock) {
    tui::debug("fetching %s %s from %s",
               d.name.c_str(),
               d.version.text().c_str(),
               d.source.url.c_str());
    fetch_single(fetch_request_for(d.source.url,
                                   ensured.lock->install_dir() / name,
                                   d.source.git_ref().value_or(""),
                                   opts.file_root),
                 opts.http);
    ensured.lock->mark_install_complete();
    ensured.lock.reset();
  }

  auto const artifact{ ensured.pkg_path / name };
  if (!std::filesystem::exists(artifact)) {
    throw not_found("cached source " + artifact.string());
  }

  fetched_source out{ .artifact = artifact, .integrity = integrity::of_path(artifact) };
  if (d.source.hash) {
    integrity::verify(*d.source.hash, out.integrity, d.name + " " + d.version.text() +
                                                         " source");
  }
  return out;
}

std::filesystem::path source_unpack(fetched_source const &fetched,
                                    package_descriptor const &d,
                                    std::filesystem::path const &work_dir,
                                    std::atomic_bool const *cancel) {
  return extract_source(fetched.artifact,
                        work_dir / "src",
                        d.source.dir,
                        extract_options{ .cancel = cancel });
}

}  // namespace quarry
