#include "registry_client.h"

#include "errors.h"
#include "libcurl_util.h"
#include "platform.h"
#include "registry_manifest.h"
#include "sha256.h"
#include "single_flight.h"
#include "tui.h"
#include "uri.h"
#include "util.h"

#include <algorithm>
#include <thread>

namespace quarry {

namespace {

std::string cache_file_name(std::string_view name) {
  std::string out{ name };
  std::ranges::replace(out, '/', '_');
  return out;
}

std::filesystem::path sidecar_path(std::filesystem::path const &file) {
  return file.string() + ".sha256";
}

void write_with_sidecar(std::filesystem::path const &file, std::string const &bytes) {
  util_write_file_atomic(file, bytes);
  util_write_file_atomic(sidecar_path(file),
                         sha256_hex(sha256_bytes(bytes.data(), bytes.size())) + "\n");
}

// Disk copy whose sidecar digest still matches, if any.
std::optional<std::string> read_verified(std::filesystem::path const &file) {
  auto const sidecar{ sidecar_path(file) };
  if (!platform::file_exists(file) || !platform::file_exists(sidecar)) {
    return std::nullopt;
  }

  auto bytes{ util_load_file_text(file) };
  auto const expected{ std::string{ util_trim(util_load_file_text(sidecar)) } };
  auto const actual{ sha256_hex(sha256_bytes(bytes.data(), bytes.size())) };
  if (expected != actual) {
    tui::warn("Ignoring corrupt cached copy %s (sha256 %s, sidecar %s)",
              file.c_str(),
              actual.c_str(),
              expected.c_str());
    return std::nullopt;
  }
  return bytes;
}

}  // namespace

struct registry_client::impl {
  registry_options opts;
  uri_info server_uri;

  single_flight<int, std::shared_ptr<registry_index const>> manifest;
  single_flight<std::string, descriptor_ptr> descriptors;

  std::string location_of(std::string const &file) const {
    return uri_join(opts.server, file);
  }

  std::string transfer(std::string const &file) const {
    auto const location{ location_of(file) };
    if (opts.transport) { return opts.transport(location); }

    if (server_uri.scheme == uri_scheme::HTTP || server_uri.scheme == uri_scheme::HTTPS ||
        server_uri.scheme == uri_scheme::FTP || opts.server.starts_with("file://")) {
      http_options const http{ .timeout_s = opts.timeout_s, .cancel = opts.cancel };
      return libcurl_get(location, http);
    }

    std::filesystem::path const local{ uri_join(server_uri.canonical, file) };
    if (!platform::file_exists(local)) { throw not_found(local.string()); }
    return util_load_file_text(local);
  }

  void pause(std::chrono::milliseconds delay) const {
    if (opts.sleep) {
      opts.sleep(delay);
      return;
    }
    auto const deadline{ std::chrono::steady_clock::now() + delay };
    while (std::chrono::steady_clock::now() < deadline) {
      if (opts.cancel && opts.cancel->load()) { throw cancelled(); }
      std::this_thread::sleep_for(std::chrono::milliseconds{ 20 });
    }
  }

  // Retryable network errors back off 1x, 2x, 4x... backoff_ms before the next attempt.
  std::string transfer_with_retries(std::string const &file) const {
    for (int attempt{ 0 };; ++attempt) {
      if (opts.cancel && opts.cancel->load()) { throw cancelled(); }
      try {
        return transfer(file);
      } catch (network_error const &e) {
        if (!e.retryable() || attempt >= opts.retries) { throw; }
        std::chrono::milliseconds const delay{ static_cast<long long>(opts.backoff_ms)
                                               << attempt };
        tui::warn("%s: %s (retry %d/%d in %lldms)",
                  file.c_str(),
                  e.what(),
                  attempt + 1,
                  opts.retries,
                  static_cast<long long>(delay.count()));
        pause(delay);
      }
    }
  }

  std::shared_ptr<registry_index const> load_manifest() {
    std::string const file{ "manifest-" + opts.runtime };
    auto const disk{ opts.cache_dir.empty() ? std::filesystem::path{}
                                            : opts.cache_dir / file };

    std::string text;
    try {
      text = transfer_with_retries(file);
      if (!disk.empty()) { write_with_sidecar(disk, text); }
    } catch (network_error const &e) {
      auto cached{ disk.empty() ? std::nullopt : read_verified(disk) };
      if (!cached) { throw; }
      tui::warn("Using cached %s from %s: %s", file.c_str(), disk.c_str(), e.what());
      text = std::move(*cached);
    }

    return std::make_shared<registry_index const>(
        registry_manifest_parse(text, file, std::nullopt, opts.cancel));
  }

  descriptor_ptr load_descriptor(std::string const &name, version const &v) {
    std::string const file{ name + "-" + v.text() + ".rockspec" };
    auto const disk{ opts.cache_dir.empty()
                         ? std::filesystem::path{}
                         : opts.cache_dir / "rockspecs" / cache_file_name(file) };

    std::optional<std::string> text{ disk.empty() ? std::nullopt : read_verified(disk) };
    if (!text) {
      text = transfer_with_retries(file);
      if (!disk.empty()) { write_with_sidecar(disk, *text); }
    }

    descriptor_ptr d;
    try {
      d = rockspec_parse(*text,
                         file,
                         rockspec_options{ .os = opts.os.empty() ? platform::os_name()
                                                                 : opts.os,
                                           .cancel = opts.cancel });
    } catch (parse_error const &e) {
      throw malformed_index(e.what());
    }

    if (d->name != name || d->version != v) {
      throw malformed_index(file + " declares " + d->name + " " + d->version.text());
    }
    return d;
  }
};

registry_client::registry_client(registry_options opts) : m{ std::make_unique<impl>() } {
  m->server_uri = uri_classify(opts.server);
  m->opts = std::move(opts);
  if (m->server_uri.scheme == uri_scheme::UNKNOWN) {
    throw std::invalid_argument("unsupported registry server: " + m->opts.server);
  }
  libcurl_ensure_initialized();
}

registry_client::~registry_client() = default;

std::string const &registry_client::server() const { return m->opts.server; }

std::vector<version> registry_client::list_versions(std::string const &name) {
  auto const index{ m->manifest.get(0, [this] { return m->load_manifest(); }) };
  auto const it{ index->find(util_to_lower(name)) };
  if (it == index->end()) { throw not_found("package '" + name + "'"); }
  return it->second;
}

descriptor_ptr registry_client::fetch_descriptor(std::string const &name,
                                                 version const &v) {
  auto const key{ util_to_lower(name) + "@" + v.text() };
  return m->descriptors.get(key, [this, &name, &v] {
    return m->load_descriptor(util_to_lower(name), v);
  });
}

}  // namespace quarry
