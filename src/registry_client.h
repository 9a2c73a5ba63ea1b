#pragma once

#include "manifest_client.h"
#include "util.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace quarry {

struct registry_options {
  std::string server;                 // URL (http, https, file) or local directory
  std::string runtime{ "5.4" };       // selects manifest-<runtime>
  std::filesystem::path cache_dir;    // on-disk copies; empty disables disk caching
  int retries{ 3 };
  int backoff_ms{ 250 };
  long timeout_s{ 60 };
  std::string os;                     // rockspec platform overrides; empty = host
  std::atomic_bool const *cancel{ nullptr };

  // Replaces the network/file transport: returns the bytes behind a URL or path.
  std::function<std::string(std::string const &)> transport;
  std::function<void(std::chrono::milliseconds)> sleep;
};

// luarocks-compatible registry. Manifests and rockspecs are memoized per session with
// single-flight semantics and mirrored on disk with a sha256 sidecar.
class registry_client : public manifest_client, unmovable {
 public:
  explicit registry_client(registry_options opts);
  ~registry_client() override;

  std::vector<version> list_versions(std::string const &name) override;
  descriptor_ptr fetch_descriptor(std::string const &name, version const &v) override;

  std::string const &server() const;

 private:
  struct impl;
  std::unique_ptr<impl> m;
};

}  // namespace quarry
