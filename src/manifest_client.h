#pragma once

#include "rockspec.h"
#include "version.h"

#include <string>
#include <vector>

namespace quarry {

// Read-only view of a package index. Implementations are called concurrently from
// resolver and orchestrator threads and must be thread-safe.
class manifest_client {
 public:
  virtual ~manifest_client() = default;

  // Ascending and unique. Throws not_found, network_error or malformed_index.
  virtual std::vector<version> list_versions(std::string const &name) = 0;

  // The same (name, version) yields the same descriptor for the client's lifetime.
  virtual descriptor_ptr fetch_descriptor(std::string const &name, version const &v) = 0;
};

}  // namespace quarry
