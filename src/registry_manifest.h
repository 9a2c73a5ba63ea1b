#pragma once

#include "version.h"

#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry {

// Package name -> ascending unique versions that ship a rockspec.
using registry_index = std::map<std::string, std::vector<version>>;

// Evaluates a luarocks "manifest-<lua>" file in a sandboxed state and reads its
// `repository` table. Throws malformed_index, also when evaluation outlives
// `eval_timeout` (default kSolUtilEvalTimeout). Throws cancelled when `cancel` is raised
// mid-evaluation.
registry_index registry_manifest_parse(
    std::string_view text,
    std::string const &chunk_name = "manifest",
    std::optional<std::chrono::milliseconds> eval_timeout = std::nullopt,
    std::atomic_bool const *cancel = nullptr);

}  // namespace quarry
