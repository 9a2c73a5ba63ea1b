#pragma once

#include "util.h"

#include <string>

namespace quarry {

// RAII wrapper for libgit2 global initialization/shutdown. Nested scopes are
// reference-counted by libgit2.
struct libgit2_scope : unmovable {
  libgit2_scope();
  ~libgit2_scope();
};

// Message of the last libgit2 error on this thread, or "unknown error".
std::string libgit2_last_error();

}  // namespace quarry
