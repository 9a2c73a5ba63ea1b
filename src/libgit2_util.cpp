#include "libgit2_util.h"

#include "git2.h"

#include <stdexcept>

namespace quarry {

libgit2_scope::libgit2_scope() {
  if (int const rc{ git_libgit2_init() }; rc < 0) {
    throw std::runtime_error("git_libgit2_init failed: " + libgit2_last_error());
  }
}

libgit2_scope::~libgit2_scope() { git_libgit2_shutdown(); }

std::string libgit2_last_error() {
  git_error const *err{ git_error_last() };
  return err && err->message ? err->message : "unknown error";
}

}  // namespace quarry
