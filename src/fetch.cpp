#include "fetch.h"

#include "errors.h"
#include "libgit2_util.h"
#include "tui.h"
#include "util.h"

#include "git2.h"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

namespace quarry {
namespace {

std::filesystem::path prepare_destination(std::filesystem::path destination) {
  if (destination.empty()) {
    throw std::invalid_argument("fetch: destination path is empty");
  }

  destination = std::filesystem::absolute(destination).lexically_normal();

  if (auto const parent{ destination.parent_path() }; !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("fetch: failed to create destination parent: " +
                               parent.string() + ": " + ec.message());
    }
  }

  return destination;
}

fetch_result fetch_local_file(fetch_request_file const &req) {
  auto const source{ uri_resolve_local_file_relative(req.source, req.file_root) };

  std::error_code ec;
  if (!std::filesystem::exists(source, ec)) { throw not_found(source.string()); }

  auto const dest{ prepare_destination(req.destination) };

  if (std::filesystem::is_directory(source)) {
    std::filesystem::copy(source,
                          dest,
                          std::filesystem::copy_options::recursive |
                              std::filesystem::copy_options::overwrite_existing,
                          ec);
  } else {
    std::filesystem::copy_file(source,
                               dest,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
  }
  if (ec) {
    throw std::runtime_error("fetch: failed to copy " + source.string() + " -> " +
                             dest.string() + ": " + ec.message());
  }

  return fetch_result{ .scheme = uri_scheme::LOCAL_FILE_ABSOLUTE,
                       .resolved_source = source,
                       .resolved_destination = dest };
}

using repo_ptr = std::unique_ptr<git_repository, decltype(&git_repository_free)>;
using object_ptr = std::unique_ptr<git_object, decltype(&git_object_free)>;

// Returns an empty pointer on failure; the caller decides whether to retry.
repo_ptr try_git_clone(std::string const &url, std::filesystem::path const &dest, int depth) {
  git_clone_options clone_opts;
  git_clone_options_init(&clone_opts, GIT_CLONE_OPTIONS_VERSION);
  if (depth > 0) { clone_opts.fetch_opts.depth = depth; }

  git_repository *repo_raw{ nullptr };
  if (git_clone(&repo_raw, url.c_str(), dest.string().c_str(), &clone_opts)) {
    return repo_ptr{ nullptr, git_repository_free };
  }
  return repo_ptr{ repo_raw, git_repository_free };
}

object_ptr try_resolve_ref(git_repository *repo, std::string const &ref) {
  git_object *obj{ nullptr };
  // Tags and branches live under several namespaces after a clone.
  for (auto const &spec : { ref, "refs/tags/" + ref, "origin/" + ref }) {
    if (!git_revparse_single(&obj, repo, spec.c_str())) {
      git_object *commit{ nullptr };
      if (!git_object_peel(&commit, obj, GIT_OBJECT_COMMIT)) {
        git_object_free(obj);
        return object_ptr{ commit, git_object_free };
      }
      git_object_free(obj);
    }
  }
  return object_ptr{ nullptr, git_object_free };
}

fetch_result fetch_git_repo(fetch_request_git const &req) {
  libgit2_scope const git;

  auto const info{ uri_classify(req.source) };
  auto const dest{ prepare_destination(req.destination) };
  std::string const ref{ req.ref.empty() ? "HEAD" : req.ref };

  // Shallow first; some servers reject shallow clones and shallow history may lack the
  // ref, so fall back to a full clone.
  auto repo{ try_git_clone(info.transport, dest, 1) };
  auto target{ repo ? try_resolve_ref(repo.get(), ref) : object_ptr{ nullptr, git_object_free } };

  if (!target) {
    tui::debug("fetch_git: shallow clone of %s insufficient, retrying full clone",
               info.transport.c_str());
    repo.reset();
    std::error_code ec;
    std::filesystem::remove_all(dest, ec);

    repo = try_git_clone(info.transport, dest, 0);
    if (!repo) {
      throw network_error("git clone " + info.transport + " failed: " + libgit2_last_error(),
                          false);
    }

    target = try_resolve_ref(repo.get(), ref);
    if (!target) {
      throw not_found("git ref '" + ref + "' in " + info.transport);
    }
  }

  git_checkout_options checkout_opts;
  git_checkout_options_init(&checkout_opts, GIT_CHECKOUT_OPTIONS_VERSION);
  checkout_opts.checkout_strategy = GIT_CHECKOUT_FORCE;

  if (git_checkout_tree(repo.get(), target.get(), &checkout_opts)) {
    throw std::runtime_error("fetch_git: checkout failed: " + libgit2_last_error());
  }

  if (git_repository_set_head_detached(repo.get(), git_object_id(target.get()))) {
    throw std::runtime_error("fetch_git: failed to update HEAD: " + libgit2_last_error());
  }

  return fetch_result{ .scheme = uri_scheme::GIT,
                       .resolved_source = std::filesystem::path{ info.transport },
                       .resolved_destination = dest };
}

}  // namespace

fetch_request fetch_request_for(std::string const &source,
                                std::filesystem::path const &destination,
                                std::string const &git_ref,
                                std::optional<std::filesystem::path> const &file_root) {
  auto const info{ uri_classify(source) };
  switch (info.scheme) {
    case uri_scheme::GIT:
      return fetch_request_git{ .source = source, .destination = destination, .ref = git_ref };
    case uri_scheme::HTTP:
    case uri_scheme::HTTPS:
    case uri_scheme::FTP:
      return fetch_request_url{ .source = info.transport, .destination = destination };
    case uri_scheme::LOCAL_FILE_ABSOLUTE:
    case uri_scheme::LOCAL_FILE_RELATIVE:
      return fetch_request_file{ .source = info.canonical,
                                 .destination = destination,
                                 .file_root = file_root };
    case uri_scheme::SSH:
    case uri_scheme::UNKNOWN: break;
  }
  throw std::invalid_argument("fetch: unsupported source URL '" + source + "'");
}

fetch_result fetch_single(fetch_request const &request, http_options const &opts) {
  return std::visit(
      match{
          [&](fetch_request_url const &req) -> fetch_result {
            auto const info{ uri_classify(req.source) };
            if (info.canonical.empty()) {
              throw std::invalid_argument("fetch: source URI is empty");
            }
            bool const local{ info.scheme == uri_scheme::LOCAL_FILE_ABSOLUTE ||
                              info.scheme == uri_scheme::LOCAL_FILE_RELATIVE };
            auto const url{ local ? "file://" +
                                        std::filesystem::absolute(info.transport).string()
                                  : info.transport };
            return fetch_result{
              .scheme = info.scheme,
              .resolved_source = std::filesystem::path{ info.transport },
              .resolved_destination = libcurl_download(url,
                                                       prepare_destination(req.destination),
                                                       opts),
            };
          },
          [](fetch_request_file const &req) { return fetch_local_file(req); },
          [](fetch_request_git const &req) { return fetch_git_repo(req); },
      },
      request);
}

}  // namespace quarry
