#include "uri.h"

#include "util.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <ranges>
#include <stdexcept>

namespace quarry {
namespace {

constexpr auto to_lower = [](unsigned char c) { return std::tolower(c); };

bool istarts_with(std::string_view value, std::string_view prefix) {
  if (prefix.size() > value.size()) { return false; }
  return std::ranges::equal(prefix,
                            value | std::views::take(prefix.size()),
                            {},
                            to_lower,
                            to_lower);
}

bool iends_with(std::string_view value, std::string_view suffix) {
  if (suffix.size() > value.size()) { return false; }
  return std::ranges::equal(suffix,
                            value | std::views::drop(value.size() - suffix.size()),
                            {},
                            to_lower,
                            to_lower);
}

std::string_view strip_query_and_fragment(std::string_view uri) {
  auto const pos{ uri.find_first_of("?#") };
  return pos == std::string_view::npos ? uri : uri.substr(0, pos);
}

bool looks_like_scp_uri(std::string_view uri) {
  if (uri.find("://") != std::string_view::npos) { return false; }

  auto const colon{ uri.find(':') };
  if (colon == std::string_view::npos || colon + 1 >= uri.size()) { return false; }

  auto const at{ uri.substr(0, colon).find('@') };
  return at != std::string_view::npos && at > 0;
}

// "file:///abs" -> "/abs", "file://localhost/abs" -> "/abs", "file://rel" -> "rel".
std::string strip_file_scheme(std::string_view uri) {
  std::string_view cand{ uri.substr(7) };
  if (cand.starts_with('/')) { return std::string{ cand }; }

  auto const slash{ cand.find('/') };
  if (slash != std::string_view::npos && istarts_with(cand.substr(0, slash), "localhost")) {
    return std::string{ cand.substr(slash) };
  }
  return std::string{ cand };
}

struct git_prefix {
  std::string_view prefix;
  std::string_view transport;
};

constexpr std::array<git_prefix, 5> kGitPrefixes{ {
    { "git+https://", "https://" },
    { "git+http://", "http://" },
    { "git+ssh://", "ssh://" },
    { "git+file://", "file://" },
    { "git://", "git://" },
} };

}  // namespace

uri_info uri_classify(std::string_view value) {
  std::string canonical{ util_trim(value) };
  if (canonical.empty()) { return uri_info{ uri_scheme::UNKNOWN, {}, {} }; }

  for (auto const &[prefix, transport] : kGitPrefixes) {
    if (istarts_with(canonical, prefix)) {
      auto t{ std::string{ transport } + canonical.substr(prefix.size()) };
      return uri_info{ uri_scheme::GIT, std::move(canonical), std::move(t) };
    }
  }

  auto const make{ [&](uri_scheme scheme) {
    auto transport{ canonical };
    return uri_info{ scheme, std::move(canonical), std::move(transport) };
  } };

  if (iends_with(strip_query_and_fragment(canonical), ".git") &&
      canonical.find("://") != std::string::npos) {
    return make(uri_scheme::GIT);
  }
  if (istarts_with(canonical, "https://")) { return make(uri_scheme::HTTPS); }
  if (istarts_with(canonical, "http://")) { return make(uri_scheme::HTTP); }
  if (istarts_with(canonical, "ftp://")) { return make(uri_scheme::FTP); }
  if (istarts_with(canonical, "ssh://") || istarts_with(canonical, "scp://") ||
      looks_like_scp_uri(canonical)) {
    return make(uri_scheme::SSH);
  }

  std::string local_source;
  if (istarts_with(canonical, "file://")) {
    local_source = strip_file_scheme(canonical);
  } else if (canonical.find("://") != std::string::npos) {
    return make(uri_scheme::UNKNOWN);
  } else {
    local_source = canonical;
  }

  auto const scheme{ std::filesystem::path{ local_source }.is_absolute()
                         ? uri_scheme::LOCAL_FILE_ABSOLUTE
                         : uri_scheme::LOCAL_FILE_RELATIVE };
  auto transport{ local_source };
  return uri_info{ scheme, std::move(local_source), std::move(transport) };
}

bool uri_is_remote(uri_scheme scheme) {
  return scheme == uri_scheme::HTTP || scheme == uri_scheme::HTTPS ||
         scheme == uri_scheme::FTP || scheme == uri_scheme::GIT ||
         scheme == uri_scheme::SSH;
}

std::filesystem::path uri_resolve_local_file_relative(
    std::string_view local_file,
    std::optional<std::filesystem::path> const &anchor) {
  auto const info{ uri_classify(local_file) };
  if (info.canonical.empty()) {
    throw std::invalid_argument("uri_resolve_local_file_relative: empty value");
  }
  if (info.scheme != uri_scheme::LOCAL_FILE_ABSOLUTE &&
      info.scheme != uri_scheme::LOCAL_FILE_RELATIVE) {
    throw std::invalid_argument("uri_resolve_local_file_relative: not a local path: " +
                                info.canonical);
  }

  std::filesystem::path resolved{ info.canonical };
  if (info.scheme == uri_scheme::LOCAL_FILE_RELATIVE) {
    auto const base{ anchor && !anchor->empty() ? std::filesystem::absolute(*anchor)
                                                : std::filesystem::current_path() };
    resolved = base / resolved;
  }
  return resolved.lexically_normal();
}

std::string uri_extract_filename(std::string_view uri) {
  auto path{ strip_query_and_fragment(util_trim(uri)) };
  while (path.ends_with('/')) { path.remove_suffix(1); }

  auto const slash{ path.find_last_of('/') };
  auto name{ slash == std::string_view::npos ? path : path.substr(slash + 1) };
  if (name.find("://") != std::string_view::npos || name.ends_with(':')) { return {}; }
  return std::string{ name };
}

std::string uri_join(std::string_view base, std::string_view name) {
  while (base.ends_with('/')) { base.remove_suffix(1); }
  while (name.starts_with('/')) { name.remove_prefix(1); }
  return std::string{ base } + "/" + std::string{ name };
}

}  // namespace quarry
