#include "libcurl_util.h"

#include "errors.h"
#include "tui.h"

#include "curl/curl.h"

#include <fstream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace quarry {

namespace {

constexpr char kDefaultUserAgent[]{ "quarry/0.1" };

size_t curl_write_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *stream{ static_cast<std::ofstream *>(userdata) };
  size_t const total{ size * nmemb };
  stream->write(ptr, static_cast<std::streamsize>(total));
  if (!*stream) { return 0; }
  return total;
}

size_t curl_write_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *out{ static_cast<std::string *>(userdata) };
  size_t const total{ size * nmemb };
  out->append(ptr, total);
  return total;
}

int curl_xferinfo(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto const *cancel{ static_cast<std::atomic_bool const *>(clientp) };
  return cancel && cancel->load() ? 1 : 0;
}

bool is_retryable_code(CURLcode code) {
  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_PARTIAL_FILE:
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
    case CURLE_SSL_CONNECT_ERROR: return true;
    default: return false;
  }
}

// Runs one transfer; `configure` installs the write callback.
template <typename configure_fn>
void perform(std::string const &url, http_options const &opts, configure_fn const &configure) {
  libcurl_ensure_initialized();

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                               curl_easy_strerror(rc));
    }
  };

  char error_buffer[CURL_ERROR_SIZE]{};

  setopt(CURLOPT_URL, url.c_str());
  setopt(CURLOPT_FOLLOWLOCATION, 1L);
  setopt(CURLOPT_FAILONERROR, 1L);
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kDefaultUserAgent);
  setopt(CURLOPT_ERRORBUFFER, error_buffer);
  setopt(CURLOPT_CONNECTTIMEOUT, opts.timeout_s);
  setopt(CURLOPT_LOW_SPEED_LIMIT, 1L);
  setopt(CURLOPT_LOW_SPEED_TIME, opts.timeout_s);
  if (opts.cancel) {
    setopt(CURLOPT_NOPROGRESS, 0L);
    setopt(CURLOPT_XFERINFOFUNCTION, curl_xferinfo);
    setopt(CURLOPT_XFERINFODATA, const_cast<std::atomic_bool *>(opts.cancel));
  } else {
    setopt(CURLOPT_NOPROGRESS, 1L);
  }
  configure(setopt);

  tui::debug("fetch %s", url.c_str());
  CURLcode const perform_result{ curl_easy_perform(handle.get()) };
  if (perform_result == CURLE_OK) { return; }

  if (perform_result == CURLE_ABORTED_BY_CALLBACK && opts.cancel && opts.cancel->load()) {
    throw cancelled();
  }

  long status{ 0 };
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
  libcurl_throw_transfer_error(perform_result,
                               status,
                               url,
                               error_buffer[0] ? error_buffer
                                               : curl_easy_strerror(perform_result));
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

void libcurl_throw_transfer_error(int curl_code,
                                  long http_status,
                                  std::string const &url,
                                  std::string const &detail) {
  auto const code{ static_cast<CURLcode>(curl_code) };

  if (code == CURLE_HTTP_RETURNED_ERROR || http_status >= 400) {
    if (http_status == 404 || http_status == 410) { throw not_found(url); }
    bool const retryable{ http_status >= 500 || http_status == 408 || http_status == 429 };
    throw network_error(url + ": HTTP " + std::to_string(http_status), retryable);
  }

  if (code == CURLE_FILE_COULDNT_READ_FILE || code == CURLE_REMOTE_FILE_NOT_FOUND) {
    throw not_found(url);
  }

  throw network_error(url + ": " + detail, is_retryable_code(code));
}

std::filesystem::path libcurl_download(std::string_view url,
                                       std::filesystem::path const &destination,
                                       http_options const &opts) {
  if (destination.empty()) {
    throw std::invalid_argument("libcurl_download: destination is empty");
  }

  auto const resolved_destination{ std::filesystem::absolute(destination).lexically_normal() };

  if (auto const parent{ resolved_destination.parent_path() }; !parent.empty()) {
    std::filesystem::create_directories(parent);
  }

  std::ofstream output{ resolved_destination, std::ios::binary | std::ios::trunc };
  if (!output.is_open()) {
    throw std::runtime_error("libcurl_download: failed to open destination: " +
                             resolved_destination.string());
  }

  auto const discard_partial{ [&] {
    output.close();
    std::error_code ec;
    std::filesystem::remove(resolved_destination, ec);
  } };

  try {
    perform(std::string{ url }, opts, [&](auto const &setopt) {
      setopt(CURLOPT_WRITEFUNCTION, curl_write_file);
      setopt(CURLOPT_WRITEDATA, &output);
    });
  } catch (...) {
    discard_partial();
    throw;
  }

  output.flush();
  if (!output) {
    discard_partial();
    throw std::runtime_error("libcurl_download: failed to flush destination file");
  }
  output.close();

  return resolved_destination;
}

std::string libcurl_get(std::string_view url, http_options const &opts) {
  std::string body;
  perform(std::string{ url }, opts, [&](auto const &setopt) {
    setopt(CURLOPT_WRITEFUNCTION, curl_write_string);
    setopt(CURLOPT_WRITEDATA, &body);
  });
  return body;
}

}  // namespace quarry
