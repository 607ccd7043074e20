#include "lf/curl_http_client.hpp"
#include <lf/errors.hpp>
#include <lf/log.hpp>

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace {
std::once_flag curl_initialized;

/// Collect the response headers, starting over on each status line (e.g. after "100 Continue").
std::size_t on_header(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
  auto& response = *static_cast<lf::http_response*>(userdata);
  std::string line(buffer, size * nitems);
  while (not line.empty() and (line.back() == '\r' or line.back() == '\n')) {
    line.pop_back();
  }
  if (line.compare(0, 5, "HTTP/") == 0) {
    response.headers.clear();
    return size * nitems;
  }
  auto colon = line.find(':');
  if (colon == std::string::npos) {
    return size * nitems;
  }
  auto value = line.substr(colon + 1);
  auto start = value.find_first_not_of(" \t");
  value = start == std::string::npos ? std::string() : value.substr(start);
  response.headers.emplace_back(line.substr(0, colon), std::move(value));
  return size * nitems;
}

std::size_t discard_body(char*, std::size_t size, std::size_t nmemb, void*) {
  return size * nmemb;
}
} // anonymous namespace

namespace lf {

curl_http_client::curl_http_client() {
  std::call_once(curl_initialized, []() {
    auto rc = curl_global_init(CURL_GLOBAL_ALL);
    if (rc != CURLE_OK) {
      LF_LOG(error) << "curl_global_init() failed: " << curl_easy_strerror(rc);
    }
  });
}

http_response curl_http_client::get(std::string const& url, std::chrono::milliseconds timeout) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (not curl) {
    throw resolution_error("cannot create a curl handle to GET " + url);
  }
  http_response response;
  char error[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, on_header);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_body);
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error);

  auto rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    throw resolution_error("GET " + url + " failed: " + (error[0] != '\0' ? error : curl_easy_strerror(rc)));
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  LF_LOG(trace) << "GET " << url << " returned " << response.status;
  return response;
}

} // namespace lf
