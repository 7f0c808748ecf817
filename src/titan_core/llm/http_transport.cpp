#include "titan_core/llm/http_transport.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <thread>

namespace titan_core {

namespace {

size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

// Returning non-zero makes libcurl abort with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto *cancel = static_cast<const async::CancellationToken *>(clientp);
  return cancel->is_cancelled() ? 1 : 0;
}

struct CurlEasyDeleter {
  void operator()(CURL *handle) const {
    curl_easy_cleanup(handle);
  }
};

struct CurlSlistDeleter {
  void operator()(curl_slist *list) const {
    curl_slist_free_all(list);
  }
};

// Sleeps in short slices so a cancel() is noticed. Returns false if cancelled.
bool wait_unless_cancelled(std::chrono::milliseconds duration, const async::CancellationToken &cancel) {
  const auto until = async::Clock::now() + duration;
  const auto slice = std::chrono::milliseconds(20);
  while (!cancel.is_cancelled()) {
    auto left = async::remaining_until(until);
    if (left.count() == 0) {
      return true;
    }
    std::this_thread::sleep_for(std::min(left, slice));
  }
  return false;
}

}  // namespace

CallResult<HttpResponse> CurlHttpTransport::post(const std::string &url,
                                                 const std::vector<std::string> &headers,
                                                 const std::string &body,
                                                 std::chrono::milliseconds timeout,
                                                 const async::CancellationToken &cancel) {
  std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
  if (!curl) {
    return CallResult<HttpResponse>::failure(DependencyErrorKind::Unavailable, "Failed to initialize CURL");
  }

  curl_slist *raw_headers = nullptr;
  for (const auto &header : headers) {
    raw_headers = curl_slist_append(raw_headers, header.c_str());
  }
  std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw_headers);

  HttpResponse response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &cancel);

  CURLcode res = curl_easy_perform(curl.get());
  if (res == CURLE_OPERATION_TIMEDOUT) {
    return CallResult<HttpResponse>::failure(DependencyErrorKind::Timeout, "request to " + url + " timed out");
  }
  if (res == CURLE_ABORTED_BY_CALLBACK) {
    return CallResult<HttpResponse>::failure(DependencyErrorKind::Cancelled, "request to " + url + " cancelled");
  }
  if (res != CURLE_OK) {
    return CallResult<HttpResponse>::failure(
        DependencyErrorKind::Transport, "CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return CallResult<HttpResponse>::success(std::move(response));
}

std::chrono::milliseconds RetryPolicy::backoff_for(int retry) const {
  if (backoff.empty()) {
    return std::chrono::milliseconds(0);
  }
  auto index = std::min<std::size_t>(static_cast<std::size_t>(std::max(retry, 0)), backoff.size() - 1);
  return backoff[index];
}

bool is_retryable_status(long status) {
  return status == 429 || (status >= 500 && status < 600);
}

CallResult<nlohmann::json> post_json_with_retry(HttpTransport &transport,
                                                const std::string &url,
                                                const std::vector<std::string> &headers,
                                                const nlohmann::json &payload,
                                                std::chrono::milliseconds timeout,
                                                const async::CancellationToken &cancel,
                                                const RetryPolicy &policy,
                                                const std::string &component) {
  if (cancel.is_cancelled()) {
    return CallResult<nlohmann::json>::failure(DependencyErrorKind::Cancelled, "request cancelled before dispatch");
  }
  if (timeout.count() <= 0) {
    return CallResult<nlohmann::json>::failure(DependencyErrorKind::Timeout, "no time left for request");
  }

  const auto deadline = async::Clock::now() + timeout;
  const std::string body = payload.dump();
  const int max_attempts = std::max(policy.max_retries, 0) + 1;

  DependencyError last_error;
  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    if (attempt > 0) {
      auto wait = policy.backoff_for(attempt - 1);
      if (wait >= async::remaining_until(deadline)) {
        std::cerr << "[" << component << "] No time left to retry after: " << last_error.message << std::endl;
        break;
      }
      std::cerr << "[" << component << "] Attempt " << attempt << "/" << max_attempts
                << " failed: " << last_error.message << ". Retrying in " << wait.count() << "ms" << std::endl;
      if (!wait_unless_cancelled(wait, cancel)) {
        return CallResult<nlohmann::json>::failure(DependencyErrorKind::Cancelled, "request cancelled during retry");
      }
    }

    auto left = async::remaining_until(deadline);
    if (left.count() == 0) {
      return CallResult<nlohmann::json>::failure(DependencyErrorKind::Timeout, "no time left for request to " + url);
    }

    auto response = transport.post(url, headers, body, left, cancel);
    if (!response.ok()) {
      // Only connection-level failures are retried; timeouts have used up the deadline
      if (response.error().kind != DependencyErrorKind::Transport) {
        return CallResult<nlohmann::json>::failure(response.error().kind, response.error().message);
      }
      last_error = response.error();
      continue;
    }

    const auto &http = response.value();
    if (http.status < 200 || http.status >= 300) {
      DependencyError error{DependencyErrorKind::Transport,
                            "HTTP " + std::to_string(http.status) + " from " + url + ": " + http.body.substr(0, 200)};
      if (!is_retryable_status(http.status)) {
        return CallResult<nlohmann::json>::failure(error.kind, error.message);
      }
      last_error = std::move(error);
      continue;
    }

    try {
      return CallResult<nlohmann::json>::success(nlohmann::json::parse(http.body));
    } catch (const nlohmann::json::parse_error &e) {
      return CallResult<nlohmann::json>::failure(DependencyErrorKind::BadResponse,
                                                 "Failed to parse JSON response: " + std::string(e.what()));
    }
  }

  return CallResult<nlohmann::json>::failure(last_error.kind, last_error.message);
}

CallResult<std::string> parse_chat_completion(const nlohmann::json &body) {
  if (!body.contains("choices") || !body["choices"].is_array() || body["choices"].empty()) {
    return CallResult<std::string>::failure(DependencyErrorKind::BadResponse, "Response does not contain choices");
  }
  const auto &choice = body["choices"][0];
  if (!choice.contains("message") || !choice["message"].contains("content") ||
      !choice["message"]["content"].is_string()) {
    return CallResult<std::string>::failure(DependencyErrorKind::BadResponse,
                                            "Response does not contain choices[0].message.content");
  }
  return CallResult<std::string>::success(choice["message"]["content"].get<std::string>());
}

}  // namespace titan_core
