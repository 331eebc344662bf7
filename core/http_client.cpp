#include "core/http_client.h"

#include <algorithm>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

#include <nlohmann/json.hpp>

namespace appcmd {

namespace {
struct CurlDeleter {
  void operator()(CURL* curl) const {
    if (curl) curl_easy_cleanup(curl);
  }
};
struct SlistDeleter {
  void operator()(struct curl_slist* list) const {
    if (list) curl_slist_free_all(list);
  }
};

bool IsCancelled(const std::shared_ptr<CancellationRequest>& cancellation) {
  return cancellation != nullptr && cancellation->IsCancelled();
}

// Sleeps for `wait_ms`, returning early when the request is cancelled.
void BackoffSleep(int64_t wait_ms, const std::shared_ptr<CancellationRequest>& cancellation) {
  if (cancellation == nullptr) {
    absl::SleepFor(absl::Milliseconds(wait_ms));
    return;
  }
  cancellation->WaitFor(absl::Milliseconds(wait_ms));
}
}  // namespace

HttpClient::HttpClient() { curl_global_init(CURL_GLOBAL_ALL); }

HttpClient::~HttpClient() { curl_global_cleanup(); }

size_t HttpClient::WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), size * nmemb);
  return size * nmemb;
}

size_t HttpClient::HeaderCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  size_t total_size = size * nmemb;
  std::string header(static_cast<char*>(contents), total_size);
  auto* headers = static_cast<absl::flat_hash_map<std::string, std::string>*>(userp);

  size_t colon_pos = header.find(':');
  if (colon_pos != std::string::npos) {
    std::string key = std::string(absl::StripAsciiWhitespace(header.substr(0, colon_pos)));
    std::string value = std::string(absl::StripAsciiWhitespace(header.substr(colon_pos + 1)));
    (*headers)[absl::AsciiStrToLower(key)] = value;
  }

  return total_size;
}

int HttpClient::ProgressCallback(void* clientp, [[maybe_unused]] curl_off_t dltotal, [[maybe_unused]] curl_off_t dlnow,
                                 [[maybe_unused]] curl_off_t ultotal, [[maybe_unused]] curl_off_t ulnow) {
  auto* cancellation = static_cast<CancellationRequest*>(clientp);
  return cancellation != nullptr && cancellation->IsCancelled() ? 1 : 0;
}

absl::StatusOr<std::string> HttpClient::Get(const std::string& url, const std::vector<std::string>& headers,
                                            std::shared_ptr<CancellationRequest> cancellation) {
  return ExecuteWithRetry(url, "GET", "", headers, cancellation);
}

absl::StatusOr<std::string> HttpClient::Post(const std::string& url, const std::string& body,
                                             const std::vector<std::string>& headers,
                                             std::shared_ptr<CancellationRequest> cancellation) {
  return ExecuteWithRetry(url, "POST", body, headers, cancellation);
}

absl::StatusOr<std::string> HttpClient::Put(const std::string& url, const std::string& body,
                                            const std::vector<std::string>& headers,
                                            std::shared_ptr<CancellationRequest> cancellation) {
  return ExecuteWithRetry(url, "PUT", body, headers, cancellation);
}

absl::StatusOr<std::string> HttpClient::Patch(const std::string& url, const std::string& body,
                                              const std::vector<std::string>& headers,
                                              std::shared_ptr<CancellationRequest> cancellation) {
  return ExecuteWithRetry(url, "PATCH", body, headers, cancellation);
}

absl::StatusOr<std::string> HttpClient::ExecuteWithRetry(const std::string& url, const std::string& method,
                                                         const std::string& body,
                                                         const std::vector<std::string>& headers,
                                                         const std::shared_ptr<CancellationRequest>& cancellation) {
  VLOG(1) << "Executing HTTP " << method << " to " << url;

  int retry_count = 0;
  int64_t backoff_ms = 1000;

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    return absl::InternalError("Failed to initialize CURL");
  }

  struct curl_slist* raw_chunk = nullptr;
  for (const auto& header : headers) {
    raw_chunk = curl_slist_append(raw_chunk, header.c_str());
  }
  VLOG(2) << "Request Body: " << body;
  std::unique_ptr<struct curl_slist, SlistDeleter> chunk(raw_chunk);

  while (true) {
    if (IsCancelled(cancellation)) return cancellation->status();

    std::string response_string;
    absl::flat_hash_map<std::string, std::string> response_headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    if (method == "GET") {
      curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    } else {
      curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, chunk.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, HttpClient::WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, HttpClient::HeaderCallback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, HttpClient::ProgressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, cancellation.get());
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(absl::ToInt64Milliseconds(timeout_)));  // NOLINT

    CURLcode res = curl_easy_perform(curl.get());

    long response_code = 0;  // NOLINT(runtime/int)
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);

    if (res != CURLE_OK) {
      if (IsCancelled(cancellation)) {
        LOG(INFO) << "HTTP " << method << " " << url << " cancelled";
        return cancellation->status();
      }

      LOG(WARNING) << "CURL error: " << curl_easy_strerror(res) << " (res=" << res << ")";
      if (retry_count < max_retries_) {
        LOG(INFO) << "Retrying in " << backoff_ms << "ms... (Attempt " << retry_count + 1 << "/" << max_retries_
                  << ")";
        BackoffSleep(backoff_ms, cancellation);
        retry_count++;
        backoff_ms *= 2;
        continue;
      }
      LOG(ERROR) << "Maximum retries reached for CURL error: " << curl_easy_strerror(res);
      return absl::UnavailableError("CURL error: " + std::string(curl_easy_strerror(res)));
    }

    VLOG(1) << "HTTP Status: " << response_code;
    VLOG(2) << "Response Body: " << response_string;

    if (response_code >= 200 && response_code < 300) {
      return response_string;
    }

    if (response_code >= 500 || response_code == 429) {
      int64_t retry_after_ms = ParseRetryAfter(response_headers);
      int64_t reset_after_ms = ParseRateLimitResetAfter(response_headers);
      int64_t body_retry_ms = (response_code == 429) ? ParseBodyRetryAfter(response_string) : -1;

      int64_t extra_wait = std::max({retry_after_ms, reset_after_ms, body_retry_ms});

      if (retry_count < max_retries_) {
        int64_t wait_ms = backoff_ms;
        if (extra_wait > 0) {
          VLOG(1) << "Server suggested backoff for " << response_code << ": " << extra_wait << "ms";
          // Rate limits say exactly when the bucket resets.
          wait_ms = response_code == 429 ? extra_wait : std::max(wait_ms, extra_wait);
        }

        LOG(WARNING) << "HTTP " << response_code << " on " << method << " " << url << ", retrying in " << wait_ms
                     << "ms (attempt " << retry_count + 1 << "/" << max_retries_ << ")";
        BackoffSleep(wait_ms, cancellation);
        retry_count++;
        backoff_ms *= 2;
        continue;
      }
      LOG(ERROR) << "Maximum retries reached for " << response_code << " on " << method << " " << url;
    }

    VLOG(1) << "HTTP error " << response_code << ": " << response_string;
    return HttpStatusToStatus(response_code, response_string);
  }
}

absl::Status HttpClient::HttpStatusToStatus(long response_code, const std::string& body) {  // NOLINT(runtime/int)
  std::string message = body;
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (!j.is_discarded() && j.is_object() && j.contains("message") && j["message"].is_string()) {
    message = j["message"].get<std::string>();
    if (j.contains("code") && j["code"].is_number_integer()) {
      absl::StrAppend(&message, " (code ", j["code"].get<int64_t>(), ")");
    }
  }
  std::string text = absl::StrCat("HTTP ", response_code, ": ", message);
  switch (response_code) {
    case 400:
      return absl::InvalidArgumentError(text);
    case 401:
      return absl::UnauthenticatedError(text);
    case 403:
      return absl::PermissionDeniedError(text);
    case 404:
      return absl::NotFoundError(text);
    case 409:
      return absl::AlreadyExistsError(text);
    case 429:
      return absl::ResourceExhaustedError(text);
    default:
      break;
  }
  if (response_code >= 500) return absl::UnavailableError(text);
  return absl::UnknownError(text);
}

int64_t HttpClient::ParseRetryAfter(const absl::flat_hash_map<std::string, std::string>& headers) {
  auto it = headers.find("retry-after");
  if (it == headers.end()) return -1;

  const std::string& value = it->second;

  // Try parsing as seconds, fractional values included
  double seconds = 0;
  if (absl::SimpleAtod(value, &seconds)) {
    VLOG(1) << "Parsed Retry-After as seconds: " << seconds;
    return static_cast<int64_t>(seconds * 1000);
  }

  // Try parsing as HTTP-Date
  absl::Time retry_time;
  std::string err;
  // IMF-fixdate: Fri, 31 Dec 1999 23:59:59 GMT
  if (absl::ParseTime("%a, %d %b %Y %H:%M:%S GMT", value, &retry_time, &err)) {
    int64_t diff_ms = absl::ToInt64Milliseconds(retry_time - absl::Now());
    VLOG(1) << "Parsed Retry-After as date: " << value << " (" << diff_ms << "ms from now)";
    return std::max<int64_t>(0, diff_ms);
  }

  LOG(WARNING) << "Malformed Retry-After header: " << value;
  return -1;
}

int64_t HttpClient::ParseRateLimitResetAfter(const absl::flat_hash_map<std::string, std::string>& headers) {
  auto it = headers.find("x-ratelimit-reset-after");
  if (it == headers.end()) return -1;

  double reset_after = 0;
  if (!absl::SimpleAtod(it->second, &reset_after) || reset_after < 0) {
    LOG(WARNING) << "Malformed x-ratelimit-reset-after header: " << it->second;
    return -1;
  }
  return static_cast<int64_t>(reset_after * 1000);
}

int64_t HttpClient::ParseBodyRetryAfter(const std::string& response_body) {
  auto j = nlohmann::json::parse(response_body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return -1;
  if (!j.contains("retry_after") || !j["retry_after"].is_number()) return -1;
  double seconds = j["retry_after"].get<double>();
  if (seconds < 0) return -1;
  if (j.contains("global") && j["global"].is_boolean() && j["global"].get<bool>()) {
    LOG(WARNING) << "Hit the global rate limit";
  }
  return static_cast<int64_t>(seconds * 1000);
}

}  // namespace appcmd
