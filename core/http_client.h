#ifndef APPCMD_CORE_HTTP_CLIENT_H_
#define APPCMD_CORE_HTTP_CLIENT_H_

#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "core/cancellation.h"

#include <curl/curl.h>

namespace appcmd {

class HttpClient {
 public:
  HttpClient();
  virtual ~HttpClient();

  // Non-copyable
  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // Each request returns the response body on 2xx. 429 and 5xx are retried
  // with backoff; other failures map through HttpStatusToStatus. A request is
  // abandoned with Cancelled once `cancellation` fires.
  virtual absl::StatusOr<std::string> Get(const std::string& url, const std::vector<std::string>& headers,
                                          std::shared_ptr<CancellationRequest> cancellation = nullptr);
  virtual absl::StatusOr<std::string> Post(const std::string& url, const std::string& body,
                                           const std::vector<std::string>& headers,
                                           std::shared_ptr<CancellationRequest> cancellation = nullptr);
  virtual absl::StatusOr<std::string> Put(const std::string& url, const std::string& body,
                                          const std::vector<std::string>& headers,
                                          std::shared_ptr<CancellationRequest> cancellation = nullptr);
  virtual absl::StatusOr<std::string> Patch(const std::string& url, const std::string& body,
                                            const std::vector<std::string>& headers,
                                            std::shared_ptr<CancellationRequest> cancellation = nullptr);

  void set_timeout(absl::Duration timeout) { timeout_ = timeout; }
  void set_max_retries(int max_retries) { max_retries_ = max_retries; }

  // Maps a non-2xx HTTP status to a Status code, keeping the service's error
  // message.
  static absl::Status HttpStatusToStatus(long response_code, const std::string& body);  // NOLINT(runtime/int)

  // Public for testing
  int64_t ParseRetryAfter(const absl::flat_hash_map<std::string, std::string>& headers);
  int64_t ParseRateLimitResetAfter(const absl::flat_hash_map<std::string, std::string>& headers);
  int64_t ParseBodyRetryAfter(const std::string& response_body);
  static size_t HeaderCallback(void* contents, size_t size, size_t nmemb, void* userp);

 private:
  absl::StatusOr<std::string> ExecuteWithRetry(const std::string& url, const std::string& method,
                                               const std::string& body, const std::vector<std::string>& headers,
                                               const std::shared_ptr<CancellationRequest>& cancellation);

  static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp);
  static int ProgressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal,
                              curl_off_t ulnow);

  absl::Duration timeout_ = absl::Seconds(30);
  int max_retries_ = 3;
};

}  // namespace appcmd

#endif  // APPCMD_CORE_HTTP_CLIENT_H_
