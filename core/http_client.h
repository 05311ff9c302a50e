#ifndef GENEFLOW_CORE_HTTP_CLIENT_H_
#define GENEFLOW_CORE_HTTP_CLIENT_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include <curl/curl.h>

#include "core/cancellation.h"

namespace geneflow {

// Maps a non-2xx HTTP status to the collaborator error taxonomy: 429 and 5xx
// are transient, every other failure is permanent. A server-suggested delay
// (`retry_after_ms` > 0) is appended to the message.
absl::Status HttpErrorToStatus(long response_code, const std::string& body,  // NOLINT(runtime/int)
                               int64_t retry_after_ms = -1);

// One-shot libcurl transport. Retrying is left to the caller so that the
// backoff policy and cancellation live in one place.
class HttpClient {
 public:
  explicit HttpClient(absl::Duration timeout = absl::Seconds(60));
  virtual ~HttpClient();

  // Non-copyable
  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // Sends a POST request to the given URL with the provided JSON body and headers.
  // The transfer is aborted once `cancel` (if any) is cancelled.
  virtual absl::StatusOr<std::string> Post(const std::string& url, const std::string& body,
                                           const std::vector<std::string>& headers,
                                           const CancellationRequest* cancel = nullptr);

  // Public for testing
  int64_t ParseRetryAfter(const absl::flat_hash_map<std::string, std::string>& headers);
  int64_t ParseXRateLimitReset(const absl::flat_hash_map<std::string, std::string>& headers);
  static size_t HeaderCallback(void* contents, size_t size, size_t nmemb, void* userp);

 private:
  absl::StatusOr<std::string> Execute(const std::string& url, const std::string& body,
                                      const std::vector<std::string>& headers, const CancellationRequest* cancel);

  static size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp);
  static int ProgressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal,
                              curl_off_t ulnow);

  absl::Duration timeout_;
};

}  // namespace geneflow

#endif  // GENEFLOW_CORE_HTTP_CLIENT_H_
