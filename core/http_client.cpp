#include "core/http_client.h"

#include <algorithm>
#include <memory>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "absl/time/clock.h"

#include "core/errors.h"

namespace geneflow {

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

constexpr size_t kMaxLoggedBody = 512;
}  // namespace

absl::Status HttpErrorToStatus(long response_code, const std::string& body,  // NOLINT(runtime/int)
                               int64_t retry_after_ms) {
  std::string message = absl::StrCat("HTTP error ", response_code, ": ", body.substr(0, kMaxLoggedBody));
  if (retry_after_ms > 0) absl::StrAppend(&message, " (server suggests retry after ", retry_after_ms, "ms)");

  if (response_code == 429) return absl::ResourceExhaustedError(message);
  if (response_code >= 500) return absl::UnavailableError(message);
  if (response_code == 401) return absl::UnauthenticatedError(message);
  if (response_code == 403) return absl::PermissionDeniedError(message);
  if (response_code >= 400) return absl::InvalidArgumentError(message);
  return absl::UnknownError(message);
}

HttpClient::HttpClient(absl::Duration timeout) : timeout_(timeout) { curl_global_init(CURL_GLOBAL_ALL); }

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
  const auto* cancel = static_cast<const CancellationRequest*>(clientp);
  return (cancel != nullptr && cancel->IsCancelled()) ? 1 : 0;
}

absl::StatusOr<std::string> HttpClient::Post(const std::string& url, const std::string& body,
                                             const std::vector<std::string>& headers,
                                             const CancellationRequest* cancel) {
  return Execute(url, body, headers, cancel);
}

absl::StatusOr<std::string> HttpClient::Execute(const std::string& url, const std::string& body,
                                                const std::vector<std::string>& headers,
                                                const CancellationRequest* cancel) {
  if (cancel != nullptr && cancel->IsCancelled()) {
    return RunCancelledError("Request cancelled: " + cancel->Reason());
  }

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

  std::string response_string;
  absl::flat_hash_map<std::string, std::string> response_headers;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, chunk.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, HttpClient::WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, HttpClient::HeaderCallback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, HttpClient::ProgressCallback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<CancellationRequest*>(cancel));
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(absl::ToInt64Milliseconds(timeout_)));  // NOLINT

  CURLcode res = curl_easy_perform(curl.get());

  long response_code = 0;  // NOLINT(runtime/int)
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);

  if (res != CURLE_OK) {
    if (res == CURLE_ABORTED_BY_CALLBACK && cancel != nullptr) {
      LOG(INFO) << "Request cancelled: " << cancel->Reason();
      return RunCancelledError("Request cancelled: " + cancel->Reason());
    }
    LOG(WARNING) << "CURL error: " << curl_easy_strerror(res) << " (res=" << res << ")";
    if (res == CURLE_OPERATION_TIMEDOUT) {
      return absl::DeadlineExceededError("CURL error: " + std::string(curl_easy_strerror(res)));
    }
    return absl::UnavailableError("CURL error: " + std::string(curl_easy_strerror(res)));
  }

  VLOG(1) << "HTTP Status: " << response_code;
  VLOG(2) << "Response Body: " << response_string;

  if (response_code >= 200 && response_code < 300) {
    return response_string;
  }

  LOG(ERROR) << "HTTP error " << response_code << ": " << response_string.substr(0, kMaxLoggedBody);

  int64_t hint_ms = -1;
  if (response_code >= 500 || response_code == 429) {
    int64_t retry_after_ms = ParseRetryAfter(response_headers);
    int64_t x_reset_ms = (response_code == 429) ? ParseXRateLimitReset(response_headers) : -1;
    hint_ms = std::max(retry_after_ms, x_reset_ms);
    if (hint_ms > 0) LOG(INFO) << "Server suggested backoff for " << response_code << ": " << hint_ms << "ms";
  }
  return HttpErrorToStatus(response_code, response_string, hint_ms);
}

int64_t HttpClient::ParseRetryAfter(const absl::flat_hash_map<std::string, std::string>& headers) {
  auto it = headers.find("retry-after");
  if (it == headers.end()) return -1;

  const std::string& value = it->second;

  int64_t seconds = 0;
  if (absl::SimpleAtoi(value, &seconds)) {
    VLOG(1) << "Parsed Retry-After as seconds: " << seconds;
    return seconds * 1000;
  }

  // IMF-fixdate (RFC 7231): Fri, 31 Dec 1999 23:59:59 GMT
  absl::Time retry_time;
  std::string err;
  if (absl::ParseTime("%a, %d %b %Y %H:%M:%S GMT", value, &retry_time, &err)) {
    int64_t diff_ms = absl::ToInt64Milliseconds(retry_time - absl::Now());
    VLOG(1) << "Parsed Retry-After as date: " << value << " (" << diff_ms << "ms from now)";
    return std::max<int64_t>(0, diff_ms);
  }

  LOG(WARNING) << "Malformed Retry-After header: " << value;
  return -1;
}

int64_t HttpClient::ParseXRateLimitReset(const absl::flat_hash_map<std::string, std::string>& headers) {
  auto it = headers.find("x-ratelimit-reset");
  if (it == headers.end()) return -1;

  const std::string& value = it->second;
  double reset_val = 0;
  if (!absl::SimpleAtod(value, &reset_val)) {
    LOG(WARNING) << "Malformed x-ratelimit-reset header: " << value;
    return -1;
  }

  // Large values are Unix timestamps, small ones relative seconds.
  if (reset_val > 1000000000) {
    int64_t diff = static_cast<int64_t>(reset_val) - absl::ToUnixSeconds(absl::Now());
    return std::max<int64_t>(0, diff * 1000);
  }
  return static_cast<int64_t>(reset_val * 1000);
}

}  // namespace geneflow
