#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace s3backup::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD
};

const char* method_name(HttpMethod method);

// Throttling (429) and the 5xx replies S3 front ends give under load.
bool is_retryable_status(int status);

// Header fields keyed by lowercase name, one value per name.
// Iterates in sorted order, which SigV4 canonicalization relies on.
class HttpHeaders {
public:
    using Fields = std::map<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    std::optional<std::string> get(const std::string& name) const;

    const Fields& all() const { return fields_; }

    std::optional<uint64_t> content_length() const;

private:
    Fields fields_;
};

// A byte range of a local file streamed as the request body.
struct FileBody {
    std::filesystem::path path;
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct RetryPolicy {
    int max_retries = 3;  // Extra attempts after the first
    std::chrono::milliseconds initial_delay{500};
    double backoff_multiplier = 2.0;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    // Small in-memory payload (multipart XML); ignored when file_body is set.
    std::string body;
    std::optional<FileBody> file_body;

    bool verify_ssl = true;
    std::chrono::milliseconds timeout{0};  // 0 = no limit (large PUTs)
    RetryPolicy retry;

    static HttpRequest head(const std::string& url);
    static HttpRequest post(const std::string& url, std::string body);
    static HttpRequest put_file(const std::string& url, FileBody body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;

    // Set when no usable status was received.
    std::string error;
    bool transport_error = false;  // curl-level failure, safe to retry

    bool ok() const { return status_code >= 200 && status_code < 300; }

    /// "HTTP 403" or the error text.
    std::string describe() const;
};

struct HttpClientOptions {
    size_t max_idle_handles = 16;
    std::chrono::milliseconds connect_timeout{30000};
    size_t max_response_size = 16 * 1024 * 1024;  // S3 XML replies are small
    std::string user_agent = "s3-backup/1.0";
};

// libcurl client keeping a pool of idle easy handles so connections are
// reused across requests. Safe for concurrent use.
class HttpClient {
public:
    explicit HttpClient(HttpClientOptions options = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request);

    // Repeats transport errors and retryable statuses with exponential
    // backoff, at most request.retry.max_retries extra attempts.
    HttpResponse execute_with_retry(const HttpRequest& request);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

struct UrlParts {
    std::string scheme;
    std::string host;
    int port = 0;  // 0 = default for scheme
    std::string path;
    std::string query;

    // host, plus ":port" when the port is not the scheme default
    std::string authority() const;
};

std::optional<UrlParts> parse_url(const std::string& url);

// AWS Signature Version 4 for S3 requests. Uses a pre-set
// x-amz-content-sha256 (e.g. UNSIGNED-PAYLOAD for streamed bodies),
// otherwise hashes the in-memory body.
class AwsSigV4Signer {
public:
    AwsSigV4Signer(std::string access_key_id,
                   std::string secret_access_key,
                   std::string region,
                   std::string service = "s3");

    void sign(HttpRequest& request) const;
    void sign_at(HttpRequest& request, std::chrono::system_clock::time_point when) const;

private:
    std::string credential_scope(const std::string& date) const;
    std::vector<uint8_t> signing_key(const std::string& date) const;

    std::string access_key_id_;
    std::string secret_access_key_;
    std::string region_;
    std::string service_;
};

// RFC 3986 unreserved characters pass through; keep_slash leaves '/' as-is
// for object key paths.
std::string url_encode(const std::string& str, bool keep_slash = false);

// SigV4 canonical query: parameters sorted, valueless ones rendered "key=".
std::string build_canonical_query_string(const std::string& query);

}  // namespace s3backup::net
