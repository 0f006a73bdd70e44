#include "s3backup/net/http.hpp"
#include "s3backup/core/log.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace s3backup::net {

// ============================================================================
// Utility functions
// ============================================================================

const char* method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_retryable_status(int status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

std::string url_encode(const std::string& str, bool keep_slash) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            (keep_slash && c == '/')) {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string build_canonical_query_string(const std::string& query) {
    if (query.empty()) {
        return "";
    }

    // Values arrive already encoded; only sorting and "key=" normalization needed
    std::map<std::string, std::string> params;
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        size_t eq = param.find('=');
        if (eq != std::string::npos) {
            params[param.substr(0, eq)] = param.substr(eq + 1);
        } else if (!param.empty()) {
            params[param] = "";
        }
        pos = amp + 1;
    }

    std::string out;
    for (const auto& [key, value] : params) {
        if (!out.empty()) out += "&";
        out += key + "=" + value;
    }
    return out;
}

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

}  // namespace

// ============================================================================
// HttpHeaders
// ============================================================================

void HttpHeaders::set(const std::string& name, const std::string& value) {
    fields_[lowercase(name)] = value;
}

void HttpHeaders::remove(const std::string& name) {
    fields_.erase(lowercase(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = fields_.find(lowercase(name));
    if (it == fields_.end()) return std::nullopt;
    return it->second;
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (!val) return std::nullopt;

    uint64_t length = 0;
    auto [end, ec] = std::from_chars(val->data(), val->data() + val->size(), length);
    if (ec != std::errc() || end != val->data() + val->size()) {
        return std::nullopt;
    }
    return length;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::head(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::HEAD;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, std::string body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body = std::move(body);
    return req;
}

HttpRequest HttpRequest::put_file(const std::string& url, FileBody body) {
    HttpRequest req;
    req.method = HttpMethod::PUT;
    req.url = url;
    req.file_body = std::move(body);
    return req;
}

HttpRequest HttpRequest::del(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::DELETE;
    req.url = url;
    return req;
}

std::string HttpResponse::describe() const {
    if (!error.empty()) return error;
    return "HTTP " + std::to_string(status_code);
}

// ============================================================================
// URL parsing
// ============================================================================

std::string UrlParts::authority() const {
    bool default_port = port == 0 ||
                        (scheme == "https" && port == 443) ||
                        (scheme == "http" && port == 80);
    return default_port ? host : host + ":" + std::to_string(port);
}

std::optional<UrlParts> parse_url(const std::string& url) {
    UrlParts result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return std::nullopt;
    }
    result.scheme = lowercase(url.substr(0, scheme_end));
    size_t pos = scheme_end + 3;

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) host_end = url.size();

    std::string host_port = url.substr(pos, host_end - pos);
    if (host_port.empty()) {
        return std::nullopt;
    }

    size_t colon = host_port.rfind(':');
    if (host_port.front() != '[' && colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        const char* first = host_port.data() + colon + 1;
        const char* last = host_port.data() + host_port.size();
        auto [end, ec] = std::from_chars(first, last, result.port);
        if (ec != std::errc() || end != last || result.host.empty()) {
            return std::nullopt;
        }
    } else {
        result.host = host_port;
    }
    pos = host_end;

    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) path_end = url.size();
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) query_end = url.size();
        result.query = url.substr(pos + 1, query_end - pos - 1);
    }

    return result;
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

struct ResponseSink {
    std::string* body;
    size_t max_size;
    bool size_exceeded;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<ResponseSink*>(userdata);
    size_t bytes = size * nmemb;

    if (sink->max_size > 0 && sink->body->size() + bytes > sink->max_size) {
        sink->size_exceeded = true;
        return 0;  // abort transfer
    }

    sink->body->append(ptr, bytes);
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    // A redirect or 100-continue starts a new header block
    if (line.starts_with("HTTP/")) {
        *headers = HttpHeaders{};
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        headers->set(line.substr(0, colon),
                     start == std::string::npos ? std::string() : value.substr(start));
    }

    return bytes;
}

struct StringSource {
    const std::string* data;
    size_t pos;
};

size_t string_read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* src = static_cast<StringSource*>(userdata);
    size_t n = std::min(size * nitems, src->data->size() - src->pos);
    if (n > 0) {
        std::memcpy(buffer, src->data->data() + src->pos, n);
        src->pos += n;
    }
    return n;
}

struct FileSource {
    FILE* file;
    uint64_t remaining;
};

size_t file_read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* src = static_cast<FileSource*>(userdata);
    size_t want = static_cast<size_t>(std::min<uint64_t>(size * nitems, src->remaining));
    if (want == 0) return 0;
    size_t got = fread(buffer, 1, want, src->file);
    if (got == 0 && ferror(src->file)) {
        return CURL_READFUNC_ABORT;
    }
    src->remaining -= got;
    return got;
}

// Closes the body file and frees the header list on every exit path.
struct TransferResources {
    FILE* file = nullptr;
    curl_slist* header_list = nullptr;

    ~TransferResources() {
        if (file) fclose(file);
        if (header_list) curl_slist_free_all(header_list);
    }
};

}  // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(HttpClientOptions options)
        : options_(std::move(options)) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create curl handle";
            response.transport_error = true;
            return response;
        }

        TransferResources res;
        perform(curl, request, res, response);
        release_handle(curl);
        return response;
    }

    HttpResponse execute_with_retry(const HttpRequest& request) {
        auto delay = request.retry.initial_delay;

        for (int attempt = 0;; ++attempt) {
            HttpResponse response = execute(request);

            bool retryable = response.transport_error || is_retryable_status(response.status_code);
            if (!retryable || attempt >= request.retry.max_retries) {
                return response;
            }

            log_debug("%s %s: %s, retrying in %lld ms (%d/%d)",
                      method_name(request.method), request.url.c_str(),
                      response.describe().c_str(), static_cast<long long>(delay.count()),
                      attempt + 1, request.retry.max_retries);
            std::this_thread::sleep_for(delay);
            delay = std::chrono::milliseconds(
                static_cast<long long>(delay.count() * request.retry.backoff_multiplier));
        }
    }

private:
    void perform(CURL* curl, const HttpRequest& request, TransferResources& res,
                 HttpResponse& response) {
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
        }

        for (const auto& [name, value] : request.headers.all()) {
            std::string line = name + ": " + value;
            res.header_list = curl_slist_append(res.header_list, line.c_str());
        }
        // Suppress curl's automatic "Expect: 100-continue" on large PUTs
        res.header_list = curl_slist_append(res.header_list, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, res.header_list);

        if (!options_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
        }

        StringSource string_source{&request.body, 0};
        FileSource file_source{nullptr, 0};

        if (request.file_body) {
            res.file = fopen(request.file_body->path.c_str(), "rb");
            if (!res.file ||
                fseeko(res.file, static_cast<off_t>(request.file_body->offset), SEEK_SET) != 0) {
                response.error = "Cannot read " + request.file_body->path.string() +
                                 ": " + std::strerror(errno);
                return;
            }
            file_source = {res.file, request.file_body->length};
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, file_read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &file_source);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.file_body->length));
        } else if (request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, string_read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &string_source);
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        } else if (request.method == HttpMethod::POST) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        }

        std::string body;
        ResponseSink sink{&body, options_.max_response_size, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

        if (!request.verify_ssl) {
            static std::once_flag ssl_warning_flag;
            std::call_once(ssl_warning_flag, []() {
                log_warn("TLS certificate verification is disabled by configuration");
            });
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.verify_ssl ? 2L : 0L);

        CURLcode rc = curl_easy_perform(curl);

        if (rc == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            response.body = std::move(body);
        } else if (rc == CURLE_WRITE_ERROR && sink.size_exceeded) {
            response.error = "Response body exceeded " +
                             std::to_string(options_.max_response_size) + " bytes";
        } else {
            response.error = curl_easy_strerror(rc);
            response.transport_error = true;
        }
    }

    CURL* acquire_handle() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_handles_.empty()) {
                CURL* handle = idle_handles_.back();
                idle_handles_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        // Reset options but keep the connection cache for reuse
        curl_easy_reset(handle);

        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < options_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientOptions options_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

HttpClient::HttpClient(HttpClientOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::execute_with_retry(const HttpRequest& request) {
    return impl_->execute_with_retry(request);
}

// ============================================================================
// AwsSigV4Signer
// ============================================================================

namespace {

std::string hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr);
    return hex(digest, len);
}

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), mac, &len);
    return std::vector<uint8_t>(mac, mac + len);
}

std::string format_utc(std::chrono::system_clock::time_point when, const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm;
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

std::string canonical_request(const HttpRequest& request, const UrlParts& url,
                              const std::string& signed_headers,
                              const std::string& payload_hash) {
    std::string out;
    out += method_name(request.method);
    out += "\n";
    out += url.path.empty() ? "/" : url.path;
    out += "\n";
    out += build_canonical_query_string(url.query);
    out += "\n";
    for (const auto& [name, value] : request.headers.all()) {
        out += name + ":" + value + "\n";
    }
    out += "\n";
    out += signed_headers + "\n";
    out += payload_hash;
    return out;
}

}  // namespace

AwsSigV4Signer::AwsSigV4Signer(std::string access_key_id,
                               std::string secret_access_key,
                               std::string region,
                               std::string service)
    : access_key_id_(std::move(access_key_id))
    , secret_access_key_(std::move(secret_access_key))
    , region_(std::move(region))
    , service_(std::move(service)) {}

std::string AwsSigV4Signer::credential_scope(const std::string& date) const {
    return date + "/" + region_ + "/" + service_ + "/aws4_request";
}

std::vector<uint8_t> AwsSigV4Signer::signing_key(const std::string& date) const {
    std::string seed = "AWS4" + secret_access_key_;
    auto key = hmac_sha256(std::vector<uint8_t>(seed.begin(), seed.end()), date);
    key = hmac_sha256(key, region_);
    key = hmac_sha256(key, service_);
    return hmac_sha256(key, "aws4_request");
}

void AwsSigV4Signer::sign(HttpRequest& request) const {
    sign_at(request, std::chrono::system_clock::now());
}

void AwsSigV4Signer::sign_at(HttpRequest& request,
                             std::chrono::system_clock::time_point when) const {
    auto url = parse_url(request.url);
    if (!url) return;

    std::string datetime = format_utc(when, "%Y%m%dT%H%M%SZ");
    std::string date = datetime.substr(0, 8);

    request.headers.remove("Authorization");
    request.headers.set("Host", url->authority());
    request.headers.set("X-Amz-Date", datetime);

    std::string payload_hash = request.headers.get("X-Amz-Content-Sha256").value_or("");
    if (payload_hash.empty()) {
        payload_hash = sha256_hex(request.body);
        request.headers.set("X-Amz-Content-Sha256", payload_hash);
    }

    std::string signed_headers;
    for (const auto& [name, value] : request.headers.all()) {
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    std::string string_to_sign = "AWS4-HMAC-SHA256\n" + datetime + "\n" +
                                 credential_scope(date) + "\n" +
                                 sha256_hex(canonical_request(request, *url, signed_headers,
                                                              payload_hash));

    auto signature = hmac_sha256(signing_key(date), string_to_sign);

    request.headers.set("Authorization",
                        "AWS4-HMAC-SHA256 Credential=" + access_key_id_ + "/" +
                        credential_scope(date) + ", SignedHeaders=" + signed_headers +
                        ", Signature=" + hex(signature.data(), signature.size()));
}

}  // namespace s3backup::net
