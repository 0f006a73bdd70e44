#include "s3backup/storage/client.hpp"
#include "s3backup/core/digest.hpp"
#include "s3backup/core/log.hpp"
#include "s3backup/net/http.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <system_error>
#include <vector>

namespace s3backup {

namespace fs = std::filesystem;

// ============================================================================
// XML parsing helpers for S3 responses
// ============================================================================

namespace xml {

// Find the value between <tag>value</tag>, returns empty string if not found
std::string get_element(const std::string& xml, const std::string& tag) {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    size_t start = xml.find(open_tag);
    if (start == std::string::npos) return "";
    start += open_tag.length();

    size_t end = xml.find(close_tag, start);
    if (end == std::string::npos) return "";

    return xml.substr(start, end - start);
}

// Decode XML entities (basic set used by S3)
std::string decode_entities(const std::string& s) {
    std::string result;
    result.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            if (s.compare(i, 4, "&lt;") == 0) { result += '<'; i += 4; }
            else if (s.compare(i, 4, "&gt;") == 0) { result += '>'; i += 4; }
            else if (s.compare(i, 5, "&amp;") == 0) { result += '&'; i += 5; }
            else if (s.compare(i, 6, "&quot;") == 0) { result += '"'; i += 6; }
            else if (s.compare(i, 6, "&apos;") == 0) { result += '\''; i += 6; }
            else { result += s[i++]; }
        } else {
            result += s[i++];
        }
    }

    return result;
}

std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': result += "&amp;"; break;
            case '<': result += "&lt;"; break;
            case '>': result += "&gt;"; break;
            case '"': result += "&quot;"; break;
            case '\'': result += "&apos;"; break;
            default: result += c;
        }
    }
    return result;
}

}  // namespace xml

// ============================================================================
// Multipart part planning
// ============================================================================

uint64_t effective_part_size(uint64_t file_size, uint64_t chunk_size) {
    uint64_t min_for_limit = (file_size + constants::MAX_MULTIPART_PARTS - 1) /
                             constants::MAX_MULTIPART_PARTS;
    return std::max<uint64_t>({chunk_size, min_for_limit, 1});
}

std::vector<PartRange> plan_multipart_parts(uint64_t file_size, uint64_t chunk_size) {
    const uint64_t part_size = effective_part_size(file_size, chunk_size);
    std::vector<PartRange> parts;
    parts.reserve(static_cast<size_t>((file_size + part_size - 1) / part_size));

    uint64_t offset = 0;
    int number = 1;
    while (offset < file_size) {
        uint64_t size = std::min(part_size, file_size - offset);
        parts.push_back({number++, offset, size});
        offset += size;
    }
    return parts;
}

namespace {

// ============================================================================
// SecureString - zeroes credential memory on destruction
// ============================================================================

class SecureString {
public:
    SecureString() = default;
    explicit SecureString(const std::string& s) : data_(s) {}

    SecureString(const SecureString& other) : data_(other.data_) {}
    SecureString& operator=(const SecureString& other) {
        if (this != &other) {
            secure_clear();
            data_ = other.data_;
        }
        return *this;
    }

    ~SecureString() {
        secure_clear();
    }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    void secure_clear() {
        if (!data_.empty()) {
            // volatile keeps the compiler from eliding the stores
            volatile char* p = const_cast<volatile char*>(data_.data());
            size_t len = data_.size();
            while (len--) {
                *p++ = 0;
            }
            data_.clear();
            data_.shrink_to_fit();
        }
    }

    std::string data_;
};

uint64_t local_file_size(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throw StoreError("Cannot stat " + path.string() + ": " + ec.message());
    }
    return size;
}

// ============================================================================
// S3StorageClient - S3-compatible object store over REST
// ============================================================================

class S3StorageClient : public StorageClient {
public:
    struct Config {
        std::string bucket;
        std::string region = constants::DEFAULT_REGION;
        std::string endpoint;
        std::string path_prefix;
        SecureString access_key;
        SecureString secret_key;
        bool use_path_style = false;
        bool verify_ssl = true;
        TransferSettings transfer;
        uint32_t connect_timeout_secs = 30;
    };

    explicit S3StorageClient(const Config& config)
        : config_(config)
        , signer_(config.access_key.str(), config.secret_key.str(), config.region, "s3") {
        net::HttpClientOptions http_options;
        http_options.connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
        http_options.max_idle_handles = std::max<size_t>(16, config_.transfer.part_concurrency * 2);
        http_client_ = std::make_unique<net::HttpClient>(http_options);

        while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
            config_.endpoint.pop_back();
        }
    }

    std::string type_name() const override { return "s3"; }

    ExistsResult exists(const std::string& key) const override {
        auto request = net::HttpRequest::head(build_url(key));
        auto response = send(request);

        ExistsResult result;
        if (response.status_code == 404) {
            return result;
        }
        if (!response.ok()) {
            throw StoreError("HEAD " + key + " failed: " + response.describe(), response.status_code);
        }
        result.found = true;
        result.etag = response.headers.get("ETag");
        return result;
    }

    ObjectMetadata head_metadata(const std::string& key) const override {
        auto request = net::HttpRequest::head(build_url(key));
        auto response = send(request);

        if (response.status_code == 404) {
            throw StoreError("Object not found: " + key, 404);
        }
        if (!response.ok()) {
            throw StoreError("HEAD " + key + " failed: " + response.describe(), response.status_code);
        }

        ObjectMetadata meta;
        meta.etag = response.headers.get("ETag").value_or("");
        meta.content_length = response.headers.content_length().value_or(0);
        // S3 omits the header for STANDARD objects
        meta.storage_class = response.headers.get("x-amz-storage-class")
            .value_or(constants::DEFAULT_STORAGE_CLASS);

        const std::string meta_prefix = "x-amz-meta-";
        for (const auto& [name, value] : response.headers.all()) {
            if (name.starts_with(meta_prefix)) {
                meta.user_metadata[name.substr(meta_prefix.size())] = value;
            }
        }
        return meta;
    }

    void upload(const fs::path& local_path,
                const std::string& key,
                const UploadOptions& options) override {
        uint64_t size = local_file_size(local_path);

        if (size > config_.transfer.multipart_threshold) {
            upload_multipart(local_path, size, key, options);
            return;
        }

        auto request = net::HttpRequest::put_file(build_url(key), {local_path, 0, size});
        apply_upload_headers(request, options);
        // Streamed body: payload is not hashed
        request.headers.set("x-amz-content-sha256", "UNSIGNED-PAYLOAD");

        auto response = send(request);
        if (!response.ok()) {
            throw StoreError("PUT " + key + " failed: " + response.describe(), response.status_code);
        }
    }

    void remove(const std::string& key) override {
        auto request = net::HttpRequest::del(build_url(key));
        auto response = send(request);

        if (!response.ok() && response.status_code != 404) {
            throw StoreError("DELETE " + key + " failed: " + response.describe(), response.status_code);
        }
    }

private:
    struct PartResult {
        int number = 0;
        std::string etag;
        std::string error;
    };

    net::HttpResponse send(net::HttpRequest& request) const {
        request.retry.max_retries = static_cast<int>(config_.transfer.max_retries);
        request.verify_ssl = config_.verify_ssl;
        signer_.sign(request);
        return http_client_->execute_with_retry(request);
    }

    std::string build_url(const std::string& key) const {
        std::string url;
        if (!config_.endpoint.empty()) {
            url = config_.endpoint;
            if (config_.use_path_style && !config_.bucket.empty()) {
                url += "/" + config_.bucket;
            } else if (!config_.use_path_style) {
                auto parsed = net::parse_url(config_.endpoint);
                if (parsed) {
                    url = parsed->scheme + "://" + config_.bucket + "." + parsed->authority() +
                          parsed->path;
                }
            }
        } else {
            if (config_.use_path_style) {
                url = "https://s3." + config_.region + ".amazonaws.com/" + config_.bucket;
            } else {
                url = "https://" + config_.bucket + ".s3." + config_.region + ".amazonaws.com";
            }
        }
        if (!key.empty()) {
            url += "/" + net::url_encode(config_.path_prefix + key, true);
        }
        return url;
    }

    static void apply_upload_headers(net::HttpRequest& request, const UploadOptions& options) {
        request.headers.set("Content-Type", "application/octet-stream");
        for (const auto& [k, v] : options.metadata) {
            request.headers.set("x-amz-meta-" + k, v);
        }
        if (!options.storage_class.empty()) {
            request.headers.set("x-amz-storage-class", options.storage_class);
        }
    }

    // Ensure ETag has surrounding quotes (required for CompleteMultipartUpload)
    static std::string ensure_etag_quotes(const std::string& etag) {
        if (etag.empty()) return etag;
        std::string result = etag;
        if (result.front() != '"') result = "\"" + result;
        if (result.back() != '"') result += "\"";
        return result;
    }

    void upload_multipart(const fs::path& path, uint64_t file_size,
                          const std::string& key, const UploadOptions& options) {
        // 1. Initiate multipart upload
        std::string upload_id = initiate_multipart_upload(key, options);

        // 2. Build part list
        auto parts = plan_multipart_parts(file_size, config_.transfer.multipart_chunk_size);
        log_debug("Multipart upload %s: %zu parts of %lu bytes, upload id %s",
                  key.c_str(), parts.size(),
                  static_cast<unsigned long>(parts.front().size), upload_id.c_str());

        // 3. Upload parts in bounded parallel batches
        const size_t concurrency = std::max<size_t>(1, config_.transfer.part_concurrency);
        std::vector<std::pair<int, std::string>> part_etags;
        std::string first_error;

        for (size_t batch_start = 0; batch_start < parts.size() && first_error.empty();
             batch_start += concurrency) {
            size_t batch_end = std::min(batch_start + concurrency, parts.size());
            std::vector<std::future<PartResult>> futures;

            for (size_t i = batch_start; i < batch_end; ++i) {
                const auto& p = parts[i];
                futures.push_back(std::async(std::launch::async,
                    [this, &path, &key, &upload_id, p]() {
                        return upload_part(path, key, upload_id, p.number, p.offset, p.size);
                    }));
            }

            for (auto& fut : futures) {
                auto part = fut.get();
                if (!part.error.empty()) {
                    if (first_error.empty()) first_error = part.error;
                } else {
                    part_etags.emplace_back(part.number, part.etag);
                }
            }
        }

        if (!first_error.empty()) {
            abort_multipart_upload(key, upload_id);
            throw StoreError("Multipart upload of " + key + " failed: " + first_error);
        }

        // 4. Complete multipart upload
        try {
            complete_multipart_upload(key, upload_id, part_etags);
        } catch (const StoreError&) {
            abort_multipart_upload(key, upload_id);
            throw;
        }
    }

    std::string initiate_multipart_upload(const std::string& key, const UploadOptions& options) {
        auto request = net::HttpRequest::post(build_url(key) + "?uploads", "");
        apply_upload_headers(request, options);

        auto response = send(request);
        if (!response.ok()) {
            throw StoreError("Initiate multipart upload for " + key + " failed: " +
                             response.describe(), response.status_code);
        }

        std::string upload_id = xml::get_element(response.body, "UploadId");
        if (upload_id.empty()) {
            throw StoreError("Initiate multipart upload for " + key + ": no UploadId in response",
                             response.status_code);
        }
        return upload_id;
    }

    PartResult upload_part(const fs::path& path, const std::string& key,
                           const std::string& upload_id, int part_number,
                           uint64_t offset, uint64_t size) const {
        std::string url = build_url(key) +
            "?partNumber=" + std::to_string(part_number) +
            "&uploadId=" + net::url_encode(upload_id);

        auto request = net::HttpRequest::put_file(url, {path, offset, size});
        request.headers.set("x-amz-content-sha256", "UNSIGNED-PAYLOAD");

        PartResult result;
        result.number = part_number;

        auto response = send(request);
        if (!response.ok()) {
            result.error = "part " + std::to_string(part_number) + ": " + response.describe();
            return result;
        }

        // ETag from header comes quoted; keep quotes for CompleteMultipartUpload
        result.etag = ensure_etag_quotes(response.headers.get("ETag").value_or(""));
        if (result.etag.empty()) {
            result.error = "part " + std::to_string(part_number) + ": missing ETag";
        }
        return result;
    }

    void complete_multipart_upload(const std::string& key, const std::string& upload_id,
                                   std::vector<std::pair<int, std::string>> part_etags) {
        std::sort(part_etags.begin(), part_etags.end());

        std::ostringstream body;
        body << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        body << "<CompleteMultipartUpload xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">\n";
        for (const auto& [part_num, etag] : part_etags) {
            body << "  <Part>\n";
            body << "    <PartNumber>" << part_num << "</PartNumber>\n";
            body << "    <ETag>" << xml::escape(etag) << "</ETag>\n";
            body << "  </Part>\n";
        }
        body << "</CompleteMultipartUpload>";

        auto request = net::HttpRequest::post(
            build_url(key) + "?uploadId=" + net::url_encode(upload_id), body.str());
        request.headers.set("Content-Type", "application/xml");

        auto response = send(request);
        if (!response.ok()) {
            throw StoreError("Complete multipart upload for " + key + " failed: " +
                             response.describe(), response.status_code);
        }

        // S3 may report a failed completion inside a 200 response
        std::string reply = response.body;
        if (reply.find("<Error>") != std::string::npos) {
            throw StoreError("Complete multipart upload for " + key + " failed: " +
                             xml::decode_entities(xml::get_element(reply, "Message")),
                             response.status_code);
        }
    }

    void abort_multipart_upload(const std::string& key, const std::string& upload_id) {
        auto request = net::HttpRequest::del(
            build_url(key) + "?uploadId=" + net::url_encode(upload_id));
        auto response = send(request);
        if (!response.ok()) {
            log_warn("Abort multipart upload for %s failed: %s",
                     key.c_str(), response.describe().c_str());
        }
    }

    Config config_;
    net::AwsSigV4Signer signer_;
    std::unique_ptr<net::HttpClient> http_client_;
};

// ============================================================================
// LocalStorageClient - directory-backed store (NFS mount or test fixture)
// ============================================================================

class LocalStorageClient : public StorageClient {
public:
    LocalStorageClient(const fs::path& root, const TransferSettings& transfer,
                       const std::string& path_prefix)
        : root_(fs::absolute(root))
        , transfer_(transfer)
        , path_prefix_(path_prefix) {
        std::error_code ec;
        fs::create_directories(root_ / ".meta", ec);
        if (ec) {
            throw StoreError("Cannot create store directory " + root_.string() + ": " + ec.message());
        }
    }

    std::string type_name() const override { return "local"; }

    ExistsResult exists(const std::string& key) const override {
        std::shared_lock lock(mutex_);
        std::error_code ec;
        bool found = fs::exists(object_path(key), ec);
        if (ec) {
            throw StoreError("Cannot stat object " + key + ": " + ec.message());
        }
        return {found, std::nullopt};
    }

    ObjectMetadata head_metadata(const std::string& key) const override {
        std::shared_lock lock(mutex_);
        auto path = object_path(key);

        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            throw StoreError("Object not found: " + key, 404);
        }

        ObjectMetadata meta;
        meta.content_length = local_file_size(path);

        auto etag = meta.content_length > transfer_.multipart_threshold
            ? multipart_etag_for_file(path, effective_part_size(meta.content_length,
                                                                transfer_.multipart_chunk_size))
            : md5_file_hex(path);
        if (!etag) {
            throw StoreError("Cannot read object " + key);
        }
        meta.etag = "\"" + *etag + "\"";
        meta.storage_class = constants::DEFAULT_STORAGE_CLASS;

        auto sidecar = meta_path(key);
        if (fs::exists(sidecar, ec)) {
            try {
                std::ifstream ifs(sidecar);
                auto j = nlohmann::json::parse(ifs);
                if (j.contains("storage_class")) {
                    meta.storage_class = j["storage_class"].get<std::string>();
                }
                if (j.contains("metadata") && j["metadata"].is_object()) {
                    for (auto& [k, v] : j["metadata"].items()) {
                        meta.user_metadata[k] = v.get<std::string>();
                    }
                }
            } catch (const nlohmann::json::exception& e) {
                throw StoreError("Corrupt metadata for " + key + ": " + e.what());
            }
        }
        return meta;
    }

    void upload(const fs::path& local_path,
                const std::string& key,
                const UploadOptions& options) override {
        std::unique_lock lock(mutex_);
        auto dest_path = object_path(key);
        auto sidecar = meta_path(key);

        std::error_code ec;
        fs::create_directories(dest_path.parent_path(), ec);
        if (!ec) fs::create_directories(sidecar.parent_path(), ec);
        if (ec) {
            throw StoreError("Cannot create directory for " + key + ": " + ec.message());
        }

        // Copy to temp file then rename (atomic)
        auto temp_path = dest_path.string() + ".tmp." +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());

        fs::copy_file(local_path, temp_path, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            throw StoreError("Failed to copy " + local_path.string() + ": " + ec.message());
        }

        nlohmann::json j;
        j["storage_class"] = options.storage_class.empty()
            ? std::string(constants::DEFAULT_STORAGE_CLASS) : options.storage_class;
        j["metadata"] = options.metadata;
        {
            std::ofstream ofs(sidecar, std::ios::trunc);
            ofs << j.dump(2);
            if (!ofs.good()) {
                std::error_code ignored;
                fs::remove(temp_path, ignored);
                throw StoreError("Failed to write metadata for " + key);
            }
        }

        fs::rename(temp_path, dest_path, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(temp_path, ignored);
            throw StoreError("Failed to rename into place " + key + ": " + ec.message());
        }
    }

    void remove(const std::string& key) override {
        std::unique_lock lock(mutex_);
        std::error_code ec;
        fs::remove(object_path(key), ec);
        if (ec) {
            throw StoreError("Failed to remove " + key + ": " + ec.message());
        }
        fs::remove(meta_path(key), ec);
        if (ec) {
            throw StoreError("Failed to remove metadata for " + key + ": " + ec.message());
        }
    }

private:
    fs::path object_path(const std::string& key) const {
        return root_ / (path_prefix_ + key);
    }

    fs::path meta_path(const std::string& key) const {
        return root_ / ".meta" / (path_prefix_ + key + ".json");
    }

    fs::path root_;
    TransferSettings transfer_;
    std::string path_prefix_;
    mutable std::shared_mutex mutex_;
};

}  // namespace

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<StorageClient> make_local_storage_client(const fs::path& root,
                                                         const TransferSettings& transfer,
                                                         const std::string& path_prefix) {
    return std::make_unique<LocalStorageClient>(root, transfer, path_prefix);
}

std::unique_ptr<StorageClient> make_storage_client(const StoreConfig& config,
                                                   const TransferSettings& transfer) {
    if (config.type == "s3") {
        S3StorageClient::Config s3;
        s3.bucket = config.bucket;
        s3.region = config.region.empty() ? constants::DEFAULT_REGION : config.region;
        s3.endpoint = config.endpoint;
        s3.path_prefix = config.path_prefix;
        s3.access_key = SecureString(config.access_key);
        s3.secret_key = SecureString(config.secret_key);
        s3.use_path_style = config.use_path_style;
        s3.verify_ssl = config.verify_ssl;
        s3.transfer = transfer;
        return std::make_unique<S3StorageClient>(s3);
    }

    if (config.type == "local") {
        return make_local_storage_client(config.path, transfer, config.path_prefix);
    }

    throw StoreError("unknown store type: " + config.type);
}

}  // namespace s3backup
