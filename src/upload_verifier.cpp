#include "s3backup/upload_verifier.hpp"
#include "s3backup/core/digest.hpp"
#include "s3backup/core/log.hpp"
#include "s3backup/storage/client.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace s3backup {

std::string strip_etag_quotes(const std::string& etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        return etag.substr(1, etag.size() - 2);
    }
    return etag;
}

bool is_multipart_etag(const std::string& etag) {
    return etag.find('-') != std::string::npos;
}

bool UploadVerifier::verify(const std::filesystem::path& local_path,
                            const std::string& key) const {
    auto meta = store_.head_metadata(key);
    std::string remote_etag = strip_etag_quotes(meta.etag);

    if (is_multipart_etag(remote_etag)) {
        std::error_code ec;
        auto local_size = std::filesystem::file_size(local_path, ec);
        if (ec) {
            log_error("Verification of %s: cannot stat %s: %s",
                      key.c_str(), local_path.c_str(), ec.message().c_str());
            return false;
        }
        if (local_size != meta.content_length) {
            log_error("Verification of %s: size mismatch (local %lu bytes, remote %lu bytes)",
                      key.c_str(), static_cast<unsigned long>(local_size),
                      static_cast<unsigned long>(meta.content_length));
            return false;
        }
        log_info("Verification of %s: sizes match (%lu bytes)",
                 key.c_str(), static_cast<unsigned long>(local_size));
        return true;
    }

    auto local_md5 = md5_file_hex(local_path);
    if (!local_md5) {
        log_error("Verification of %s: cannot read %s", key.c_str(), local_path.c_str());
        return false;
    }

    std::transform(remote_etag.begin(), remote_etag.end(), remote_etag.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (*local_md5 != remote_etag) {
        log_error("Verification of %s: MD5 mismatch (local %s, remote %s)",
                  key.c_str(), local_md5->c_str(), remote_etag.c_str());
        return false;
    }

    log_info("Verification of %s: MD5 matches", key.c_str());
    return true;
}

}  // namespace s3backup
