#pragma once

#include <filesystem>
#include <string>

namespace s3backup {

class StorageClient;

/// Strip one pair of surrounding double quotes from an ETag.
std::string strip_etag_quotes(const std::string& etag);

/// Composite ETags from multipart uploads carry a "-<parts>" suffix and are
/// not a digest of the object content.
bool is_multipart_etag(const std::string& etag);

/// Confirms that a remote object matches its local source.
///
/// Simple uploads compare the local MD5 with the ETag. Multipart uploads fall
/// back to comparing sizes only, so equal-sized objects with different content
/// pass for them.
class UploadVerifier {
public:
    explicit UploadVerifier(const StorageClient& store) : store_(store) {}

    /// Returns false on mismatch or when the local file cannot be read.
    /// StoreError from the metadata request propagates to the caller.
    bool verify(const std::filesystem::path& local_path, const std::string& key) const;

private:
    const StorageClient& store_;
};

}  // namespace s3backup
