#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace s3backup {

// Incremental MD5 over OpenSSL EVP.
class Md5 {
public:
    Md5();
    ~Md5();

    Md5(const Md5&) = delete;
    Md5& operator=(const Md5&) = delete;

    void update(const void* data, size_t len);

    // Raw 16-byte digest. The hasher cannot be updated afterwards.
    std::vector<uint8_t> finish();
    std::string finish_hex();

private:
    EVP_MD_CTX* ctx_;
};

std::string to_hex(const std::vector<uint8_t>& bytes);

/// Lowercase hex MD5 of a whole file, read in HASH_CHUNK_SIZE blocks.
/// Returns nullopt if the file cannot be opened or read.
std::optional<std::string> md5_file_hex(const std::filesystem::path& path);

/// S3-style composite ETag for a multipart object: hex MD5 over the
/// concatenated binary part digests, suffixed with "-<part count>".
std::optional<std::string> multipart_etag_for_file(const std::filesystem::path& path,
                                                   uint64_t part_size);

}  // namespace s3backup
