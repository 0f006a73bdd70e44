#include "s3backup/core/digest.hpp"
#include "s3backup/core/constants.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace s3backup {

Md5::Md5() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP MD5 initialization failed");
    }
}

Md5::~Md5() {
    EVP_MD_CTX_free(ctx_);
}

void Md5::update(const void* data, size_t len) {
    EVP_DigestUpdate(ctx_, data, len);
}

std::vector<uint8_t> Md5::finish() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_DigestFinal_ex(ctx_, hash, &hash_len);
    return std::vector<uint8_t>(hash, hash + hash_len);
}

std::string Md5::finish_hex() {
    return to_hex(finish());
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::optional<std::string> md5_file_hex(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;

    Md5 md5;
    std::vector<char> buf(constants::HASH_CHUNK_SIZE);
    while (file) {
        file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = file.gcount();
        if (n > 0) md5.update(buf.data(), static_cast<size_t>(n));
    }
    if (file.bad()) return std::nullopt;

    return md5.finish_hex();
}

std::optional<std::string> multipart_etag_for_file(const std::filesystem::path& path,
                                                   uint64_t part_size) {
    if (part_size == 0) return std::nullopt;

    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;

    Md5 combined;
    size_t parts = 0;
    std::vector<char> buf(constants::HASH_CHUNK_SIZE);

    while (file.peek() != std::char_traits<char>::eof()) {
        Md5 part;
        uint64_t remaining = part_size;
        while (remaining > 0 && file) {
            auto want = static_cast<std::streamsize>(
                std::min<uint64_t>(remaining, buf.size()));
            file.read(buf.data(), want);
            auto n = file.gcount();
            if (n <= 0) break;
            part.update(buf.data(), static_cast<size_t>(n));
            remaining -= static_cast<uint64_t>(n);
        }
        if (file.bad()) return std::nullopt;

        auto digest = part.finish();
        combined.update(digest.data(), digest.size());
        ++parts;
        if (!file) break;
    }

    if (parts == 0) return std::nullopt;
    return combined.finish_hex() + "-" + std::to_string(parts);
}

}  // namespace s3backup
