#include "checksum.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

std::expected<std::string, BackupError> sha256File(const std::string& filePath) {
    if (!fs::exists(filePath)) {
        return std::unexpected(makeError(BackupErrorCode::NotFound, "File not found: " + filePath));
    }
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to open file for checksum: " + filePath));
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to create OpenSSL digest context"));
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to initialize SHA-256 digest"));
    }

    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to update SHA-256 digest"));
        }
    }
    if (file.bad()) {
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "Read error while hashing: " + filePath));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1) {
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "Failed to finalize SHA-256 digest"));
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
