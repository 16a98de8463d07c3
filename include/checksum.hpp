/**
 * @file checksum.hpp
 * @brief SHA-256 digests of backup artifacts.
 *
 * @note Requires OpenSSL (libcrypto).
 */

#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP

#include <string>
#include <expected>
#include "backup_error.hpp"

/**
 * @brief Computes the SHA-256 digest of a file.
 *
 * The file is streamed in fixed-size blocks, so artifacts of any size are supported.
 *
 * @param filePath File to digest.
 * @return std::expected<std::string, BackupError> 64 lowercase hex characters, or
 *         NotFound / IOFailure.
 */
std::expected<std::string, BackupError> sha256File(const std::string& filePath);

#endif // CHECKSUM_HPP
