#ifndef STMTGUARD_UTIL_HASHING_HPP
#define STMTGUARD_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 fingerprints for statement documents.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * DESIGN:
 *   - Logs identify a document only by a fingerprint of its raw content, so an
 *     operator can correlate log lines without the statement text ever being logged.
 *
 * USAGE:
 *   @code
 *   using namespace stmtguard::util::hashing;
 *
 *   std::string full = sha256(statementText);       // 64 hex chars
 *   std::string id = documentFingerprint(statementText); // 16 hex chars
 *   @endcode
 */

namespace stmtguard {
namespace util {
namespace hashing {

/// Length in hex characters of a document fingerprint.
constexpr std::size_t kFingerprintLength = 16;

/**
 * @brief Compute a SHA-256 hash of the input string, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256(const std::string &input)
{
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256: Failed to create EVP_MD_CTX.");
    }

    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: EVP_DigestInit_ex failed.");
    }

    if (EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: EVP_DigestUpdate failed.");
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (EVP_DigestFinal_ex(mdctx, hash, nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: EVP_DigestFinal_ex failed.");
    }
    EVP_MD_CTX_free(mdctx);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return oss.str();
}

/**
 * @brief Short, stable identifier of a document: the leading hex chars of its SHA-256.
 */
inline std::string documentFingerprint(const std::string &content)
{
    return sha256(content).substr(0, kFingerprintLength);
}

} // namespace hashing
} // namespace util
} // namespace stmtguard

#endif // STMTGUARD_UTIL_HASHING_HPP
