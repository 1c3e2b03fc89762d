/**
 * @file hash_utils.hpp
 * @brief SHA-256 fingerprinting of configuration documents
 *
 * Documents written into the sandbox are fingerprinted locally so the copy
 * that landed on the sandbox filesystem can be checked against `sha256sum`.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace sandprobe {
namespace utils {

/**
 * @class HashUtils
 * @brief OpenSSL-backed digest helpers
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of in-memory data
     * @param data Bytes to hash
     * @return Lowercase hex digest (64 characters)
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Pull the digest out of `sha256sum` output ("<hex>  <path>")
     * @return Lowercase digest, empty if the output has no 64-char hex prefix
     */
    static std::string ParseSha256SumOutput(const std::string& output);
};

} // namespace utils
} // namespace sandprobe
