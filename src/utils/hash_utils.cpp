/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 helpers using OpenSSL
 *
 * @date 2025
 */

#include "sandprobe/utils/hash_utils.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace sandprobe {
namespace utils {

namespace {

std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // anonymous namespace

// Compute SHA256 hash (string)
std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::ParseSha256SumOutput(const std::string& output) {
    auto start = std::find_if_not(output.begin(), output.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    std::string digest;
    for (auto it = start; it != output.end() && std::isxdigit(static_cast<unsigned char>(*it)); ++it) {
        digest.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*it))));
    }
    if (digest.size() != 2 * SHA256_DIGEST_LENGTH) {
        return "";
    }
    return digest;
}

} // namespace utils
} // namespace sandprobe
