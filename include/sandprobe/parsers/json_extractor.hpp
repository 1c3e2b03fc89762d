/**
 * @file json_extractor.hpp
 * @brief Tolerant extraction of a JSON object from noisy CLI output
 *
 * Command-line tools under test print log lines and banners around their
 * JSON payload. Extraction tries two strategies in order:
 * 1. Decode the whole (trimmed) text as a JSON object carrying the key
 * 2. Scan left to right for the first brace-free `{...}` span that mentions the required
 *    key, and decode that span
 *
 * Neither strategy throws; failure yields an empty result.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <optional>

#include <nlohmann/json.hpp>

namespace sandprobe {
namespace parsers {

/**
 * @class JsonExtractor
 * @brief Two-tier tolerant JSON object parser
 *
 * **Usage Example**:
 * @code
 * auto id = JsonExtractor::ExtractString("log line\n{\"id\":\"abc123\"}\nmore log", "id");
 * // id == "abc123"
 * @endcode
 */
class JsonExtractor {
public:
    /**
     * @brief Decode a JSON object carrying required_key out of text
     * @param text Raw output, possibly with noise around the payload
     * @param required_key Key the embedded object must contain
     * @return Decoded object, or nullopt when neither strategy succeeds
     */
    static std::optional<nlohmann::json> ExtractObject(const std::string& text,
                                                       const std::string& required_key);

    /**
     * @brief Value of key from the extracted object as text
     * @return String value (numbers are rendered), empty when absent
     */
    static std::string ExtractString(const std::string& text, const std::string& key);

private:
    static std::optional<nlohmann::json> DecodeWhole(const std::string& text);
    static std::optional<nlohmann::json> DecodeEmbedded(const std::string& text,
                                                        const std::string& required_key);
};

} // namespace parsers
} // namespace sandprobe
