/**
 * @file json_extractor.cpp
 * @brief Implementation of tolerant JSON extraction
 *
 * @date 2025
 */

#include "sandprobe/parsers/json_extractor.hpp"
#include "sandprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace sandprobe {
namespace parsers {

std::optional<json> JsonExtractor::ExtractObject(const std::string& text,
                                                 const std::string& required_key) {
    auto whole = DecodeWhole(text);
    if (whole && whole->contains(required_key)) {
        return whole;
    }
    return DecodeEmbedded(text, required_key);
}

std::string JsonExtractor::ExtractString(const std::string& text, const std::string& key) {
    auto object = ExtractObject(text, key);
    if (!object || !object->contains(key)) {
        return "";
    }

    const auto& value = (*object)[key];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        return value.dump();
    }
    return "";
}

std::optional<json> JsonExtractor::DecodeWhole(const std::string& text) {
    auto trimmed = utils::StringUtils::Trim(text);
    if (trimmed.empty() || trimmed.front() != '{') {
        return std::nullopt;
    }

    try {
        auto parsed = json::parse(trimmed);
        if (parsed.is_object()) {
            return parsed;
        }
    }
    catch (const json::parse_error& e) {
        spdlog::debug("Full-text JSON decode failed: {}", e.what());
    }
    return std::nullopt;
}

std::optional<json> JsonExtractor::DecodeEmbedded(const std::string& text,
                                                  const std::string& required_key) {
    // Brace-free object spans mentioning "key"; the innermost object of a
    // nested payload is the first such span.
    const std::string quoted_key = "\"" + required_key + "\"";

    auto open = text.find('{');
    while (open != std::string::npos) {
        auto next = text.find_first_of("{}", open + 1);
        if (next == std::string::npos) {
            break;
        }
        if (text[next] == '{') {
            open = next;
            continue;
        }

        auto candidate = text.substr(open, next - open + 1);
        if (candidate.find(quoted_key) != std::string::npos) {
            auto parsed = json::parse(candidate, nullptr, false);
            if (!parsed.is_discarded() && parsed.is_object() && parsed.contains(required_key)) {
                return parsed;
            }
            spdlog::debug("Embedded JSON candidate rejected at offset {}", open);
        }
        open = text.find('{', next + 1);
    }

    return std::nullopt;
}

} // namespace parsers
} // namespace sandprobe
