#pragma once

#include "decimal.hpp"

#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace oceanbook::json {

// Simple JSON value extraction (no external dependencies)
// This is intentionally minimal - handles only flat objects of scalar values

// Position of the first character of the value stored under key, or npos
inline size_t findValue(const std::string& json, const std::string& key)
{
    std::string searchKey = "\"" + key + "\"";
    auto keyPos = json.find(searchKey);
    if (keyPos == std::string::npos)
        return std::string::npos;

    auto colonPos = json.find(':', keyPos + searchKey.size());
    if (colonPos == std::string::npos)
        return std::string::npos;

    auto valueStart = colonPos + 1;
    while (valueStart < json.size() && std::isspace(static_cast<unsigned char>(json[valueStart])))
        ++valueStart;

    return valueStart < json.size() ? valueStart : std::string::npos;
}

inline bool hasKey(const std::string& json, const std::string& key)
{
    auto valueStart = findValue(json, key);
    return valueStart != std::string::npos && json.compare(valueStart, 4, "null") != 0;
}

inline std::string extractString(const std::string& json, const std::string& key)
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos || json[valueStart] != '"')
        return "";

    auto endQuote = json.find('"', valueStart + 1);
    if (endQuote == std::string::npos)
        return "";

    return json.substr(valueStart + 1, endQuote - valueStart - 1);
}

// Raw text of a numeric value. Quoted numbers ("0.01") are accepted as well, since
// exchanges commonly send prices as strings to keep them exact.
inline std::string extractNumber(const std::string& json, const std::string& key)
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos)
        return "";

    if (json[valueStart] == '"')
        return extractString(json, key);

    std::string numStr;
    while (valueStart < json.size() && (std::isdigit(static_cast<unsigned char>(json[valueStart])) ||
                                         json[valueStart] == '.' || json[valueStart] == '-')) {
        numStr += json[valueStart];
        ++valueStart;
    }
    return numStr;
}

// Exact decimal value; nullopt when the key is missing or null.
// Throws std::invalid_argument when the value is not a plain decimal.
inline std::optional<Decimal> extractDecimal(const std::string& json, const std::string& key)
{
    if (!hasKey(json, key))
        return std::nullopt;
    return Decimal::parse(extractNumber(json, key));
}

// Unsigned integer value; 0 when the key is missing.
// Throws std::invalid_argument for signs, fractions, trailing junk or values above 2^64-1.
inline uint64_t extractUInt(const std::string& json, const std::string& key)
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos)
        return 0;

    std::string numStr;
    if (json[valueStart] == '"') {
        numStr = extractString(json, key);
    } else {
        auto valueEnd = json.find_first_of(",}] \t\r\n", valueStart);
        numStr = json.substr(valueStart, valueEnd == std::string::npos ? std::string::npos : valueEnd - valueStart);
    }

    if (numStr.empty() || numStr.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument("Invalid unsigned integer for '" + key + "': " + numStr);

    try {
        return std::stoull(numStr);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Integer out of range for '" + key + "': " + numStr);
    }
}

inline bool extractBool(const std::string& json, const std::string& key)
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos)
        return false;
    return json.compare(valueStart, 4, "true") == 0;
}

} // namespace oceanbook::json
