#pragma once

// C++20 helpers shared by the parser, the config loader and the auth layer.

#include <string>
#include <string_view>
#include <stdexcept>
#include <charconv>
#include <cstdlib>
#include <cstdint>
#include <chrono>
#include <nlohmann/json.hpp>

namespace Cpp20Utils {

/**
 * Strict string-to-double conversion.
 * @param str Input string to convert
 * @return Converted value
 * @throws std::invalid_argument if the whole string is not a number
 */
inline double parseDouble(std::string_view str) {
    // std::from_chars for double is not available on every stdlib; strtod needs a terminated buffer
    const std::string buf(str);
    const char* begin = buf.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (buf.empty() || end != begin + buf.size()) {
        throw std::invalid_argument("not a number: '" + buf + "'");
    }
    return value;
}

/**
 * Strict string-to-uint64 conversion.
 * @throws std::invalid_argument on empty, signed, overflowing or trailing input
 */
inline uint64_t parseUint64(std::string_view str) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size() || str.empty()) {
        throw std::invalid_argument("not an unsigned integer: '" + std::string(str) + "'");
    }
    return value;
}

// Coinbase encodes most numbers as JSON strings; accept either representation.
inline double numericField(const nlohmann::json& obj, const char* key) {
    const auto& v = obj.at(key);
    if (v.is_string()) return parseDouble(v.get_ref<const std::string&>());
    if (v.is_number()) return v.get<double>();
    throw std::invalid_argument(std::string("field '") + key + "' is not numeric");
}

inline uint64_t unsignedField(const nlohmann::json& obj, const char* key) {
    const auto& v = obj.at(key);
    if (v.is_string()) return parseUint64(v.get_ref<const std::string&>());
    if (v.is_number_unsigned()) return v.get<uint64_t>();
    if (v.is_number_integer() && v.get<int64_t>() >= 0) return static_cast<uint64_t>(v.get<int64_t>());
    throw std::invalid_argument(std::string("field '") + key + "' is not an unsigned integer");
}

inline uint64_t unixSecondsNow() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace Cpp20Utils
