#pragma once

#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

namespace cactisynth::core::detail {

inline std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

inline bool startsWith(const std::string& text, const std::string& pattern) {
    return text.rfind(pattern, 0) == 0;
}

inline std::string toLowerAscii(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

inline bool isDigits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (const char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

// Whole-string conversions; trailing garbage is a failure.
inline std::optional<int> parseInt(const std::string& value) {
    try {
        std::size_t idx = 0;
        const int out = std::stoi(value, &idx);
        if (idx != value.size()) {
            return std::nullopt;
        }
        return out;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

inline std::optional<double> parseDouble(const std::string& value) {
    try {
        std::size_t idx = 0;
        const double out = std::stod(value, &idx);
        if (idx != value.size()) {
            return std::nullopt;
        }
        return out;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace cactisynth::core::detail
