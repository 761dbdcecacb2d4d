#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace mdpack::string_utils {

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

inline std::string trim(std::string_view text) {
    constexpr std::string_view whitespace = " \t\n\r\f\v";
    const auto start = text.find_first_not_of(whitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(whitespace);
    return std::string{text.substr(start, end - start + 1)};
}

// Forward slashes regardless of platform, lexically normalized.
inline std::string normalize_path(const std::filesystem::path& path) {
    std::string text = path.lexically_normal().generic_string();
    if (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

inline bool has_glob_meta(std::string_view text) {
    return text.find_first_of("*?[") != std::string_view::npos;
}

} // namespace mdpack::string_utils
