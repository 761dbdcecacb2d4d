#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace mdpack {

class ContentClassifier {
public:
    static constexpr std::size_t kSampleSize = 512;

    // Reads at most kSampleSize bytes. Sets ec and returns false when the
    // file cannot be opened or read.
    [[nodiscard]] static bool is_binary(const std::filesystem::path& path, std::error_code& ec);

    // `more_follows` tells whether the sample stops before the end of the
    // file, in which case a cut-off trailing sequence is still text.
    [[nodiscard]] static bool is_binary_sample(std::string_view sample, bool more_follows) noexcept;

    [[nodiscard]] static bool is_valid_utf8(std::string_view bytes, bool allow_truncated_tail) noexcept;
};

} // namespace mdpack
