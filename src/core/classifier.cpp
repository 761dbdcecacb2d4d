#include "mdpack/classifier.h"

#include <array>
#include <cerrno>
#include <fstream>

namespace mdpack {

bool ContentClassifier::is_binary(const std::filesystem::path& path, std::error_code& ec) {
    ec.clear();
    errno = 0;
    std::ifstream in{path, std::ios::binary};
    if (!in.is_open()) {
        ec.assign(errno != 0 ? errno : EIO, std::generic_category());
        return false;
    }

    // One extra byte tells a full sample apart from a file of exactly kSampleSize bytes.
    std::array<char, kSampleSize + 1> buffer{};
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (in.bad()) {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }

    const auto read = static_cast<std::size_t>(in.gcount());
    const bool more_follows = read > kSampleSize;
    const std::string_view sample{buffer.data(), more_follows ? kSampleSize : read};
    return is_binary_sample(sample, more_follows);
}

bool ContentClassifier::is_binary_sample(std::string_view sample, bool more_follows) noexcept {
    if (sample.find('\0') != std::string_view::npos) {
        return true;
    }
    return !is_valid_utf8(sample, more_follows);
}

bool ContentClassifier::is_valid_utf8(std::string_view bytes, bool allow_truncated_tail) noexcept {
    std::size_t i = 0;
    const std::size_t size = bytes.size();
    while (i < size) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t length = 0;
        unsigned char lower = 0x80;
        unsigned char upper = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) {
                lower = 0xA0; // overlong
            } else if (lead == 0xED) {
                upper = 0x9F; // surrogates
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) {
                lower = 0x90; // overlong
            } else if (lead == 0xF4) {
                upper = 0x8F; // above U+10FFFF
            }
        } else {
            return false;
        }

        for (std::size_t k = 1; k < length; ++k) {
            if (i + k >= size) {
                return allow_truncated_tail;
            }
            const auto cont = static_cast<unsigned char>(bytes[i + k]);
            const unsigned char lo = k == 1 ? lower : 0x80;
            const unsigned char hi = k == 1 ? upper : 0xBF;
            if (cont < lo || cont > hi) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

} // namespace mdpack
