#pragma once

#include <string_view>

#ifndef MDPACK_VERSION_STRING
#define MDPACK_VERSION_STRING "0.0.0"
#endif

namespace mdpack {

class Version {
public:
    static constexpr std::string_view String() noexcept { return std::string_view{MDPACK_VERSION_STRING}; }
};

} // namespace mdpack
