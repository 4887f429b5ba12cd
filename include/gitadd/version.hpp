#pragma once

#include <string_view>

#ifndef GITADD_VERSION_STRING
#define GITADD_VERSION_STRING "0.0.0"
#endif

namespace gitadd {

class Version {
public:
    static constexpr std::string_view String() noexcept { return std::string_view{GITADD_VERSION_STRING}; }
};

} // namespace gitadd
