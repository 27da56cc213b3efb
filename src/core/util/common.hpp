#pragma once
#include <algorithm>
#include <cctype>
#include <string>

namespace saferclaw::core::util {

    // For the static_assert closing an exhaustive `if constexpr` chain over
    // the action variant.
    template <class>
    inline constexpr bool kAlwaysFalse = false;

    inline std::string lowercase(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](const unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        return value;
    }

} // namespace saferclaw::core::util
