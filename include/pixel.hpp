#pragma once

#include <cstdint>

namespace unicorn {

// 24-bit RGB value, one byte per channel, no alpha
struct Pixel {
    uint8_t r{0}, g{0}, b{0};
};

constexpr bool operator==(const Pixel& a, const Pixel& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

constexpr bool operator!=(const Pixel& a, const Pixel& b) { return !(a == b); }

constexpr Pixel kBlack{0, 0, 0};

} // namespace unicorn
