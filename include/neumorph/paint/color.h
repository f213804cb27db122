#pragma once
#include <cstdint>

namespace neumorph::paint {

// 8-bit RGBA; packed form is ARGB (0xAARRGGBB)
struct Color {
    uint8_t r, g, b, a;
    static Color from_argb(uint32_t argb) {
        return {
            static_cast<uint8_t>((argb >> 16) & 0xFF),
            static_cast<uint8_t>((argb >> 8) & 0xFF),
            static_cast<uint8_t>(argb & 0xFF),
            static_cast<uint8_t>((argb >> 24) & 0xFF)
        };
    }
    uint32_t to_argb() const {
        return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(r) << 16) |
               (static_cast<uint32_t>(g) << 8) | b;
    }
    bool operator==(const Color& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

} // namespace neumorph::paint
