#ifndef NEUMORPH_CORE_CONFIG_H
#define NEUMORPH_CORE_CONFIG_H

#include <cstdint>

namespace neumorph::core::config {

inline constexpr float kDefaultElevation = 6.0f;
inline constexpr float kDefaultCornerRadius = 12.0f;

// Shadow blur radius per unit of elevation (Gaussian sigma = blur / 2)
inline constexpr float kBlurRadiusPerElevation = 1.0f;
// Growth of the flat variant's outside clip past the outline; 0 keeps the
// clip edge on the outline, where content covers it
inline constexpr float kClipInflation = 0.0f;

// Theme shadow colors, ARGB
inline constexpr std::uint32_t kLightThemeLightShadow = 0xFFFFFFFF;
inline constexpr std::uint32_t kLightThemeDarkShadow = 0xFFA8B5C7;
inline constexpr std::uint32_t kDarkThemeLightShadow = 0x66494949;
inline constexpr std::uint32_t kDarkThemeDarkShadow = 0x66000000;

}  // namespace neumorph::core::config

#endif  // NEUMORPH_CORE_CONFIG_H
