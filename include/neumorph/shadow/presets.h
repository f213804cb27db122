#pragma once
#include <neumorph/shadow/shadow_style.h>

namespace neumorph::shadow {

enum class Theme {
    Light,
    Dark
};

// Shadow colors tuned for each theme. Theme detection itself is the
// caller's; the renderer only ever sees the resolved colors.
Color default_light_shadow(Theme theme);
Color default_dark_shadow(Theme theme);

// Elevation 6, light from the top-left, corners rounded by 12
ShadowStyle default_flat_style(Theme theme);
ShadowStyle default_pressed_style(Theme theme);

} // namespace neumorph::shadow
