#include <neumorph/shadow/presets.h>
#include <neumorph/core/config.h>

namespace neumorph::shadow {

namespace cfg = core::config;

Color default_light_shadow(Theme theme) {
    return Color::from_argb(theme == Theme::Light ? cfg::kLightThemeLightShadow
                                                  : cfg::kDarkThemeLightShadow);
}

Color default_dark_shadow(Theme theme) {
    return Color::from_argb(theme == Theme::Light ? cfg::kLightThemeDarkShadow
                                                  : cfg::kDarkThemeDarkShadow);
}

ShadowStyle default_flat_style(Theme theme) {
    return ShadowStyle(default_light_shadow(theme), default_dark_shadow(theme),
                       cfg::kDefaultElevation, Flat{RoundedCorner{cfg::kDefaultCornerRadius}},
                       LightSource::TopLeft);
}

ShadowStyle default_pressed_style(Theme theme) {
    return ShadowStyle(default_light_shadow(theme), default_dark_shadow(theme),
                       cfg::kDefaultElevation, Pressed{RoundedCorner{cfg::kDefaultCornerRadius}},
                       LightSource::TopLeft);
}

} // namespace neumorph::shadow
