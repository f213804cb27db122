#include <neumorph/shadow/neu_effect.h>
#include <neumorph/shadow/style_resolver.h>

namespace neumorph::shadow {

NeuEffect make_neu_effect(const ShadowStyle& style, const ShadowTuning& tuning) {
    return NeuEffect(style, tuning);
}

NeuEffect make_neu_effect(const Color& light_color, const Color& dark_color, float elevation,
                          const NeuShape& shape, LightSource light_source) {
    return NeuEffect(resolve_style(light_color, dark_color, elevation, shape, light_source));
}

} // namespace neumorph::shadow
