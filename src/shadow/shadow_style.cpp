#include <neumorph/shadow/shadow_style.h>
#include <cmath>

namespace neumorph::shadow {

ShapeVariant shape_variant(const NeuShape& shape) {
    return std::holds_alternative<Pressed>(shape) ? ShapeVariant::Pressed : ShapeVariant::Flat;
}

const CornerStyle& corner_style(const NeuShape& shape) {
    return std::visit([](const auto& s) -> const CornerStyle& { return s.corner; }, shape);
}

NeuShape make_shape(ShapeVariant variant, const CornerStyle& corner) {
    if (variant == ShapeVariant::Pressed) return Pressed{corner};
    return Flat{corner};
}

ShadowStyle::ShadowStyle(const Color& light_color, const Color& dark_color, float elevation,
                         const NeuShape& shape, LightSource light_source)
    : light_color_(light_color), dark_color_(dark_color),
      elevation_(std::isfinite(elevation) ? elevation : 0.0f),
      shape_(shape), light_source_(light_source) {
}

bool ShadowStyle::operator==(const ShadowStyle& o) const {
    return light_color_ == o.light_color_ && dark_color_ == o.dark_color_ &&
           elevation_ == o.elevation_ && shape_ == o.shape_ &&
           light_source_ == o.light_source_;
}

} // namespace neumorph::shadow
