#pragma once
#include <neumorph/geometry/outline.h>
#include <neumorph/paint/color.h>
#include <neumorph/shadow/light_source.h>
#include <variant>

namespace neumorph::shadow {

using geometry::CornerStyle;
using geometry::Oval;
using geometry::RoundedCorner;
using paint::Color;

enum class ShapeVariant {
    Flat,     // raised: shadows outside, behind content
    Pressed   // inset: shadows inside, over content
};

struct Flat {
    CornerStyle corner;
    bool operator==(const Flat& o) const { return corner == o.corner; }
};

struct Pressed {
    CornerStyle corner;
    bool operator==(const Pressed& o) const { return corner == o.corner; }
};

using NeuShape = std::variant<Flat, Pressed>;

ShapeVariant shape_variant(const NeuShape& shape);
const CornerStyle& corner_style(const NeuShape& shape);
NeuShape make_shape(ShapeVariant variant, const CornerStyle& corner);

// Fully resolved configuration of one neumorphic draw. Immutable; cheap to
// copy and compare, so callers may cache it across frames.
class ShadowStyle {
public:
    ShadowStyle(const Color& light_color, const Color& dark_color, float elevation,
                const NeuShape& shape, LightSource light_source);

    const Color& light_color() const { return light_color_; }
    const Color& dark_color() const { return dark_color_; }
    float elevation() const { return elevation_; }
    const NeuShape& shape() const { return shape_; }
    LightSource light_source() const { return light_source_; }

    ShapeVariant variant() const { return shape_variant(shape_); }
    const CornerStyle& corner() const { return corner_style(shape_); }

    bool operator==(const ShadowStyle& o) const;
    bool operator!=(const ShadowStyle& o) const { return !(*this == o); }

private:
    Color light_color_;
    Color dark_color_;
    float elevation_;
    NeuShape shape_;
    LightSource light_source_;
};

} // namespace neumorph::shadow
