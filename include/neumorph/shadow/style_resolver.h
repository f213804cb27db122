#pragma once
#include <neumorph/core/diagnostics.h>
#include <neumorph/shadow/shadow_style.h>
#include <cstdint>
#include <optional>
#include <string>

namespace neumorph::shadow {

// Pre-built style bundle, e.g. a preset or a caller's cached configuration
struct StyleBundle {
    Color light_color;
    Color dark_color;
    float elevation;
    NeuShape shape;
    LightSource light_source;
};

// Untyped style fields as they arrive from an external boundary.
// shape_variant: 0=flat, 1=pressed
// corner_style:  0=rounded, 1=oval
// light_source:  0=top-left, 1=top-right, 2=bottom-left, 3=bottom-right
struct RawStyleFields {
    uint32_t light_argb = 0;
    uint32_t dark_argb = 0;
    float elevation = 0;
    int shape_variant = 0;
    int corner_style = 0;
    float corner_radius = 0;
    int light_source = 0;
};

ShadowStyle resolve_style(const Color& light_color, const Color& dark_color, float elevation,
                          const NeuShape& shape, LightSource light_source);
ShadowStyle resolve_style(const StyleBundle& bundle);

// Never fails. An unknown shape or corner code degrades to a flat rounded
// rect of radius 0, an unknown light source to top-left; each fallback is
// reported as a warning.
ShadowStyle resolve_style(const RawStyleFields& fields,
                          core::DiagnosticEmitter* diagnostics = nullptr);

// Keyword parsing for textual configuration
std::optional<LightSource> parse_light_source(const std::string& value);
std::optional<ShapeVariant> parse_shape_variant(const std::string& value);
// "oval", "rounded <radius>" or "rounded(<radius>)"
std::optional<CornerStyle> parse_corner_style(const std::string& value);
// Hex (#RGB, #RGBA, #RRGGBB, #RRGGBBAA) or a named color
std::optional<Color> parse_color(const std::string& value);
// Number with an optional "px" or "dp" suffix
std::optional<float> parse_elevation(const std::string& value);

const char* light_source_name(LightSource light_source);
const char* shape_variant_name(ShapeVariant variant);

// Apply "key: value;" declarations on top of |base|. Recognised keys:
// light-color, dark-color, elevation, light-source, shape, corner.
// Returns nullopt on an unknown key or a malformed value.
std::optional<ShadowStyle> parse_style_declarations(const std::string& text,
                                                    const ShadowStyle& base,
                                                    core::DiagnosticEmitter* diagnostics = nullptr);

} // namespace neumorph::shadow
