#pragma once
#include <neumorph/core/config.h>
#include <neumorph/core/diagnostics.h>
#include <neumorph/paint/display_list.h>
#include <neumorph/shadow/light_source.h>
#include <neumorph/shadow/shadow_style.h>
#include <functional>

namespace neumorph::shadow {

using geometry::Outline;
using geometry::Rect;

// Draws the wrapped node's own content into the list it is handed
using ContentCallback = std::function<void(paint::DisplayList&)>;

// Per-draw view of the caller's surface. The renderer reads it and invokes
// |draw_content|; it never keeps a reference past the call.
struct DrawContext {
    paint::DisplayList& canvas;
    Rect bounds;          // the node's draw bounds
    Rect clip_bounds;     // current clip of the surface
    ContentCallback draw_content;
};

struct ShadowTuning {
    float blur_per_elevation = core::config::kBlurRadiusPerElevation;
    // Positive values move the flat variant's outside clip away from the
    // outline, negative values let shadow run under the content edge
    float clip_inflation = core::config::kClipInflation;

    float blur_radius(float elevation) const;
};

// Render one neumorphic node: shadows and content, in the order the shape
// variant requires. The content callback runs exactly once per call.
void render_neumorphic(DrawContext& context, const ShadowStyle& style,
                       const ShadowTuning& tuning = {},
                       core::DiagnosticEmitter* diagnostics = nullptr);

// Dark then light layer, each blurred and clipped to the outside of
// |outline| within |clip_bounds|. Content goes on top afterwards.
void draw_background_shadows(paint::DisplayList& canvas, const Outline& outline,
                             const Rect& clip_bounds, const OffsetPair& offsets,
                             const ShadowStyle& style, const ShadowTuning& tuning);

// Light then dark inset layer, each clipped to the inside of |outline|,
// painted over content that was already drawn.
void draw_foreground_shadows(paint::DisplayList& canvas, const Outline& outline,
                             const OffsetPair& offsets, const ShadowStyle& style,
                             const ShadowTuning& tuning);

} // namespace neumorph::shadow
