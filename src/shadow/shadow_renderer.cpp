#include <neumorph/shadow/shadow_renderer.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace neumorph::shadow {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void invoke_content(DrawContext& context) {
    if (context.draw_content) context.draw_content(context.canvas);
}

void report_clamped_radius(const CornerStyle& corner, const Outline& outline,
                           core::DiagnosticEmitter* diagnostics) {
    if (!diagnostics || outline.kind != Outline::RoundedRect) return;
    const auto* rounded = std::get_if<RoundedCorner>(&corner);
    if (rounded && rounded->radius != outline.radius) {
        diagnostics->emit(core::Severity::Info, core::Stage::ResolveOutline,
                          "corner radius " + std::to_string(rounded->radius) +
                          " clamped to " + std::to_string(outline.radius));
    }
}

} // anonymous namespace

float ShadowTuning::blur_radius(float elevation) const {
    if (!std::isfinite(elevation) || elevation <= 0) return 0.0f;
    return std::max(0.0f, elevation * blur_per_elevation);
}

void draw_background_shadows(paint::DisplayList& canvas, const Outline& outline,
                             const Rect& clip_bounds, const OffsetPair& offsets,
                             const ShadowStyle& style, const ShadowTuning& tuning) {
    float blur = tuning.blur_radius(style.elevation());
    Outline excluded = outline.inflated(tuning.clip_inflation);

    const std::pair<Color, geometry::Offset> layers[] = {
        {style.dark_color(), offsets.dark},
        {style.light_color(), offsets.light},
    };
    for (const auto& [color, offset] : layers) {
        canvas.push_clip(clip_bounds);
        canvas.push_outline_clip(excluded, paint::ClipOp::Difference);
        canvas.fill_blurred_outline(outline.translated(offset), offset, color, blur);
        canvas.pop_clip();
        canvas.pop_clip();
    }
}

void draw_foreground_shadows(paint::DisplayList& canvas, const Outline& outline,
                             const OffsetPair& offsets, const ShadowStyle& style,
                             const ShadowTuning& tuning) {
    float blur = tuning.blur_radius(style.elevation());

    const std::pair<Color, geometry::Offset> layers[] = {
        {style.light_color(), offsets.light},
        {style.dark_color(), offsets.dark},
    };
    for (const auto& [color, offset] : layers) {
        canvas.push_outline_clip(outline, paint::ClipOp::Intersect);
        // The area outside the shifted outline is the wall that casts the
        // inset shadow; clipped inside, it reads as an engraved edge
        canvas.fill_blurred_outline(outline.translated(offset), offset, color, blur,
                                    /*inverted=*/true);
        canvas.pop_clip();
    }
}

void render_neumorphic(DrawContext& context, const ShadowStyle& style,
                       const ShadowTuning& tuning, core::DiagnosticEmitter* diagnostics) {
    core::DrawScope scope(diagnostics);
    Outline outline = geometry::resolve_outline(context.bounds, style.corner());
    OffsetPair offsets = resolve_offsets(style.light_source(), style.elevation());

    bool draw_shadows = true;
    if (outline.is_empty()) {
        core::emit_to(diagnostics, core::Severity::Info, core::Stage::Render,
                      "degenerate bounds; shadows skipped");
        draw_shadows = false;
    } else if (offsets.is_zero()) {
        core::emit_to(diagnostics, core::Severity::Info, core::Stage::Render,
                      "elevation " + std::to_string(style.elevation()) +
                      " casts no shadow; shadows skipped");
        draw_shadows = false;
    }
    report_clamped_radius(style.corner(), outline, diagnostics);

    std::visit(overloaded{
        [&](const Flat&) {
            if (draw_shadows) {
                draw_background_shadows(context.canvas, outline, context.clip_bounds,
                                        offsets, style, tuning);
            }
            invoke_content(context);
        },
        [&](const Pressed&) {
            invoke_content(context);
            if (draw_shadows) {
                draw_foreground_shadows(context.canvas, outline, offsets, style, tuning);
            }
        },
    }, style.shape());
}

} // namespace neumorph::shadow
