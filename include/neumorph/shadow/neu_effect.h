#pragma once
#include <neumorph/shadow/shadow_renderer.h>
#include <neumorph/shadow/shadow_style.h>

namespace neumorph::shadow {

// A draw effect that can be attached to any node able to hand out a
// DrawContext. Holds only the resolved style; every draw is independent.
class NeuEffect {
public:
    explicit NeuEffect(const ShadowStyle& style, const ShadowTuning& tuning = {})
        : style_(style), tuning_(tuning) {}

    void draw(DrawContext& context, core::DiagnosticEmitter* diagnostics = nullptr) const {
        render_neumorphic(context, style_, tuning_, diagnostics);
    }
    void operator()(DrawContext& context) const { draw(context); }

    const ShadowStyle& style() const { return style_; }
    const ShadowTuning& tuning() const { return tuning_; }

private:
    ShadowStyle style_;
    ShadowTuning tuning_;
};

NeuEffect make_neu_effect(const ShadowStyle& style, const ShadowTuning& tuning = {});
NeuEffect make_neu_effect(const Color& light_color, const Color& dark_color, float elevation,
                          const NeuShape& shape, LightSource light_source);

} // namespace neumorph::shadow
