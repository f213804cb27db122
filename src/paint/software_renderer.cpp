#include <neumorph/paint/software_renderer.h>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace neumorph::paint {

float blurred_edge_coverage(float dist, float sigma) {
    // The CSS blur radius maps to the Gaussian sigma as: sigma = blur_radius / 2.
    // For an edge blurred with a Gaussian, the coverage at distance d is:
    //   coverage = 0.5 * erfc(d / (sigma * sqrt(2)))
    // When dist < 0 (inside), coverage is > 0.5 (approaches 1.0)
    // When dist > 0 (outside), coverage is < 0.5 (approaches 0.0)
    if (sigma < 0.5f) sigma = 0.5f;
    float t = dist / (sigma * 1.41421356f);

    // Fast erf approximation (Abramowitz and Stegun, maximum error ~1.5e-7)
    float abs_t = std::fabs(t);
    float erf_val;
    if (abs_t > 3.7f) {
        erf_val = (t > 0) ? 1.0f : -1.0f;
    } else {
        float p = 1.0f / (1.0f + 0.3275911f * abs_t);
        float exp_val = std::exp(-abs_t * abs_t);
        erf_val = 1.0f - (0.254829592f * p
                          - 0.284496736f * p * p
                          + 1.421413741f * p * p * p
                          - 1.453152027f * p * p * p * p
                          + 1.061405429f * p * p * p * p * p) * exp_val;
        if (t < 0) erf_val = -erf_val;
    }
    return 0.5f * (1.0f - erf_val);
}

SoftwareRenderer::SoftwareRenderer(int width, int height)
    : width_(std::max(0, width)), height_(std::max(0, height)),
      pixels_(static_cast<size_t>(std::max(0, width)) * static_cast<size_t>(std::max(0, height)) * 4, 0) {
}

void SoftwareRenderer::render(const DisplayList& list) {
    for (auto& cmd : list.commands()) {
        switch (cmd.type) {
            case PaintCommand::FillRect:
                draw_filled_rect(cmd.bounds, cmd.color);
                break;
            case PaintCommand::FillOutline:
                draw_filled_outline(cmd.outline, cmd.color);
                break;
            case PaintCommand::FillBlurredOutline:
                draw_blurred_outline(cmd.bounds, cmd.outline, cmd.color,
                                     cmd.blur_radius, cmd.inverted);
                break;
            case PaintCommand::PushClip:
                push_clip_entry(cmd.bounds, nullptr, ClipOp::Intersect);
                break;
            case PaintCommand::PushOutlineClip:
                push_clip_entry(cmd.bounds, &cmd.outline, cmd.clip_op);
                break;
            case PaintCommand::PopClip:
                if (!clip_stack_.empty()) clip_stack_.pop_back();
                break;
        }
    }
}

void SoftwareRenderer::clear(const Color& color) {
    for (int i = 0; i < width_ * height_; i++) {
        pixels_[i * 4 + 0] = color.r;
        pixels_[i * 4 + 1] = color.g;
        pixels_[i * 4 + 2] = color.b;
        pixels_[i * 4 + 3] = color.a;
    }
}

Color SoftwareRenderer::get_pixel(int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return {0, 0, 0, 0};
    }
    int idx = (y * width_ + x) * 4;
    return {pixels_[idx], pixels_[idx + 1], pixels_[idx + 2], pixels_[idx + 3]};
}

void SoftwareRenderer::set_pixel(int x, int y, const Color& color) {
    blend_pixel(x, y, color, 1.0f);
}

Rect SoftwareRenderer::surface_rect() const {
    return {0, 0, static_cast<float>(width_), static_cast<float>(height_)};
}

Rect SoftwareRenderer::clip_rect() const {
    if (clip_stack_.empty()) return surface_rect();
    return clip_stack_.back().rect;
}

float SoftwareRenderer::clip_coverage(float px, float py) const {
    float coverage = 1.0f;
    for (const auto& entry : clip_stack_) {
        if (!entry.has_outline) continue;
        float inside = entry.outline.coverage(px, py);
        coverage *= (entry.op == ClipOp::Intersect) ? inside : 1.0f - inside;
        if (coverage <= 0.0f) return 0.0f;
    }
    return coverage;
}

void SoftwareRenderer::push_clip_entry(const Rect& rect, const Outline* outline, ClipOp op) {
    ClipEntry entry;
    Rect current = clip_rect();
    if (outline) {
        entry.has_outline = true;
        entry.outline = *outline;
        entry.op = op;
        // An outside clip can still expose anything in the current rect
        entry.rect = (op == ClipOp::Intersect) ? current.intersect(outline->bounding_box())
                                               : current;
    } else {
        entry.rect = current.intersect(rect);
    }
    clip_stack_.push_back(entry);
}

void SoftwareRenderer::blend_pixel(int x, int y, const Color& color, float coverage) {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) return;

    float px = static_cast<float>(x) + 0.5f;
    float py = static_cast<float>(y) + 0.5f;
    if (!clip_stack_.empty()) {
        const Rect& clip = clip_stack_.back().rect;
        if (px < clip.x || px >= clip.right() || py < clip.y || py >= clip.bottom()) {
            return;
        }
        coverage *= clip_coverage(px, py);
    }

    uint16_t src_a = static_cast<uint16_t>(
        std::min(255.0f, static_cast<float>(color.a) * std::max(0.0f, coverage)) + 0.5f);

    int idx = (y * width_ + x) * 4;

    if (src_a == 255) {
        // Fully opaque: direct write
        pixels_[idx + 0] = color.r;
        pixels_[idx + 1] = color.g;
        pixels_[idx + 2] = color.b;
        pixels_[idx + 3] = 255;
    } else if (src_a == 0) {
        return;
    } else {
        // Alpha blending: result = (src * src_a + dst * (255 - src_a)) / 255
        uint8_t dst_r = pixels_[idx + 0];
        uint8_t dst_g = pixels_[idx + 1];
        uint8_t dst_b = pixels_[idx + 2];
        uint8_t dst_a = pixels_[idx + 3];

        uint16_t inv_a = 255 - src_a;

        pixels_[idx + 0] = static_cast<uint8_t>((color.r * src_a + dst_r * inv_a) / 255);
        pixels_[idx + 1] = static_cast<uint8_t>((color.g * src_a + dst_g * inv_a) / 255);
        pixels_[idx + 2] = static_cast<uint8_t>((color.b * src_a + dst_b * inv_a) / 255);
        pixels_[idx + 3] = static_cast<uint8_t>(
            std::min(255u, static_cast<unsigned>(src_a) + dst_a * inv_a / 255u));
    }
}

bool SoftwareRenderer::save_ppm(const std::string& filename) const {
    FILE* f = fopen(filename.c_str(), "wb");
    if (!f) return false;

    fprintf(f, "P6\n%d %d\n255\n", width_, height_);

    bool ok = true;
    for (int i = 0; i < width_ * height_ && ok; i++) {
        uint8_t rgb[3] = {pixels_[i * 4], pixels_[i * 4 + 1], pixels_[i * 4 + 2]};
        ok = fwrite(rgb, 1, 3, f) == 3;
    }

    return fclose(f) == 0 && ok;
}

void SoftwareRenderer::draw_filled_rect(const Rect& rect, const Color& color) {
    Rect area = rect.intersect(clip_rect()).intersect(surface_rect());
    if (!(area.width > 0) || !(area.height > 0)) return;
    int x0 = std::max(0, static_cast<int>(std::floor(area.x)));
    int y0 = std::max(0, static_cast<int>(std::floor(area.y)));
    int x1 = std::min(width_, static_cast<int>(std::ceil(area.right())));
    int y1 = std::min(height_, static_cast<int>(std::ceil(area.bottom())));

    for (int y = y0; y < y1; y++) {
        for (int x = x0; x < x1; x++) {
            blend_pixel(x, y, color, 1.0f);
        }
    }
}

void SoftwareRenderer::draw_filled_outline(const Outline& outline, const Color& color) {
    if (outline.is_empty()) return;
    Rect area = outline.bounding_box().intersect(clip_rect()).intersect(surface_rect());
    if (!(area.width > 0) || !(area.height > 0)) return;
    int x0 = std::max(0, static_cast<int>(std::floor(area.x)));
    int y0 = std::max(0, static_cast<int>(std::floor(area.y)));
    int x1 = std::min(width_, static_cast<int>(std::ceil(area.right())));
    int y1 = std::min(height_, static_cast<int>(std::ceil(area.bottom())));

    for (int y = y0; y < y1; y++) {
        float py = static_cast<float>(y) + 0.5f;
        for (int x = x0; x < x1; x++) {
            float px = static_cast<float>(x) + 0.5f;
            float aa = outline.coverage(px, py);
            if (aa <= 0.0f) continue;
            blend_pixel(x, y, color, aa);
        }
    }
}

void SoftwareRenderer::draw_blurred_outline(const Rect& shadow_rect, const Outline& outline,
                                            const Color& color, float blur_radius,
                                            bool inverted) {
    // Gaussian blur using the signed distance field of the outline.
    // For each pixel, compute the distance from the outline boundary, then
    // apply Gaussian falloff. An inverted fill covers the complement of the
    // outline, which is what an inset shadow looks like once clipped inside.
    if (outline.is_empty()) return;

    // The complement is unbounded, so only the clip limits it
    Rect area = inverted ? clip_rect() : shadow_rect.intersect(clip_rect());
    area = area.intersect(surface_rect());
    if (!(area.width > 0) || !(area.height > 0)) return;
    int x0 = std::max(0, static_cast<int>(std::floor(area.x)));
    int y0 = std::max(0, static_cast<int>(std::floor(area.y)));
    int x1 = std::min(width_, static_cast<int>(std::ceil(area.right())));
    int y1 = std::min(height_, static_cast<int>(std::ceil(area.bottom())));

    float sigma = blur_radius / 2.0f;
    bool sharp = blur_radius <= 0.0f;

    for (int y = y0; y < y1; y++) {
        float py = static_cast<float>(y) + 0.5f;
        for (int x = x0; x < x1; x++) {
            float px = static_cast<float>(x) + 0.5f;

            float dist = outline.signed_distance(px, py);
            if (inverted) dist = -dist;

            float coverage = sharp ? std::max(0.0f, std::min(1.0f, 0.5f - dist))
                                   : blurred_edge_coverage(dist, sigma);

            if (coverage < 0.004f) continue; // Skip nearly transparent pixels

            blend_pixel(x, y, color, coverage);
        }
    }
}

} // namespace neumorph::paint
