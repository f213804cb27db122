#include <neumorph/geometry/outline.h>
#include <algorithm>
#include <cmath>

namespace neumorph::geometry {

bool Rect::is_empty() const {
    // NaN fails both comparisons, so it counts as empty too
    return !(width > 0) || !(height > 0) || !std::isfinite(width) || !std::isfinite(height) ||
           !std::isfinite(x) || !std::isfinite(y);
}

Rect Rect::intersect(const Rect& other) const {
    Rect next;
    next.x = std::max(x, other.x);
    next.y = std::max(y, other.y);
    float r = std::min(right(), other.right());
    float b = std::min(bottom(), other.bottom());
    next.width = std::max(0.0f, r - next.x);
    next.height = std::max(0.0f, b - next.y);
    return next;
}

float Offset::length() const {
    return std::sqrt(dx * dx + dy * dy);
}

Outline Outline::translated(const Offset& offset) const {
    Outline out = *this;
    out.bounds = bounds.translated(offset.dx, offset.dy);
    return out;
}

Outline Outline::inflated(float amount) const {
    if (kind == Empty || amount == 0) return *this;
    Outline out = *this;
    out.bounds = bounds.inflated(amount);
    if (out.bounds.is_empty()) return Outline{};
    if (kind == RoundedRect) out.radius = clamp_corner_radius(out.bounds, radius + amount);
    return out;
}

float Outline::signed_distance(float px, float py) const {
    if (kind == Empty) return 1e9f;

    float half_w = bounds.width / 2.0f;
    float half_h = bounds.height / 2.0f;
    float lx = px - bounds.center_x();
    float ly = py - bounds.center_y();

    if (kind == RoundedRect) {
        // Box SDF shrunk by the corner radius, then grown back by it
        float qx = std::fabs(lx) - (half_w - radius);
        float qy = std::fabs(ly) - (half_h - radius);
        float ox = std::max(qx, 0.0f);
        float oy = std::max(qy, 0.0f);
        float outside = std::sqrt(ox * ox + oy * oy);
        float inside = std::min(std::max(qx, qy), 0.0f);
        return outside + inside - radius;
    }

    // Ellipse: d ~= k0 * (k0 - 1) / k1, with k0 = |p / ab| and k1 = |p / ab^2|
    float k0x = lx / half_w, k0y = ly / half_h;
    float k1x = lx / (half_w * half_w), k1y = ly / (half_h * half_h);
    float k0 = std::sqrt(k0x * k0x + k0y * k0y);
    float k1 = std::sqrt(k1x * k1x + k1y * k1y);
    if (k1 < 1e-6f) return -std::min(half_w, half_h);
    return k0 * (k0 - 1.0f) / k1;
}

float Outline::coverage(float px, float py) const {
    if (kind == Empty) return 0.0f;
    float d = signed_distance(px, py);
    return std::max(0.0f, std::min(1.0f, 0.5f - d));
}

float clamp_corner_radius(const Rect& bounds, float radius) {
    if (!std::isfinite(radius) || radius <= 0) return 0.0f;
    float half_min = std::min(bounds.width, bounds.height) / 2.0f;
    return std::min(radius, std::max(0.0f, half_min));
}

Outline resolve_outline(const Rect& bounds, const CornerStyle& corner) {
    Outline outline;
    if (bounds.is_empty()) return outline;

    outline.bounds = bounds;
    if (const auto* rounded = std::get_if<RoundedCorner>(&corner)) {
        outline.kind = Outline::RoundedRect;
        outline.radius = clamp_corner_radius(bounds, rounded->radius);
    } else {
        outline.kind = Outline::Ellipse;
    }
    return outline;
}

} // namespace neumorph::geometry
