#pragma once
#include <variant>

namespace neumorph::geometry {

struct Rect {
    float x, y, width, height;

    bool contains(float px, float py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }
    bool is_empty() const;
    float right() const { return x + width; }
    float bottom() const { return y + height; }
    float center_x() const { return x + width / 2.0f; }
    float center_y() const { return y + height / 2.0f; }

    // Intersection of two rects; zero-sized when they do not overlap
    Rect intersect(const Rect& other) const;
    Rect translated(float dx, float dy) const { return {x + dx, y + dy, width, height}; }
    Rect inflated(float amount) const {
        return {x - amount, y - amount, width + 2 * amount, height + 2 * amount};
    }

    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    bool operator!=(const Rect& o) const { return !(*this == o); }
};

struct Offset {
    float dx = 0;
    float dy = 0;

    Offset operator-() const { return {-dx, -dy}; }
    bool operator==(const Offset& o) const { return dx == o.dx && dy == o.dy; }
    bool operator!=(const Offset& o) const { return !(*this == o); }
    float length() const;
    bool is_zero() const { return dx == 0 && dy == 0; }
};

struct RoundedCorner {
    float radius = 0;
    bool operator==(const RoundedCorner& o) const { return radius == o.radius; }
};

struct Oval {
    bool operator==(const Oval&) const { return true; }
};

using CornerStyle = std::variant<RoundedCorner, Oval>;

// Resolved boundary of a shape: a rounded rectangle (radius already clamped
// to half the smaller side) or an ellipse inscribed in |bounds|.
struct Outline {
    enum Kind { Empty, RoundedRect, Ellipse };

    Kind kind = Empty;
    Rect bounds = {0, 0, 0, 0};
    float radius = 0; // RoundedRect only

    bool is_empty() const { return kind == Empty; }
    Rect bounding_box() const { return bounds; }
    Outline translated(const Offset& offset) const;
    // Grow (or shrink, for negative |amount|) by |amount| on every side
    Outline inflated(float amount) const;

    // Signed distance from the boundary: negative inside, positive outside.
    // Exact for rounded rects, first-order approximation for ellipses.
    float signed_distance(float px, float py) const;

    // Anti-aliased inside coverage of a pixel centred at (px, py), 0..1
    float coverage(float px, float py) const;

    bool contains(float px, float py) const { return signed_distance(px, py) < 0; }

    bool operator==(const Outline& o) const {
        return kind == o.kind && bounds == o.bounds && radius == o.radius;
    }
    bool operator!=(const Outline& o) const { return !(*this == o); }
};

// Clamp a requested corner radius into [0, min(width, height) / 2].
float clamp_corner_radius(const Rect& bounds, float radius);

Outline resolve_outline(const Rect& bounds, const CornerStyle& corner);

} // namespace neumorph::geometry
