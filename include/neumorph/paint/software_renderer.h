#pragma once
#include <neumorph/paint/display_list.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace neumorph::paint {

class SoftwareRenderer {
public:
    SoftwareRenderer(int width, int height);

    // Render a display list to the pixel buffer
    void render(const DisplayList& list);

    // Clear with a color
    void clear(const Color& color);

    // Get pixel at position
    Color get_pixel(int x, int y) const;

    // Set pixel at position (with alpha blending, clip applied)
    void set_pixel(int x, int y, const Color& color);

    int width() const { return width_; }
    int height() const { return height_; }

    // Save as PPM image
    bool save_ppm(const std::string& filename) const;

    // Get raw pixel buffer (RGBA)
    const std::vector<uint8_t>& pixels() const { return pixels_; }

    // Number of clips still pushed (unbalanced PushClip commands)
    std::size_t clip_depth() const { return clip_stack_.size(); }

private:
    // One pushed clip. |rect| is the running intersection of all rect clips
    // and Intersect outline bounds beneath it, so the top entry alone bounds
    // the visible area.
    struct ClipEntry {
        Rect rect;
        bool has_outline = false;
        Outline outline;
        ClipOp op = ClipOp::Intersect;
    };

    int width_, height_;
    std::vector<uint8_t> pixels_;  // RGBA, row-major
    std::vector<ClipEntry> clip_stack_;

    Rect surface_rect() const;
    Rect clip_rect() const;
    // Product of all outline clip coverages at a pixel centre, 0..1
    float clip_coverage(float px, float py) const;
    void blend_pixel(int x, int y, const Color& color, float coverage);

    void draw_filled_rect(const Rect& rect, const Color& color);
    void draw_filled_outline(const Outline& outline, const Color& color);
    void draw_blurred_outline(const Rect& shadow_rect, const Outline& outline,
                              const Color& color, float blur_radius, bool inverted);
    void push_clip_entry(const Rect& rect, const Outline* outline, ClipOp op);
};

// Gaussian-blurred coverage of a shape edge at signed distance |dist|:
// 0.5 * erfc(dist / (sigma * sqrt(2))).
float blurred_edge_coverage(float dist, float sigma);

} // namespace neumorph::paint
