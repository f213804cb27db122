#pragma once
#include <neumorph/geometry/outline.h>
#include <neumorph/paint/color.h>
#include <cstddef>
#include <vector>

namespace neumorph::paint {

using geometry::Offset;
using geometry::Outline;
using geometry::Rect;

enum class ClipOp {
    Intersect,   // keep what lies inside the clip shape
    Difference   // keep what lies outside the clip shape
};

struct PaintCommand {
    enum Type {
        FillRect, FillOutline, FillBlurredOutline,
        PushClip, PushOutlineClip, PopClip
    };
    Type type;
    Rect bounds = {0, 0, 0, 0};  // FillRect / PushClip rect, otherwise outline bounding box
    Color color = {0, 0, 0, 0};

    // Shape to fill (FillOutline, FillBlurredOutline) or to clip against (PushOutlineClip)
    Outline outline;

    // Blurred outline data (for FillBlurredOutline)
    float blur_radius = 0;      // Gaussian blur radius, sigma = blur_radius / 2
    Offset offset;              // translation already applied to |outline|
    bool inverted = false;      // fill the complement of |outline| instead of its interior

    // Outline clip data (for PushOutlineClip)
    ClipOp clip_op = ClipOp::Intersect;

    bool operator==(const PaintCommand& o) const;
    bool operator!=(const PaintCommand& o) const { return !(*this == o); }
};

class DisplayList {
public:
    void fill_rect(const Rect& rect, const Color& color);
    void fill_outline(const Outline& outline, const Color& color);
    void fill_blurred_outline(const Outline& outline, const Offset& offset, const Color& color,
                              float blur_radius, bool inverted = false);
    void push_clip(const Rect& clip_rect);
    void push_outline_clip(const Outline& outline, ClipOp op);
    void pop_clip();

    const std::vector<PaintCommand>& commands() const { return commands_; }
    std::size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }
    void clear() { commands_.clear(); }

    // Number of commands of the given type
    std::size_t count(PaintCommand::Type type) const;

private:
    std::vector<PaintCommand> commands_;
};

} // namespace neumorph::paint
