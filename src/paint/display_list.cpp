#include <neumorph/paint/display_list.h>
#include <algorithm>

namespace neumorph::paint {

bool PaintCommand::operator==(const PaintCommand& o) const {
    return type == o.type && bounds == o.bounds && color == o.color &&
           outline == o.outline && blur_radius == o.blur_radius &&
           offset == o.offset && inverted == o.inverted && clip_op == o.clip_op;
}

void DisplayList::fill_rect(const Rect& rect, const Color& color) {
    PaintCommand cmd;
    cmd.type = PaintCommand::FillRect;
    cmd.bounds = rect;
    cmd.color = color;
    commands_.push_back(cmd);
}

void DisplayList::fill_outline(const Outline& outline, const Color& color) {
    if (outline.is_empty()) return;
    PaintCommand cmd;
    cmd.type = PaintCommand::FillOutline;
    cmd.bounds = outline.bounding_box();
    cmd.outline = outline;
    cmd.color = color;
    commands_.push_back(cmd);
}

void DisplayList::fill_blurred_outline(const Outline& outline, const Offset& offset,
                                       const Color& color, float blur_radius, bool inverted) {
    if (outline.is_empty()) return;
    PaintCommand cmd;
    cmd.type = PaintCommand::FillBlurredOutline;
    // Gaussian tail is negligible past 3 sigma (= 1.5 * blur radius)
    cmd.bounds = outline.bounding_box().inflated(std::max(0.0f, blur_radius) * 1.5f);
    cmd.outline = outline;
    cmd.offset = offset;
    cmd.color = color;
    cmd.blur_radius = blur_radius;
    cmd.inverted = inverted;
    commands_.push_back(cmd);
}

void DisplayList::push_clip(const Rect& clip_rect) {
    PaintCommand cmd;
    cmd.type = PaintCommand::PushClip;
    cmd.bounds = clip_rect;
    commands_.push_back(cmd);
}

void DisplayList::push_outline_clip(const Outline& outline, ClipOp op) {
    PaintCommand cmd;
    cmd.type = PaintCommand::PushOutlineClip;
    cmd.bounds = outline.bounding_box();
    cmd.outline = outline;
    cmd.clip_op = op;
    commands_.push_back(cmd);
}

void DisplayList::pop_clip() {
    PaintCommand cmd;
    cmd.type = PaintCommand::PopClip;
    commands_.push_back(cmd);
}

std::size_t DisplayList::count(PaintCommand::Type type) const {
    return static_cast<std::size_t>(std::count_if(commands_.begin(), commands_.end(),
        [type](const PaintCommand& cmd) { return cmd.type == type; }));
}

} // namespace neumorph::paint
