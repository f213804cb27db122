#pragma once
#include <neumorph/paint/software_renderer.h>
#include <string>

namespace neumorph::paint {

// Save the renderer's RGBA buffer as PNG (uses stb_image_write)
bool save_png(const SoftwareRenderer& renderer, const std::string& filename);

} // namespace neumorph::paint
