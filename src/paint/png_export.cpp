#include <neumorph/paint/png_export.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace neumorph::paint {

bool save_png(const SoftwareRenderer& renderer, const std::string& filename) {
    if (renderer.width() <= 0 || renderer.height() <= 0) return false;
    return stbi_write_png(filename.c_str(), renderer.width(), renderer.height(), 4,
                          renderer.pixels().data(), renderer.width() * 4) != 0;
}

} // namespace neumorph::paint
