#include <neumorph/shadow/light_source.h>
#include <cmath>

namespace neumorph::shadow {

OffsetPair resolve_offsets(LightSource light_source, float elevation) {
    OffsetPair pair;
    if (!std::isfinite(elevation) || elevation <= 0) return pair;

    float sx = -1.0f, sy = -1.0f;
    switch (light_source) {
        case LightSource::TopLeft:     sx = -1.0f; sy = -1.0f; break;
        case LightSource::TopRight:    sx =  1.0f; sy = -1.0f; break;
        case LightSource::BottomLeft:  sx = -1.0f; sy =  1.0f; break;
        case LightSource::BottomRight: sx =  1.0f; sy =  1.0f; break;
    }
    pair.light = {sx * elevation, sy * elevation};
    pair.dark = -pair.light;
    return pair;
}

} // namespace neumorph::shadow
