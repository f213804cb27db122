#pragma once
#include <neumorph/geometry/outline.h>

namespace neumorph::shadow {

enum class LightSource {
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight
};

// Displacements of the two shadow layers. |dark| is always -|light|.
struct OffsetPair {
    geometry::Offset light;
    geometry::Offset dark;

    bool is_zero() const { return light.is_zero() && dark.is_zero(); }
};

// Light shadow falls towards the light source, dark shadow away from it.
// Each axis is displaced by |elevation|; elevation <= 0 yields zero offsets.
OffsetPair resolve_offsets(LightSource light_source, float elevation);

} // namespace neumorph::shadow
