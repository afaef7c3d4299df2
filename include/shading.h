#pragma once
#include "config.h"

namespace Shading {
    // Distance level before the texel offset: max(minShade, nearShade - falloff * d).
    double level(double distance, const ShadeParams& p);

    // Texel 0..9 at a distance -> shade 0..9. Texel 6 is neutral; the signed
    // offset (base - 6) * textureGain is added to the distance level, then clipped.
    // Non-decreasing as distance shrinks.
    int shade(int base, double distance, const ShadeParams& p);

    // Same, plus p.sideShade for faces struck across a y grid line.
    int shadeFace(int base, double distance, int side, const ShadeParams& p);
}
