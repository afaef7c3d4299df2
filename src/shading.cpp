#include "../include/shading.h"
#include "../include/util.h"

#include <algorithm>
#include <cmath>

double Shading::level(double distance, const ShadeParams& p) {
    return std::max(p.minShade, p.nearShade - p.falloff * std::max(0.0, distance));
}

static int shadeWithBonus(int base, double distance, int bonus, const ShadeParams& p) {
    const double offset = p.textureGain * double(base - TEXEL_NEUTRAL);
    // Clip before rounding: lround is unspecified outside long.
    const double raw = std::max(-100.0, std::min(100.0, Shading::level(distance, p) + offset + bonus));
    return clampi(int(std::lround(raw)), 0, 9);
}

int Shading::shade(int base, double distance, const ShadeParams& p) {
    return shadeWithBonus(base, distance, 0, p);
}

int Shading::shadeFace(int base, double distance, int side, const ShadeParams& p) {
    return shadeWithBonus(base, distance, side == 1 ? p.sideShade : 0, p);
}
