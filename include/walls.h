#pragma once
#include <vector>

#include "config.h"
#include "framebuffer.h"
#include "raycast.h"
#include "textures.h"
#include "world.h"

namespace Walls {
    // Vertical extent [top, bottom) of a slice, unclipped. z shifts the slice by
    // z * lineH rows (jumping lowers the world on screen).
    struct Span { int lineH = 0; int top = 0; int bottom = 0; };
    Span span(int rows, double perpDist, double projScale, double z);

    // Shades one column of fb from a hit and records its depth. Only column x of
    // fb and zbuffer is written.
    void drawColumn(Framebuffer& fb, std::vector<double>& zbuffer, int x,
                    const RayHit& hit, const GameMap& map, const TextureSet& textures,
                    bool texturesOn, double z, const RenderConfig& cfg);
}
