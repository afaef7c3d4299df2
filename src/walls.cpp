#include "../include/walls.h"
#include "../include/shading.h"

#include <algorithm>

Walls::Span Walls::span(int rows, double perpDist, double projScale, double z) {
    Span s;
    s.lineH  = int((rows * projScale) / perpDist);
    s.top    = int((rows - s.lineH) / 2.0 + z * s.lineH);
    s.bottom = int((rows + s.lineH) / 2.0 + z * s.lineH);
    return s;
}

void Walls::drawColumn(Framebuffer& fb, std::vector<double>& zbuffer, int x,
                       const RayHit& hit, const GameMap& map, const TextureSet& textures,
                       bool texturesOn, double z, const RenderConfig& cfg) {
    const int rows = fb.H;

    // Every row of the column is behind this wall's distance.
    zbuffer[x] = hit.perpDist;
    for (int y = 0; y < rows; ++y) fb.depth[fb.index(x, y)] = hit.perpDist;

    const Span s = span(rows, hit.perpDist, cfg.projScale, z);
    if (s.lineH <= 0) return;

    const int drawTop = std::max(0, s.top);
    const int drawBot = std::min(rows, s.bottom);
    if (drawTop >= drawBot) return;

    const Cell& cell = map.at(hit.mapX, hit.mapY);
    const Texture* tex = nullptr;
    if (texturesOn && cell.texture >= 0 && cell.texture < (int)textures.walls.size())
        tex = &textures.walls[cell.texture];

    const uint8_t color = tex ? tex->color : uint8_t(0);

    // Untextured: neutral texel, distance and face only
    if (!tex) {
        const int8_t sh = int8_t(Shading::shadeFace(TEXEL_NEUTRAL, hit.perpDist, hit.side, cfg.shade));
        for (int y = drawTop; y < drawBot; ++y) putPixel(fb, x, y, sh, Layer::Wall, color);
        return;
    }

    int texX = int(hit.texU * tex->w);
    texX = std::min(std::max(texX, 0), tex->w - 1);

    const double texStep = double(tex->h) / double(s.lineH);
    for (int y = drawTop; y < drawBot; ++y) {
        int texY = int((y - s.top) * texStep);
        texY = std::min(std::max(texY, 0), tex->h - 1);
        const int base = tex->at(texX, texY);
        const int8_t sh = int8_t(Shading::shadeFace(base, hit.perpDist, hit.side, cfg.shade));
        putPixel(fb, x, y, sh, Layer::Wall, color);
    }
}
