#include "../include/ui.h"

#include <cmath>

static inline int roundOdd(double v) {
    int n = (int)std::lround(v);
    if (n % 2 == 0) ++n;
    return n;
}

void drawMinimap(CharGrid& grid, const GameMap& map, const Player& p, const RenderConfig& cfg) {
    const int mmW = roundOdd(cfg.minimapW * grid.cols);
    const int mmH = roundOdd(cfg.minimapH * grid.rows);

    const int x0 = grid.cols - cfg.minimapOffX - mmW;
    const int y0 = grid.rows - cfg.minimapOffY - mmH;
    if (x0 < 0 || y0 < 0) return;

    const int pcx = (int)std::floor(p.x);
    const int pcy = (int)std::floor(p.y);

    for (int yy = 0; yy < mmH; ++yy)
        for (int xx = 0; xx < mmW; ++xx) {
            const int mx = pcx - mmW / 2 + xx;
            const int my = pcy - mmH / 2 + yy;
            const char g = (map.inBounds(mx, my) && map.at(mx, my).wall) ? '#' : ' ';
            grid.set(x0 + xx, y0 + yy, g);
        }

    grid.set(x0 + mmW / 2, y0 + mmH / 2, '@');
}
