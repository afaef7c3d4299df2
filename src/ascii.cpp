#include "../include/ascii.h"
#include "../include/config.h"

#include <cassert>
#include <utility>

Palette::Palette(std::string glyphs) : g(std::move(glyphs)) {
    if (g.empty()) throw ConfigError("palette: no glyphs");
}

int Palette::indexFor(int intensity) const {
    assert(intensity >= 0 && intensity <= 9 && "intensity outside 0..9 reached the quantizer");
    const int n = (int)g.size();
    return (intensity * (n - 1) + 4) / 9;
}

char Palette::glyphFor(int intensity) const {
    return g[size_t(indexFor(intensity))];
}

CharGrid Ascii::quantize(const Framebuffer& fb, const Palette& palette) {
    CharGrid grid(fb.W, fb.H);
    for (int y = 0; y < fb.H; ++y)
        for (int x = 0; x < fb.W; ++x) {
            const size_t i = fb.index(x, y);
            const int s = fb.shade[i];
            if (s == SHADE_EMPTY) continue;
            grid.set(x, y, palette.glyphFor(s), fb.color[i]);
        }
    return grid;
}
