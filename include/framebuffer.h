#ifndef FRAMEBUFFER_H
#define FRAMEBUFFER_H

#include <cstdint>
#include <algorithm>
#include <vector>

constexpr int8_t SHADE_EMPTY = -1;
constexpr double DEPTH_FAR   = 1e30;

enum class Layer : uint8_t { Empty, Floor, Wall, Sprite };

// One shaded pixel per terminal cell.
struct Framebuffer {
    int W = 0, H = 0;
    std::vector<int8_t>  shade;   // SHADE_EMPTY or 0..9
    std::vector<double>  depth;
    std::vector<Layer>   layer;
    std::vector<uint8_t> color;

    void resize(int w, int h) {
        W = std::max(0, w);
        H = std::max(0, h);
        const size_t n = size_t(W) * size_t(H);
        shade.assign(n, SHADE_EMPTY);
        depth.assign(n, DEPTH_FAR);
        layer.assign(n, Layer::Empty);
        color.assign(n, 0);
    }

    void clear() {
        std::fill(shade.begin(), shade.end(), SHADE_EMPTY);
        std::fill(depth.begin(), depth.end(), DEPTH_FAR);
        std::fill(layer.begin(), layer.end(), Layer::Empty);
        std::fill(color.begin(), color.end(), uint8_t(0));
    }

    size_t index(int x, int y) const { return size_t(y) * size_t(W) + size_t(x); }
};

inline void putPixel(Framebuffer& fb, int x, int y, int8_t s, Layer l, uint8_t c){
    if((unsigned)x < (unsigned)fb.W && (unsigned)y < (unsigned)fb.H){
        const size_t i = fb.index(x, y);
        fb.shade[i] = s;
        fb.layer[i] = l;
        fb.color[i] = c;
    }
}

// Terminal-ready output; ownership goes to the caller every frame.
struct CharGrid {
    int cols = 0, rows = 0;
    std::vector<char>    glyphs;
    std::vector<uint8_t> colors;

    CharGrid() = default;
    CharGrid(int c, int r) : cols(c), rows(r),
        glyphs(size_t(c) * size_t(r), ' '), colors(size_t(c) * size_t(r), 0) {}

    char glyph(int x, int y) const { return glyphs[size_t(y) * size_t(cols) + size_t(x)]; }
    void set(int x, int y, char g, uint8_t c = 0) {
        if((unsigned)x < (unsigned)cols && (unsigned)y < (unsigned)rows){
            glyphs[size_t(y) * size_t(cols) + size_t(x)] = g;
            colors[size_t(y) * size_t(cols) + size_t(x)] = c;
        }
    }
};

#endif // FRAMEBUFFER_H
