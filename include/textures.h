#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Texel domain is 0..9; sprites may also use TEXEL_CLEAR.
constexpr uint8_t TEXEL_MAX   = 9;
constexpr uint8_t TEXEL_CLEAR = 0xFF;

// ANSI color tags (0 = terminal default)
enum : uint8_t {
    COLOR_DEFAULT = 0,
    COLOR_BLACK, COLOR_RED, COLOR_GREEN, COLOR_YELLOW,
    COLOR_BLUE,  COLOR_MAGENTA, COLOR_CYAN, COLOR_WHITE
};

struct Texture {
    int w = 0, h = 0;
    std::vector<uint8_t> texels;   // row-major, h rows of w
    uint8_t color = COLOR_DEFAULT;

    uint8_t at(int tx, int ty) const { return texels[size_t(ty) * size_t(w) + size_t(tx)]; }
};

struct TextureSet {
    std::vector<Texture> walls;     // indexed by Cell::texture
    std::vector<Texture> sprites;   // indexed by Sprite::texture
};

// Color tag by name ("red", "cyan", ...); throws ConfigError for unknown names.
uint8_t colorByName(const std::string& name);

namespace Textures {
    // Rows of digits. Sprites: ' ' and '.' are clear, short rows padded clear.
    // An optional first line "color <name>" sets the color tag.
    Texture fromRows(const std::vector<std::string>& rows, bool sprite);

    Texture loadText(const std::string& path, bool sprite);

    // PNG (or anything SDL_image decodes): luminance -> 0..9,
    // alpha < 128 -> clear for sprites. Requires IMG_Init by the caller.
    Texture loadImage(const std::string& path, bool sprite);

    Texture solid(int w, int h, uint8_t value);

    // Rectangular, non-empty, texels in domain.
    void validate(const Texture& t, bool sprite, const std::string& what);
}
