#include "../include/textures.h"
#include "../include/config.h"
#include "../include/util.h"

#include <SDL.h>
#include <SDL_image.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

static const char* const COLOR_NAMES[] = {
    "default", "black", "red", "green", "yellow", "blue", "magenta", "cyan", "white"
};

uint8_t colorByName(const std::string& name) {
    for (uint8_t i = 0; i < 9; ++i)
        if (name == COLOR_NAMES[i]) return i;
    throw ConfigError("texture: unknown color '" + name + "'");
}

static inline bool isClearChar(char ch) { return ch == ' ' || ch == '.'; }

Texture Textures::fromRows(const std::vector<std::string>& rowsIn, bool sprite) {
    Texture t;
    size_t first = 0;

    // optional "color <name>" header
    if (!rowsIn.empty() && rowsIn[0].compare(0, 6, "color ") == 0) {
        std::istringstream ss(rowsIn[0].substr(6));
        std::string name; ss >> name;
        t.color = colorByName(name);
        first = 1;
    }

    std::vector<std::string> rows(rowsIn.begin() + first, rowsIn.end());
    while (!rows.empty() && rows.back().empty()) rows.pop_back();
    if (rows.empty()) throw ConfigError("texture: no texel rows");

    size_t w = 0;
    for (const auto& r : rows) w = std::max(w, r.size());
    if (w == 0) throw ConfigError("texture: zero width");

    t.w = (int)w;
    t.h = (int)rows.size();
    t.texels.assign(w * rows.size(), TEXEL_CLEAR);

    for (int y = 0; y < t.h; ++y) {
        const std::string& r = rows[y];
        if (!sprite && r.size() != w)
            throw ConfigError("texture: row " + std::to_string(y) + " has " + std::to_string(r.size())
                              + " texels, expected " + std::to_string(w));
        for (int x = 0; x < (int)r.size(); ++x) {
            const char ch = r[x];
            if (ch >= '0' && ch <= '9') {
                t.texels[size_t(y) * w + size_t(x)] = uint8_t(ch - '0');
            } else if (sprite && isClearChar(ch)) {
                // stays clear
            } else {
                throw ConfigError("texture: bad texel '" + std::string(1, ch) + "' at row "
                                  + std::to_string(y) + ", column " + std::to_string(x));
            }
        }
    }
    return t;
}

Texture Textures::loadText(const std::string& path, bool sprite) {
    std::ifstream in(path);
    if (!in) throw ConfigError("texture: cannot open '" + path + "'");

    std::vector<std::string> rows;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        rows.push_back(line);
    }
    try {
        return fromRows(rows, sprite);
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

Texture Textures::loadImage(const std::string& path, bool sprite) {
    SDL_Surface* s = IMG_Load(path.c_str());
    if (!s) throw ConfigError("texture: IMG_Load failed (" + path + "): " + IMG_GetError());

    SDL_Surface* argb = SDL_ConvertSurfaceFormat(s, SDL_PIXELFORMAT_ARGB8888, 0);
    SDL_FreeSurface(s);
    if (!argb) throw ConfigError("texture: convert failed (" + path + "): " + SDL_GetError());

    Texture t;
    t.w = argb->w;
    t.h = argb->h;
    t.texels.assign(size_t(t.w) * size_t(t.h), TEXEL_CLEAR);

    if (SDL_LockSurface(argb) != 0) {
        const std::string err = SDL_GetError();
        SDL_FreeSurface(argb);
        throw ConfigError("texture: lock failed (" + path + "): " + err);
    }
    const int pitchPixels = argb->pitch / 4;
    const uint32_t* px = static_cast<const uint32_t*>(argb->pixels);
    for (int y = 0; y < t.h; ++y)
        for (int x = 0; x < t.w; ++x) {
            const uint32_t c = px[size_t(y) * size_t(pitchPixels) + size_t(x)];
            if (sprite && alphaOf(c) < 128) continue;
            const int v = (int)std::lround(luminance(c) * TEXEL_MAX);
            t.texels[size_t(y) * size_t(t.w) + size_t(x)] = uint8_t(clampi(v, 0, TEXEL_MAX));
        }
    SDL_UnlockSurface(argb);
    SDL_FreeSurface(argb);

    if (t.w <= 0 || t.h <= 0) throw ConfigError("texture: empty image '" + path + "'");
    return t;
}

Texture Textures::solid(int w, int h, uint8_t value) {
    Texture t;
    t.w = w; t.h = h;
    t.texels.assign(size_t(w) * size_t(h), value);
    return t;
}

void Textures::validate(const Texture& t, bool sprite, const std::string& what) {
    if (t.w <= 0 || t.h <= 0)
        throw ConfigError(what + ": empty texture");
    if (t.texels.size() != size_t(t.w) * size_t(t.h))
        throw ConfigError(what + ": texel array is " + std::to_string(t.texels.size())
                          + ", expected " + std::to_string(t.w) + "x" + std::to_string(t.h));
    for (uint8_t v : t.texels) {
        if (v <= TEXEL_MAX) continue;
        if (sprite && v == TEXEL_CLEAR) continue;
        throw ConfigError(what + ": texel " + std::to_string(v) + " outside 0..9");
    }
}
