#pragma once
#include <vector>

#include "ascii.h"
#include "config.h"
#include "framebuffer.h"
#include "input.h"
#include "raycast.h"
#include "textures.h"
#include "types.h"
#include "world.h"

// Frame compositor. Holds the session's read-only map/textures/config and the
// frame-scoped buffers; GameState comes in by reference every tick.
class Renderer {
public:
    // Validates cfg, palette, map enclosure and texture references (ConfigError).
    // The map and textures are referenced, not copied: they must outlive the Renderer.
    Renderer(const GameMap& m, const TextureSet& tex, const RenderConfig& config);
    Renderer(GameMap&&, const TextureSet&, const RenderConfig&) = delete;
    Renderer(const GameMap&, TextureSet&&, const RenderConfig&) = delete;

    void resize(int cols, int rows);
    int cols() const { return W; }
    int rows() const { return H; }

    // Input delta -> player, then render.
    CharGrid frame(GameState& gs, const InputState& input, double dt);

    // Buffers reset, columns, sprites, quantize, minimap.
    CharGrid render(GameState& gs);

    // Last frame's buffers (tests, debugging)
    const Framebuffer&         framebuffer() const { return fb; }
    const std::vector<double>& depthBuffer() const { return zbuffer; }

private:
    void drawFloor();
    void castColumns(const Player& player, const RayBasis& b, bool texturesOn, int x0, int x1);
    void castAllColumns(const Player& player, const RayBasis& b, bool texturesOn);

private:
    const GameMap&    map;
    const TextureSet& textures;
    RenderConfig      cfg;
    Palette           palette;
    double            fovRad = 0.0;

    int W = 1, H = 1;
    Framebuffer         fb;
    std::vector<double> zbuffer;
};
