// renderer.cpp: one frame: input, floor, wall columns, sprites, glyphs, minimap.
// The column pass is the only parallel section; each worker owns a column range.

#include <algorithm>
#include <exception>
#include <string>
#include <thread>
#include <vector>

#include "../include/renderer.h"
#include "../include/camera.h"
#include "../include/raycast.h"
#include "../include/sprites.h"
#include "../include/ui.h"
#include "../include/walls.h"

static constexpr double kDegToRad = 0.017453292519943295;

// Used until the first resize when the config follows the terminal
static constexpr int FALLBACK_COLS = 80;
static constexpr int FALLBACK_ROWS = 24;

static const RenderConfig& checked(const RenderConfig& cfg) {
    validateConfig(cfg);
    return cfg;
}

Renderer::Renderer(const GameMap& m, const TextureSet& tex, const RenderConfig& config)
    : map(m), textures(tex), cfg(checked(config)), palette(config.palette),
      fovRad(config.fovDeg * kDegToRad) {
    map.validateEnclosed();
    if (!textures.walls.empty()) map.validateTextures((int)textures.walls.size());

    for (size_t i = 0; i < textures.walls.size(); ++i)
        Textures::validate(textures.walls[i], false, "wall texture " + std::to_string(i + 1));
    for (size_t i = 0; i < textures.sprites.size(); ++i)
        Textures::validate(textures.sprites[i], true, "sprite texture " + std::to_string(i));

    resize(cfg.cols > 0 ? cfg.cols : FALLBACK_COLS,
           cfg.rows > 0 ? cfg.rows : FALLBACK_ROWS);
}

void Renderer::resize(int cols, int rows) {
    W = std::max(1, cols);
    H = std::max(1, rows);
    fb.resize(W, H);
    zbuffer.assign(W, DEPTH_FAR);
}

CharGrid Renderer::frame(GameState& gs, const InputState& input, double dt) {
    Camera::applyInput(gs, input, map, cfg, dt);
    return render(gs);
}

CharGrid Renderer::render(GameState& gs) {
    // Nothing from the previous frame may occlude this one.
    fb.clear();
    std::fill(zbuffer.begin(), zbuffer.end(), DEPTH_FAR);

    const Player& player = gs.player;
    const RayBasis b = Raycast::basis(player, fovRad);
    const bool texturesOn = gs.texturesOn && !textures.walls.empty();

    drawFloor();
    castAllColumns(player, b, texturesOn);

    // Needs the complete depth buffer
    Sprites::draw(fb, zbuffer, gs.sprites, textures, player, b, fovRad, cfg);

    CharGrid grid = Ascii::quantize(fb, palette);
    if (gs.showMinimap) drawMinimap(grid, map, player, cfg);
    return grid;
}

void Renderer::drawFloor() {
    const int8_t floor = int8_t(cfg.shade.floorShade);
    for (int y = H / 2; y < H; ++y)
        for (int x = 0; x < W; x += 2)
            putPixel(fb, x, y, floor, Layer::Floor, 0);
}

void Renderer::castColumns(const Player& player, const RayBasis& b, bool texturesOn, int x0, int x1) {
    for (int x = x0; x < x1; ++x) {
        const RayHit hit = Raycast::castColumn(map, player, b, x, W);
        Walls::drawColumn(fb, zbuffer, x, hit, map, textures, texturesOn, player.z, cfg);
    }
}

namespace {
// Joins whatever was started, including on the way out of a failed spawn.
struct JoinAll {
    std::vector<std::thread>& threads;
    ~JoinAll() { for (auto& t : threads) if (t.joinable()) t.join(); }
};
}

void Renderer::castAllColumns(const Player& player, const RayBasis& b, bool texturesOn) {
    const int n = std::min(cfg.workerThreads, W);
    if (n <= 1) { castColumns(player, b, texturesOn, 0, W); return; }

    std::vector<std::exception_ptr> errors(static_cast<size_t>(n));
    {
        std::vector<std::thread> workers;
        JoinAll join{workers};
        workers.reserve(size_t(n));

        const int per = (W + n - 1) / n;
        for (int i = 0; i < n; ++i) {
            const int x0 = i * per;
            const int x1 = std::min(W, x0 + per);
            workers.emplace_back([this, &player, &b, &errors, texturesOn, i, x0, x1]() {
                try {
                    castColumns(player, b, texturesOn, x0, x1);
                } catch (...) {
                    errors[size_t(i)] = std::current_exception();
                }
            });
        }
    }

    // A failed column aborts the whole frame.
    for (const auto& e : errors)
        if (e) std::rethrow_exception(e);
}
