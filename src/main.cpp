#include <SDL.h>
#include <SDL_image.h>
#include <algorithm>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "../include/assets.h"
#include "../include/config.h"
#include "../include/display.h"
#include "../include/input.h"
#include "../include/renderer.h"
#include "../include/types.h"

// Small window: SDL only delivers keyboard state to a focused window.
static constexpr int FOCUS_W = 320;
static constexpr int FOCUS_H = 80;

static int run(const std::string& assetDir, const std::string& configPath, SDL_Window* window) {
    RenderConfig cfg;
    if (!configPath.empty()) loadConfigFile(configPath, cfg);
    validateConfig(cfg);

    Assets assets = AssetLoader::loadDirectory(assetDir);
    std::cerr << "Loaded " << assetDir << ": map " << assets.map.width() << "x" << assets.map.height()
              << ", " << assets.textures.walls.size() << " wall textures, "
              << assets.textures.sprites.size() << " sprite textures, "
              << assets.start.sprites.size() << " sprites\n";

    GameState state = assets.start;
    state.texturesOn  = cfg.texturesOn;
    state.showMinimap = cfg.showMinimap;

    Renderer renderer(assets.map, assets.textures, cfg);

    // Follow the terminal unless the config pins a resolution.
    auto onResize = [&]() {
        int tc = 0, tr = 0;
        TerminalDisplay::querySize(tc, tr);
        const int c = cfg.cols > 0 ? cfg.cols : std::max(1, tc - 1);  // last column would wrap
        const int r = cfg.rows > 0 ? cfg.rows : tr;
        if (c != renderer.cols() || r != renderer.rows()) renderer.resize(c, r);
    };

    SDL_RaiseWindow(window);

    auto display = std::make_unique<TerminalDisplay>();
    InputState input;

    const double frameSec = 1.0 / double(cfg.targetFps);
    uint64_t last = SDL_GetPerformanceCounter();
    const double freq = (double)SDL_GetPerformanceFrequency();

    while (!input.quitRequested) {
        onResize();

        uint64_t now = SDL_GetPerformanceCounter();
        double dt = double(now - last) / freq; last = now;
        if (dt > 0.05) dt = 0.05;

        // --- Input ---
        Input::beginFrame(input);
        SDL_Event e;
        while (SDL_PollEvent(&e)) Input::handleEvent(e, input);
        Input::gatherContinuous(input);
        if (input.quitRequested) break;

        // --- Frame ---
        const CharGrid grid = renderer.frame(state, input, dt);
        if (!display->present(grid)) {
            display.reset();
            std::cerr << "Writing to the terminal failed\n";
            return 1;
        }

        const double spent = double(SDL_GetPerformanceCounter() - now) / freq;
        if (spent < frameSec) SDL_Delay(Uint32((frameSec - spent) * 1000.0));
    }
    return 0;
}

int main(int argc, char** argv) {
    const std::string assetDir   = argc > 1 ? argv[1] : "assets";
    const std::string configPath = argc > 2 ? argv[2] : "";

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n"; return 1;
    }

    // PNG textures
    const int want = IMG_INIT_PNG;
    const int got  = IMG_Init(want);
    if ((got & want) != want) {
        std::cerr << "IMG_Init PNG failed: " << IMG_GetError() << "\n";
        SDL_Quit();
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow(
        "termcaster input (keep focused)",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        FOCUS_W, FOCUS_H, SDL_WINDOW_SHOWN);
    if (!window) { std::cerr << "CreateWindow failed: " << SDL_GetError() << "\n"; IMG_Quit(); SDL_Quit(); return 1; }

    int code = 1;
    try {
        code = run(assetDir, configPath, window);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
    }

    SDL_DestroyWindow(window);
    IMG_Quit();
    SDL_Quit();
    return code;
}
