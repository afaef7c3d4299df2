#pragma once
#include <SDL.h>

// Per-frame input delta. Default-constructed = no input.
struct InputState {
    // Continuous axes
    float axisForward = 0.f; // W/S, Up/Down -> +1/-1
    float axisStrafe  = 0.f; // E/Q -> +1/-1
    float axisTurn    = 0.f; // D/A, Right/Left -> +1/-1

    // One-frame edges
    bool jumpPressed    = false;
    bool toggleTextures = false;
    bool toggleMinimap  = false;

    bool quitRequested  = false;
};

namespace Input {
    inline void beginFrame(InputState& s) {
        s.jumpPressed = s.toggleTextures = s.toggleMinimap = false;
        // axes are re-sampled, quit persists
    }

    void handleEvent(const SDL_Event& e, InputState& s);
    void gatherContinuous(InputState& s);
}
