#include "../include/input.h"
#include <algorithm>

static inline float clampAxis(float v) { return std::max(-1.f, std::min(1.f, v)); }

void Input::handleEvent(const SDL_Event& e, InputState& s) {
    switch (e.type) {
        case SDL_QUIT: s.quitRequested = true; break;

        case SDL_KEYDOWN: {
            if (e.key.repeat) break;
            const SDL_Keycode k = e.key.keysym.sym;
            if (k == SDLK_ESCAPE) s.quitRequested  = true;
            if (k == SDLK_SPACE)  s.jumpPressed    = true;
            if (k == SDLK_t)      s.toggleTextures = true;
            if (k == SDLK_m)      s.toggleMinimap  = true;
        } break;

        default: break;
    }
}

void Input::gatherContinuous(InputState& s) {
    const Uint8* ks = SDL_GetKeyboardState(nullptr);
    float forward = 0.f, strafe = 0.f, turn = 0.f;
    if (ks[SDL_SCANCODE_W] || ks[SDL_SCANCODE_UP])    forward += 1.f;
    if (ks[SDL_SCANCODE_S] || ks[SDL_SCANCODE_DOWN])  forward -= 1.f;
    if (ks[SDL_SCANCODE_E])                           strafe  += 1.f;
    if (ks[SDL_SCANCODE_Q])                           strafe  -= 1.f;
    if (ks[SDL_SCANCODE_D] || ks[SDL_SCANCODE_RIGHT]) turn    += 1.f;
    if (ks[SDL_SCANCODE_A] || ks[SDL_SCANCODE_LEFT])  turn    -= 1.f;

    s.axisForward = clampAxis(forward);
    s.axisStrafe  = clampAxis(strafe);
    s.axisTurn    = clampAxis(turn);
}
