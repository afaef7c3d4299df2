#pragma once
#include <cstdint>
#include <vector>

// ---------------- Player / camera ----------------
struct Player {
    double x = 5.0, y = 5.0, dir = 0.0;
    double vx = 0.0, vy = 0.0;   // last committed horizontal move (cells / s)
    double z = 0.0, vz = 0.0;    // jump offset and vertical velocity

    bool grounded() const { return z <= 0.0 && vz <= 0.0; }
};

// ---------------- Billboard sprite ----------------
struct Sprite {
    double x = 0.0, y = 0.0;
    int    texture = 0;

    // Per-frame projection, rewritten by the sprite pass
    double dist2   = 0.0;   // squared distance to camera (sort key)
    double depth   = 0.0;   // distance along the view axis
    int    screenX = 0;
    int    width = 0, height = 0;
    bool   visible = false;
};

// ---------------- Session state ----------------
// Owned by the caller, handed to Renderer::frame by reference every tick.
struct GameState {
    Player player;
    std::vector<Sprite> sprites;
    bool texturesOn  = true;
    bool showMinimap = true;
};
