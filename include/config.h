#ifndef CONFIG_H
#define CONFIG_H

#include <stdexcept>
#include <string>

// ---------------- Output / view ----------------
// 0 = follow the terminal size
constexpr int    SCREEN_COLS = 0;
constexpr int    SCREEN_ROWS = 0;

constexpr double FOV_DEG    = 66.0;
constexpr double PROJ_SCALE = 1.0;   // wall/sprite vertical scale

// Dark -> bright
constexpr const char* PALETTE_DEFAULT = " .,:;+*LC8@";

// ---------------- Shading ----------------
// level(d) = max(MIN_SHADE, NEAR_SHADE - FALLOFF * d), then + (texel - 6)
constexpr double NEAR_SHADE   = 9.0;
constexpr double FALLOFF      = 0.75;
constexpr double MIN_SHADE    = 1.0;
constexpr int    SIDE_SHADE   = 1;     // north/south faces a touch brighter
constexpr double TEXTURE_GAIN = 1.0;
constexpr int    FLOOR_SHADE  = 1;

constexpr int    TEXEL_NEUTRAL = 6;

// ---------------- Player ----------------
constexpr double MOVE_SPEED     = 5.0;   // cells / s
constexpr double TURN_SPEED     = 3.0;   // rad / s
constexpr double PLAYER_RADIUS  = 0.2;

constexpr double JUMP_VELOCITY  = 1.6;
constexpr double GRAVITY_ACC    = 6.0;
constexpr double MAX_FALL_SPEED = -4.0;

// ---------------- Sprites ----------------
constexpr double SPRITE_WIDTH    = 1.0;  // world units
constexpr double SPRITE_FAR_CLIP = 64.0;

// ---------------- Minimap ----------------
constexpr double MINIMAP_W   = 0.2;   // fraction of cols
constexpr double MINIMAP_H   = 0.3;   // fraction of rows
constexpr int    MINIMAP_OFF = 5;

// ---------------- Loop ----------------
constexpr int    WORKER_THREADS = 1;
constexpr int    TARGET_FPS     = 60;

// Near clip shared by walls and sprites
constexpr double NEAR_CLAMP = 0.035;

// Load-time configuration failure; nothing is rendered after one.
struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ShadeParams {
    double nearShade   = NEAR_SHADE;
    double falloff     = FALLOFF;
    double minShade    = MIN_SHADE;
    int    sideShade   = SIDE_SHADE;
    double textureGain = TEXTURE_GAIN;
    int    floorShade  = FLOOR_SHADE;
};

struct RenderConfig {
    int    cols = SCREEN_COLS;
    int    rows = SCREEN_ROWS;
    double fovDeg    = FOV_DEG;
    double projScale = PROJ_SCALE;
    std::string palette = PALETTE_DEFAULT;
    ShadeParams shade;

    bool   texturesOn  = true;
    bool   showMinimap = true;
    double minimapW    = MINIMAP_W;
    double minimapH    = MINIMAP_H;
    int    minimapOffX = MINIMAP_OFF;
    int    minimapOffY = MINIMAP_OFF;

    double jumpVelocity = JUMP_VELOCITY;
    double gravity      = GRAVITY_ACC;
    double maxFallSpeed = MAX_FALL_SPEED;
    double moveSpeed    = MOVE_SPEED;
    double turnSpeed    = TURN_SPEED;
    double playerRadius = PLAYER_RADIUS;

    double spriteWidth   = SPRITE_WIDTH;
    double spriteFarClip = SPRITE_FAR_CLIP;

    int    workerThreads = WORKER_THREADS;
    int    targetFps     = TARGET_FPS;
};

// Applies one `key = value` option; throws ConfigError on unknown key / bad value.
void applyConfigOption(RenderConfig& cfg, const std::string& key, const std::string& value);

// Reads `key = value` lines ('#' comments) on top of cfg.
void loadConfigFile(const std::string& path, RenderConfig& cfg);

// Range checks. cols/rows of 0 are allowed (resolved from the terminal later).
void validateConfig(const RenderConfig& cfg);

#endif // CONFIG_H
