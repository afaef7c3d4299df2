// config.cpp
#include "../include/config.h"

#include <cctype>
#include <cmath>
#include <fstream>
#include <string>

// --------------------- helpers ------------------------
static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

static double toDouble(const std::string& key, const std::string& v) {
    size_t used = 0;
    double d = 0.0;
    try { d = std::stod(v, &used); }
    catch (const std::exception&) { used = 0; }
    if (used == 0 || used != v.size() || !std::isfinite(d))
        throw ConfigError("config: '" + key + "' expects a number, got '" + v + "'");
    return d;
}

static int toInt(const std::string& key, const std::string& v) {
    size_t used = 0;
    int i = 0;
    try { i = std::stoi(v, &used); }
    catch (const std::exception&) { used = 0; }
    if (used == 0 || used != v.size())
        throw ConfigError("config: '" + key + "' expects an integer, got '" + v + "'");
    return i;
}

static bool toBool(const std::string& key, const std::string& v) {
    if (v == "1" || v == "true"  || v == "on"  || v == "yes") return true;
    if (v == "0" || v == "false" || v == "off" || v == "no")  return false;
    throw ConfigError("config: '" + key + "' expects on/off, got '" + v + "'");
}

// Shading inputs beyond this cannot change a 0..9 result, only overflow it
static bool inShadeRange(double v) {
    return std::isfinite(v) && std::abs(v) <= 100.0;
}

// ---------------------- API ---------------------------
void applyConfigOption(RenderConfig& cfg, const std::string& key, const std::string& value) {
    const std::string& k = key;
    const std::string& v = value;

    if      (k == "cols")             cfg.cols = toInt(k, v);
    else if (k == "rows")             cfg.rows = toInt(k, v);
    else if (k == "fov")              cfg.fovDeg = toDouble(k, v);
    else if (k == "proj_scale")       cfg.projScale = toDouble(k, v);
    else if (k == "palette") {
        // Quotes let the palette start with a space.
        std::string p = v;
        if (p.size() >= 2 && p.front() == '"' && p.back() == '"') p = p.substr(1, p.size() - 2);
        cfg.palette = p;
    }
    else if (k == "near_shade")       cfg.shade.nearShade = toDouble(k, v);
    else if (k == "falloff")          cfg.shade.falloff = toDouble(k, v);
    else if (k == "min_shade")        cfg.shade.minShade = toDouble(k, v);
    else if (k == "side_shade")       cfg.shade.sideShade = toInt(k, v);
    else if (k == "texture_gain")     cfg.shade.textureGain = toDouble(k, v);
    else if (k == "floor_shade")      cfg.shade.floorShade = toInt(k, v);
    else if (k == "textures")         cfg.texturesOn = toBool(k, v);
    else if (k == "minimap")          cfg.showMinimap = toBool(k, v);
    else if (k == "minimap_width")    cfg.minimapW = toDouble(k, v);
    else if (k == "minimap_height")   cfg.minimapH = toDouble(k, v);
    else if (k == "minimap_offset_x") cfg.minimapOffX = toInt(k, v);
    else if (k == "minimap_offset_y") cfg.minimapOffY = toInt(k, v);
    else if (k == "jump_velocity")    cfg.jumpVelocity = toDouble(k, v);
    else if (k == "gravity")          cfg.gravity = toDouble(k, v);
    else if (k == "max_fall_speed")   cfg.maxFallSpeed = toDouble(k, v);
    else if (k == "move_speed")       cfg.moveSpeed = toDouble(k, v);
    else if (k == "turn_speed")       cfg.turnSpeed = toDouble(k, v);
    else if (k == "player_radius")    cfg.playerRadius = toDouble(k, v);
    else if (k == "sprite_width")     cfg.spriteWidth = toDouble(k, v);
    else if (k == "sprite_far_clip")  cfg.spriteFarClip = toDouble(k, v);
    else if (k == "threads")          cfg.workerThreads = toInt(k, v);
    else if (k == "fps")              cfg.targetFps = toInt(k, v);
    else throw ConfigError("config: unknown option '" + k + "'");
}

void loadConfigFile(const std::string& path, RenderConfig& cfg) {
    std::ifstream in(path);
    if (!in) throw ConfigError("config: cannot open '" + path + "'");

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        // '#' starts a comment unless it is inside a quoted palette
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') quoted = !quoted;
            if (line[i] == '#' && !quoted) { line.resize(i); break; }
        }
        if (trim(line).empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos)
            throw ConfigError(path + ":" + std::to_string(lineNo) + ": expected 'key = value'");

        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));
        try {
            applyConfigOption(cfg, key, value);
        } catch (const ConfigError& e) {
            throw ConfigError(path + ":" + std::to_string(lineNo) + ": " + e.what());
        }
    }
}

void validateConfig(const RenderConfig& cfg) {
    if (cfg.cols < 0 || cfg.rows < 0)
        throw ConfigError("config: resolution must not be negative");
    if (!(cfg.fovDeg > 0.0 && cfg.fovDeg < 180.0))
        throw ConfigError("config: fov must be in (0, 180) degrees");
    if (!(cfg.projScale > 0.0))
        throw ConfigError("config: proj_scale must be positive");
    if (cfg.palette.empty())
        throw ConfigError("config: glyph palette is empty");

    const ShadeParams& s = cfg.shade;
    if (!inShadeRange(s.nearShade) || !inShadeRange(s.minShade))
        throw ConfigError("config: near_shade and min_shade must be within [-100, 100]");
    if (!inShadeRange(s.textureGain))
        throw ConfigError("config: texture_gain must be within [-100, 100]");
    if (!inShadeRange(s.falloff) || s.falloff < 0.0)
        throw ConfigError("config: falloff must be within [0, 100]");
    if (s.sideShade < -9 || s.sideShade > 9)
        throw ConfigError("config: side_shade must be in [-9, 9]");
    if (s.floorShade < 0 || s.floorShade > 9)
        throw ConfigError("config: floor_shade must be in [0, 9]");

    if (cfg.moveSpeed < 0.0 || cfg.turnSpeed < 0.0)
        throw ConfigError("config: move/turn speed must not be negative");
    if (cfg.gravity < 0.0 || cfg.jumpVelocity < 0.0 || cfg.maxFallSpeed > 0.0)
        throw ConfigError("config: jump_velocity/gravity must not be negative, max_fall_speed not positive");
    if (!(cfg.playerRadius >= 0.0 && cfg.playerRadius < 0.5))
        throw ConfigError("config: player_radius must be in [0, 0.5)");
    if (!(cfg.spriteWidth > 0.0) || !(cfg.spriteFarClip > 0.0))
        throw ConfigError("config: sprite_width and sprite_far_clip must be positive");
    if (cfg.minimapW < 0.0 || cfg.minimapW > 1.0 || cfg.minimapH < 0.0 || cfg.minimapH > 1.0)
        throw ConfigError("config: minimap size is a fraction in [0, 1]");
    if (cfg.minimapOffX < 0 || cfg.minimapOffY < 0)
        throw ConfigError("config: minimap offsets must not be negative");
    if (cfg.workerThreads < 1)
        throw ConfigError("config: threads must be at least 1");
    if (cfg.targetFps < 1)
        throw ConfigError("config: fps must be at least 1");
}
