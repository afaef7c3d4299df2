#include "../include/camera.h"
#include <cmath>

static constexpr double kTwoPi = 6.283185307179586;

bool Camera::blockedAt(const GameMap& map, double x, double y, double rad) {
    if (map.isWallAt(x, y)) return true;
    return map.isWallAt(x + rad, y) || map.isWallAt(x - rad, y) ||
           map.isWallAt(x, y + rad) || map.isWallAt(x, y - rad);
}

void Camera::turn(Player& p, double axis, double turnSpeed, double dt) {
    p.dir += axis * turnSpeed * dt;
    p.dir = std::remainder(p.dir, kTwoPi);
}

// A player already inside the radius of a wall may still back off or slide along
// it: only the centre, the leading edge point, or a side point that was clear may block.
static bool axisClear(const GameMap& map, double x, double y, double nx, double ny,
                      int sx, int sy, double rad) {
    if (!Camera::blockedAt(map, nx, ny, rad)) return true;
    if (map.isWallAt(nx, ny)) return false;
    if (map.isWallAt(nx + sx * rad, ny + sy * rad)) return false;

    const int px = sy != 0 ? 1 : 0, py = sx != 0 ? 1 : 0;   // perpendicular
    for (int k = -1; k <= 1; k += 2) {
        const double ox = k * px * rad, oy = k * py * rad;
        if (map.isWallAt(nx + ox, ny + oy) && !map.isWallAt(x + ox, y + oy)) return false;
    }
    return true;
}

static inline int signOf(double v) { return (v > 0.0) - (v < 0.0); }

void Camera::tryMove(Player& p, double dx, double dy, const GameMap& map, double radius, double dt) {
    const double nx = p.x + dx, ny = p.y + dy;
    const double invDt = dt > 0.0 ? 1.0 / dt : 0.0;

    if (axisClear(map, p.x, p.y, nx, p.y, signOf(dx), 0, radius)) { p.x = nx; p.vx = dx * invDt; } else { p.vx = 0.0; }
    if (axisClear(map, p.x, p.y, p.x, ny, 0, signOf(dy), radius)) { p.y = ny; p.vy = dy * invDt; } else { p.vy = 0.0; }
}

void Camera::updateVertical(Player& p, bool jumpPressed, const RenderConfig& cfg, double dt) {
    if (p.grounded()) {
        p.z = 0.0; p.vz = 0.0;
        if (jumpPressed) {
            p.vz = cfg.jumpVelocity;
        } else {
            return;
        }
    }

    p.z  += p.vz * dt;
    p.vz -= cfg.gravity * dt;
    if (p.vz < cfg.maxFallSpeed) p.vz = cfg.maxFallSpeed;

    if (p.z <= 0.0) { p.z = 0.0; p.vz = 0.0; }
}

void Camera::applyInput(GameState& gs, const InputState& in, const GameMap& map,
                        const RenderConfig& cfg, double dt) {
    if (in.toggleTextures) gs.texturesOn  = !gs.texturesOn;
    if (in.toggleMinimap)  gs.showMinimap = !gs.showMinimap;

    Player& p = gs.player;
    turn(p, in.axisTurn, cfg.turnSpeed, dt);

    // Input vector (world space)
    const double fx = std::cos(p.dir),  fy = std::sin(p.dir);
    const double sx = -std::sin(p.dir), sy = std::cos(p.dir);
    double ix = fx * double(in.axisForward) + sx * double(in.axisStrafe);
    double iy = fy * double(in.axisForward) + sy * double(in.axisStrafe);
    const double ilen = std::hypot(ix, iy); if (ilen > 1.0) { ix /= ilen; iy /= ilen; }

    const double step = cfg.moveSpeed * dt;
    if (ix != 0.0 || iy != 0.0) tryMove(p, ix * step, iy * step, map, cfg.playerRadius, dt);
    else { p.vx = 0.0; p.vy = 0.0; }

    updateVertical(p, in.jumpPressed, cfg, dt);
}
