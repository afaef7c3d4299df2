#pragma once
#include "config.h"
#include "input.h"
#include "types.h"
#include "world.h"

namespace Camera {
    // Turn, move (with wall slide), jump/gravity, and session toggles for one frame.
    void applyInput(GameState& gs, const InputState& in, const GameMap& map,
                    const RenderConfig& cfg, double dt);

    void turn(Player& p, double axis, double turnSpeed, double dt);

    // Moves by (dx, dy), each axis committed only if it does not push the player
    // (radius) further into a wall; a blocked axis keeps its coordinate and zeroes
    // its velocity.
    void tryMove(Player& p, double dx, double dy, const GameMap& map, double radius, double dt);

    // Jump edge + gravity integration; z is clamped to the ground at 0.
    void updateVertical(Player& p, bool jumpPressed, const RenderConfig& cfg, double dt);

    // Any wall within rad of (x, y) along the axes, or under it.
    bool blockedAt(const GameMap& map, double x, double y, double rad);
}
