#ifndef UI_H
#define UI_H

#include "config.h"
#include "framebuffer.h"
#include "types.h"
#include "world.h"

// Top-down window around the player, anchored to the bottom-right corner.
// '#' wall, ' ' open, '@' player. Skipped if it does not fit.
void drawMinimap(CharGrid& grid, const GameMap& map, const Player& p, const RenderConfig& cfg);

#endif // UI_H
