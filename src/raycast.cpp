// raycast.cpp: DDA grid traversal, one ray per screen column.
#include "../include/raycast.h"
#include "../include/config.h"

#include <cmath>
#include <string>

static constexpr double kHalfPi = 1.5707963267948966;
static constexpr double kTiny   = 1e-12;
static constexpr double kHuge   = 1e30;

RayBasis Raycast::basis(const Player& player, double fovRad) {
    RayBasis b;
    const double planeLen = std::tan(fovRad / 2.0);
    b.dirX   = std::cos(player.dir);
    b.dirY   = std::sin(player.dir);
    b.planeX = std::cos(player.dir + kHalfPi) * planeLen;
    b.planeY = std::sin(player.dir + kHalfPi) * planeLen;
    return b;
}

RayHit Raycast::castRay(const GameMap& map, double px, double py, const RayBasis& b, double camX) {
    const double rayDirX = b.dirX + b.planeX * camX;
    const double rayDirY = b.dirY + b.planeY * camX;

    int mapX = (int)std::floor(px), mapY = (int)std::floor(py);

    // Axis-parallel rays never cross lines of that axis
    const double deltaX = (std::abs(rayDirX) < kTiny) ? kHuge : std::abs(1.0 / rayDirX);
    const double deltaY = (std::abs(rayDirY) < kTiny) ? kHuge : std::abs(1.0 / rayDirY);
    double sideX, sideY;
    int stepX, stepY, side = 0;

    if (rayDirX < 0) { stepX = -1; sideX = (px - mapX) * deltaX; }
    else             { stepX =  1; sideX = (mapX + 1.0 - px) * deltaX; }
    if (rayDirY < 0) { stepY = -1; sideY = (py - mapY) * deltaY; }
    else             { stepY =  1; sideY = (mapY + 1.0 - py) * deltaY; }

    // A straight line crosses at most W + H cell boundaries inside the grid.
    const int maxSteps = map.width() + map.height();
    int steps = 0;
    for (;;) {
        if (sideX < sideY) { sideX += deltaX; mapX += stepX; side = 0; }
        else               { sideY += deltaY; mapY += stepY; side = 1; }
        ++steps;

        if (!map.inBounds(mapX, mapY))
            throw ConfigError("raycast: ray escaped the map at cell (" + std::to_string(mapX) + ", "
                              + std::to_string(mapY) + "); the map is not enclosed");
        if (map.at(mapX, mapY).wall) break;
        if (steps >= maxSteps)
            throw ConfigError("raycast: no wall within " + std::to_string(maxSteps) + " steps");
    }

    RayHit h;
    h.mapX  = mapX;
    h.mapY  = mapY;
    h.side  = side;
    h.steps = steps;
    if (side == 0) h.face = (stepX > 0) ? Face::West  : Face::East;
    else           h.face = (stepY > 0) ? Face::North : Face::South;

    double perpDist = (side == 0 ? sideX - deltaX : sideY - deltaY);
    if (perpDist < NEAR_CLAMP) perpDist = NEAR_CLAMP;
    h.perpDist  = perpDist;
    h.rayLength = perpDist * std::sqrt(rayDirX * rayDirX + rayDirY * rayDirY);

    double wallX = (side == 0) ? py + perpDist * rayDirY : px + perpDist * rayDirX;
    wallX -= std::floor(wallX);

    const bool mirrored = (side == 0 && rayDirX < 0) || (side == 1 && rayDirY > 0);
    h.texU = mirrored ? 1.0 - wallX : wallX;
    if (h.texU >= 1.0) h.texU = std::nextafter(1.0, 0.0);
    return h;
}
