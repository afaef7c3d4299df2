#pragma once
#include "types.h"
#include "world.h"

// Face of the struck cell
enum class Face { West, East, North, South };

struct RayHit {
    int    mapX = 0, mapY = 0;
    int    side = 0;          // 0: crossed an x grid line, 1: a y grid line
    Face   face = Face::West;
    double perpDist  = 0.0;   // along the view axis (no fish-eye)
    double rayLength = 0.0;   // Euclidean, for reference only
    double texU = 0.0;        // 0..1 across the face, viewer's left to right
    int    steps = 0;
};

// Camera basis for one frame: unit view direction and the camera plane,
// |plane| = tan(fov / 2).
struct RayBasis {
    double dirX = 1.0, dirY = 0.0;
    double planeX = 0.0, planeY = 0.66;
};

namespace Raycast {
    RayBasis basis(const Player& player, double fovRad);

    // Column -> camera-plane offset in [-1, 1); column cols/2 is the centre ray.
    inline double cameraX(int column, int cols) {
        return (double(column) - cols * 0.5) / (cols * 0.5);
    }

    // DDA from (px, py) along dir + plane * camX. Throws ConfigError when the ray
    // leaves the map or exceeds width + height steps.
    RayHit castRay(const GameMap& map, double px, double py, const RayBasis& b, double camX);

    inline RayHit castColumn(const GameMap& map, const Player& player, const RayBasis& b,
                             int column, int cols) {
        return castRay(map, player.x, player.y, b, cameraX(column, cols));
    }
}
