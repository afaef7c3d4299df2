#pragma once
#include <vector>

#include "config.h"
#include "framebuffer.h"
#include "raycast.h"
#include "textures.h"
#include "types.h"

namespace Sprites {
    // Fills the per-frame projection fields of s (visible == false when it is
    // behind the camera plane, beyond the far clip, or projects to nothing).
    void project(Sprite& s, const Player& player, const RayBasis& b,
                 int cols, int rows, double fovRad, const RenderConfig& cfg);

    // Screen rectangle [x0, x1) x [y0, y1) of a projected sprite, unclipped.
    struct Rect { int x0, x1, y0, y1; };
    Rect screenRect(const Sprite& s, int rows, double z);

    // Projects, sorts far to near, then composites against zbuffer (walls) and
    // fb.depth (sprites already drawn). Clear texels write nothing.
    void draw(Framebuffer& fb, const std::vector<double>& zbuffer,
              std::vector<Sprite>& sprites, const TextureSet& textures,
              const Player& player, const RayBasis& b, double fovRad,
              const RenderConfig& cfg);
}
