// sprites.cpp: billboards, painted far to near with per-pixel depth.
#include "../include/sprites.h"
#include "../include/shading.h"

#include <algorithm>
#include <cmath>

void Sprites::project(Sprite& s, const Player& player, const RayBasis& b,
                      int cols, int rows, double fovRad, const RenderConfig& cfg) {
    s.visible = false;

    const double dx = s.x - player.x, dy = s.y - player.y;
    s.dist2 = dx * dx + dy * dy;

    // Inverse of the camera matrix [plane dir]
    const double invDet     = 1.0 / (b.planeX * b.dirY - b.dirX * b.planeY);
    const double transformX = invDet * (b.dirY * dx - b.dirX * dy);
    const double transformY = invDet * (-b.planeY * dx + b.planeX * dy);
    if (transformY <= NEAR_CLAMP) return;
    if (transformY > cfg.spriteFarClip) return;

    s.depth   = transformY;
    s.screenX = int((cols / 2.0) * (1.0 + transformX / transformY));
    s.height  = int((rows * cfg.projScale) / transformY);
    s.width   = int((cols * cfg.spriteWidth) / (2.0 * std::tan(fovRad / 2.0) * transformY));
    if (s.width <= 0 || s.height <= 0) return;

    s.visible = true;
}

Sprites::Rect Sprites::screenRect(const Sprite& s, int rows, double z) {
    Rect r;
    r.x0 = s.screenX - s.width / 2;
    r.x1 = r.x0 + s.width;
    r.y0 = int((rows - s.height) / 2.0 + z * s.height);
    r.y1 = r.y0 + s.height;
    return r;
}

void Sprites::draw(Framebuffer& fb, const std::vector<double>& zbuffer,
                   std::vector<Sprite>& sprites, const TextureSet& textures,
                   const Player& player, const RayBasis& b, double fovRad,
                   const RenderConfig& cfg) {
    const int cols = fb.W, rows = fb.H;

    std::vector<Sprite*> order;
    order.reserve(sprites.size());
    for (auto& s : sprites) {
        project(s, player, b, cols, rows, fovRad, cfg);
        if (s.visible && s.texture >= 0 && s.texture < (int)textures.sprites.size())
            order.push_back(&s);
    }

    std::sort(order.begin(), order.end(),
              [](const Sprite* a, const Sprite* c){ return a->dist2 > c->dist2; });

    for (const Sprite* s : order) {
        const Texture& tex = textures.sprites[s->texture];
        const Rect r = screenRect(*s, rows, player.z);

        const int dsX = std::max(0, r.x0);
        const int deX = std::min(cols, r.x1);
        const int dsY = std::max(0, r.y0);
        const int deY = std::min(rows, r.y1);
        if (dsX >= deX || dsY >= deY) continue;

        for (int stripe = dsX; stripe < deX; ++stripe) {
            if (!(s->depth < zbuffer[stripe])) continue;

            int texX = int((stripe - r.x0) * tex.w / double(s->width));
            if ((unsigned)texX >= (unsigned)tex.w) continue;

            for (int y = dsY; y < deY; ++y) {
                int texY = int((int64_t)(y - r.y0) * tex.h / s->height);
                if ((unsigned)texY >= (unsigned)tex.h) continue;

                const uint8_t t = tex.at(texX, texY);
                if (t == TEXEL_CLEAR) continue;

                const size_t i = fb.index(stripe, y);
                if (!(s->depth < fb.depth[i])) continue;

                fb.depth[i] = s->depth;
                putPixel(fb, stripe, y, int8_t(Shading::shade(t, s->depth, cfg.shade)),
                         Layer::Sprite, tex.color);
            }
        }
    }
}
