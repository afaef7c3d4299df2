// test_render.cpp
// Frame compositor: wall slices, sprite occlusion, quantized output, minimap.

#include <algorithm>
#include <type_traits>

#include "test_harness.h"
#include "../include/ascii.h"
#include "../include/config.h"
#include "../include/renderer.h"
#include "../include/shading.h"
#include "../include/sprites.h"
#include "../include/walls.h"

static RenderConfig smallConfig() {
    RenderConfig cfg;
    cfg.cols = 40;
    cfg.rows = 20;
    cfg.fovDeg = 60.0;
    return cfg;
}

static TextureSet testTextures() {
    TextureSet t;
    t.walls.push_back(Textures::solid(4, 4, 5));

    Texture red = Textures::solid(4, 4, 7);
    red.color = COLOR_RED;
    Texture blue = Textures::solid(4, 4, 7);
    blue.color = COLOR_BLUE;
    t.sprites.push_back(red);                                              // 0
    t.sprites.push_back(blue);                                             // 1
    t.sprites.push_back(Textures::fromRows({ "...", "...", "..." }, true)); // 2: fully clear
    return t;
}

// 12x7 room with a single wall cell at (5, 3), straight ahead of the player.
static GameMap pillarRoom() {
    std::vector<std::string> rows = roomRows(12, 7);
    rows[3][5] = '1';
    return GameMap::fromRows(rows);
}

static GameState stateAt(double x, double y) {
    GameState gs;
    gs.player.x = x;
    gs.player.y = y;
    gs.player.dir = 0.0;
    gs.showMinimap = false;
    return gs;
}

static Sprite spriteAt(double x, double y, int texture) {
    Sprite s; s.x = x; s.y = y; s.texture = texture;
    return s;
}

static int countLayer(const Framebuffer& fb, Layer l) {
    return (int)std::count(fb.layer.begin(), fb.layer.end(), l);
}

static int countColor(const Framebuffer& fb, Layer l, uint8_t color) {
    int n = 0;
    for (size_t i = 0; i < fb.layer.size(); ++i)
        if (fb.layer[i] == l && fb.color[i] == color) ++n;
    return n;
}

// =============================================================================
// Walls
// =============================================================================

TEST(wall_slice_height_and_jump_offset) {
    const Walls::Span s = Walls::span(20, 2.0, 1.0, 0.0);
    ASSERT_EQ(s.lineH, 10);
    ASSERT_EQ(s.top, 5);
    ASSERT_EQ(s.bottom, 15);

    // Raising the eye lowers the world on screen
    const Walls::Span up = Walls::span(20, 2.0, 1.0, 0.25);
    ASSERT_EQ(up.lineH, 10);
    ASSERT_EQ(up.top, 7);
    ASSERT_EQ(up.bottom, 17);

    const Walls::Span clamped = Walls::span(20, NEAR_CLAMP, 1.0, 0.0);
    ASSERT_GE(clamped.lineH, 20);
    ASSERT_LE(clamped.top, 0);
    ASSERT_GE(clamped.bottom, 20);
}

TEST(single_room_frame) {
    const GameMap map = makeRoom(6, 6);
    const TextureSet tex = testTextures();
    const RenderConfig cfg = smallConfig();
    Renderer r(map, tex, cfg);

    GameState gs = stateAt(3.0, 3.0);
    const CharGrid grid = r.render(gs);
    ASSERT_EQ(grid.cols, 40);
    ASSERT_EQ(grid.rows, 20);

    const Palette palette(cfg.palette);
    const char wall = palette.glyphFor(Shading::shadeFace(5, 2.0, 0, cfg.shade));
    const char floor = palette.glyphFor(cfg.shade.floorShade);

    // Centre column: ceiling blank, slice rows 5..14, floor below
    for (int y = 0; y < 5; ++y)   ASSERT_EQ(grid.glyph(20, y), ' ');
    for (int y = 5; y < 15; ++y)  ASSERT_EQ(grid.glyph(20, y), wall);
    for (int y = 15; y < 20; ++y) ASSERT_EQ(grid.glyph(20, y), floor);
    ASSERT_EQ(grid.glyph(21, 17), ' ');

    ASSERT_NEAR(r.depthBuffer()[20], 2.0, 1e-9);

    // Flat wall: the edges are just as far along the view axis
    const int centre = (int)palette.glyphs().find(wall);
    const int left   = (int)palette.glyphs().find(grid.glyph(0, 10));
    const int right  = (int)palette.glyphs().find(grid.glyph(39, 10));
    ASSERT_LE(left, centre);
    ASSERT_GE(left, centre - 1);
    ASSERT_LE(right, centre);
    ASSERT_GE(right, centre - 1);
}

TEST(texture_toggle_falls_back_to_neutral_texel) {
    const GameMap map = makeRoom(6, 6);
    const TextureSet tex = testTextures();
    const RenderConfig cfg = smallConfig();
    Renderer r(map, tex, cfg);

    GameState gs = stateAt(3.0, 3.0);
    gs.texturesOn = false;
    r.render(gs);

    const Framebuffer& fb = r.framebuffer();
    ASSERT_EQ(fb.shade[fb.index(20, 10)], Shading::shadeFace(TEXEL_NEUTRAL, 2.0, 0, cfg.shade));
    ASSERT_TRUE(fb.layer[fb.index(20, 10)] == Layer::Wall);
}

TEST(renders_without_any_textures) {
    const GameMap map = makeRoom(6, 6);
    const TextureSet none{};
    Renderer r(map, none, smallConfig());

    GameState gs = stateAt(3.0, 3.0);
    gs.sprites.push_back(spriteAt(4.0, 3.0, 0));   // no sprite textures: skipped
    r.render(gs);
    ASSERT_EQ(countLayer(r.framebuffer(), Layer::Sprite), 0);
    ASSERT_TRUE(r.framebuffer().layer[r.framebuffer().index(20, 10)] == Layer::Wall);
}

// =============================================================================
// Sprites
// =============================================================================

TEST(sprite_behind_wall_is_hidden) {
    const GameMap map = pillarRoom();
    const TextureSet tex = testTextures();
    Renderer r(map, tex, smallConfig());

    GameState gs = stateAt(2.5, 3.5);
    gs.sprites.push_back(spriteAt(8.5, 3.5, 0));
    r.render(gs);

    ASSERT_TRUE(gs.sprites[0].visible);
    ASSERT_NEAR(gs.sprites[0].depth, 6.0, 1e-9);
    ASSERT_EQ(countLayer(r.framebuffer(), Layer::Sprite), 0);
}

TEST(sprite_in_front_covers_its_rectangle) {
    const GameMap map = pillarRoom();
    const TextureSet tex = testTextures();
    const RenderConfig cfg = smallConfig();
    Renderer r(map, tex, cfg);

    GameState gs = stateAt(2.5, 3.5);
    gs.sprites.push_back(spriteAt(4.0, 3.5, 0));
    r.render(gs);

    const Sprite& s = gs.sprites[0];
    ASSERT_TRUE(s.visible);
    ASSERT_EQ(s.screenX, 20);
    ASSERT_EQ(s.width, 23);
    ASSERT_EQ(s.height, 13);

    const Sprites::Rect rect = Sprites::screenRect(s, 20, 0.0);
    const int w = std::min(40, rect.x1) - std::max(0, rect.x0);
    const int h = std::min(20, rect.y1) - std::max(0, rect.y0);

    const Framebuffer& fb = r.framebuffer();
    ASSERT_EQ(countLayer(fb, Layer::Sprite), w * h);
    ASSERT_EQ(countColor(fb, Layer::Sprite, COLOR_RED), w * h);
    ASSERT_EQ(fb.shade[fb.index(20, 10)], Shading::shade(7, 1.5, cfg.shade));
}

TEST(nearer_sprite_wins_overlap) {
    const GameMap map = makeRoom(12, 7);
    const TextureSet tex = testTextures();
    Renderer r(map, tex, smallConfig());

    GameState gs = stateAt(2.5, 3.5);
    // Listed near first; painting order must not depend on it
    gs.sprites.push_back(spriteAt(4.0, 3.5, 0));   // red, depth 1.5
    gs.sprites.push_back(spriteAt(6.0, 3.5, 1));   // blue, depth 3.5, inside red's rectangle
    r.render(gs);

    const Framebuffer& fb = r.framebuffer();
    ASSERT_TRUE(gs.sprites[1].visible);
    ASSERT_EQ(countColor(fb, Layer::Sprite, COLOR_BLUE), 0);
    ASSERT_EQ(countColor(fb, Layer::Sprite, COLOR_RED), 23 * 13);
}

TEST(clear_texels_leave_the_wall_visible) {
    const GameMap map = pillarRoom();
    const TextureSet tex = testTextures();
    Renderer r(map, tex, smallConfig());

    GameState gs = stateAt(2.5, 3.5);
    gs.sprites.push_back(spriteAt(4.0, 3.5, 2));
    r.render(gs);

    const Framebuffer& fb = r.framebuffer();
    ASSERT_EQ(countLayer(fb, Layer::Sprite), 0);
    ASSERT_TRUE(fb.layer[fb.index(20, 10)] == Layer::Wall);
}

TEST(sprite_behind_camera_is_culled) {
    const GameMap map = makeRoom(12, 7);
    const TextureSet tex = testTextures();
    Renderer r(map, tex, smallConfig());

    GameState gs = stateAt(5.5, 3.5);
    gs.sprites.push_back(spriteAt(3.5, 3.5, 0));
    r.render(gs);

    ASSERT_FALSE(gs.sprites[0].visible);
    ASSERT_EQ(countLayer(r.framebuffer(), Layer::Sprite), 0);
}

TEST(previous_frame_does_not_occlude_next) {
    const GameMap map = pillarRoom();
    const TextureSet tex = testTextures();
    Renderer r(map, tex, smallConfig());

    GameState gs = stateAt(2.5, 3.5);
    gs.sprites.push_back(spriteAt(4.0, 3.5, 0));
    r.render(gs);
    ASSERT_GE(countLayer(r.framebuffer(), Layer::Sprite), 1);

    // Sprite gone: nothing of it may survive into the next frame
    gs.sprites.clear();
    r.render(gs);
    ASSERT_EQ(countLayer(r.framebuffer(), Layer::Sprite), 0);
    for (double d : r.depthBuffer()) ASSERT_LE(d, 20.0);
}

// =============================================================================
// Columns in parallel
// =============================================================================

TEST(threaded_columns_match_sequential) {
    const GameMap map = pillarRoom();
    const TextureSet tex = testTextures();

    RenderConfig one = smallConfig();
    RenderConfig four = smallConfig();
    four.workerThreads = 4;
    Renderer a(map, tex, one);
    Renderer b(map, tex, four);

    GameState gs = stateAt(2.5, 4.2);
    gs.player.dir = 0.4;
    gs.sprites.push_back(spriteAt(4.0, 3.5, 0));
    gs.sprites.push_back(spriteAt(9.0, 5.0, 1));

    GameState gs2 = gs;
    const CharGrid ga = a.render(gs);
    const CharGrid gb = b.render(gs2);
    ASSERT_TRUE(ga.glyphs == gb.glyphs);
    ASSERT_TRUE(ga.colors == gb.colors);
    ASSERT_TRUE(a.depthBuffer() == b.depthBuffer());
}

TEST(worker_error_aborts_the_frame) {
    const GameMap map = pillarRoom();
    const TextureSet tex = testTextures();
    RenderConfig cfg = smallConfig();
    cfg.workerThreads = 4;
    Renderer r(map, tex, cfg);

    // Every column's ray starts outside the grid
    GameState lost = stateAt(-3.0, 3.5);
    ASSERT_THROWS(r.render(lost), ConfigError);

    // The renderer is still usable afterwards
    GameState gs = stateAt(2.5, 3.5);
    const CharGrid grid = r.render(gs);
    ASSERT_TRUE(r.framebuffer().layer[r.framebuffer().index(20, 10)] == Layer::Wall);
    ASSERT_EQ(grid.cols, 40);
}

TEST(renderer_does_not_bind_temporaries) {
    static_assert(!std::is_constructible<Renderer, GameMap, const TextureSet&, const RenderConfig&>::value,
                  "temporary map accepted");
    static_assert(!std::is_constructible<Renderer, const GameMap&, TextureSet, const RenderConfig&>::value,
                  "temporary texture set accepted");
    static_assert(std::is_constructible<Renderer, const GameMap&, const TextureSet&, RenderConfig>::value,
                  "config is copied and may be a temporary");
}

// =============================================================================
// Frame entry point and minimap
// =============================================================================

TEST(frame_without_input_keeps_the_player) {
    const GameMap map = makeRoom(6, 6);
    const TextureSet tex = testTextures();
    Renderer r(map, tex, smallConfig());

    GameState gs = stateAt(3.0, 3.0);
    const InputState none{};
    r.frame(gs, none, 1.0 / 60.0);
    ASSERT_NEAR(gs.player.x, 3.0, 0.0);
    ASSERT_NEAR(gs.player.y, 3.0, 0.0);
    ASSERT_NEAR(gs.player.dir, 0.0, 0.0);
    ASSERT_NEAR(gs.player.z, 0.0, 0.0);
}

TEST(minimap_in_bottom_right_corner) {
    const GameMap map = makeRoom(6, 6);
    const TextureSet tex = testTextures();
    Renderer r(map, tex, smallConfig());

    GameState gs = stateAt(3.0, 3.0);
    gs.showMinimap = true;
    const CharGrid grid = r.render(gs);

    // 9x7 window at (26, 8), player cell in its centre
    ASSERT_EQ(grid.glyph(30, 11), '@');
    ASSERT_EQ(grid.glyph(27, 11), '#');    // west border cell (0, 3)
    ASSERT_EQ(grid.glyph(26, 11), ' ');    // outside the map
    ASSERT_EQ(grid.glyph(29, 11), ' ');    // open cell (2, 3)
}

TEST(minimap_skipped_when_it_does_not_fit) {
    const GameMap map = makeRoom(6, 6);
    const TextureSet tex = testTextures();
    RenderConfig cfg = smallConfig();
    cfg.minimapOffX = 50;
    Renderer r(map, tex, cfg);

    GameState gs = stateAt(3.0, 3.0);
    gs.showMinimap = true;
    const CharGrid grid = r.render(gs);
    ASSERT_TRUE(std::find(grid.glyphs.begin(), grid.glyphs.end(), '@') == grid.glyphs.end());
}

TEST(resize_changes_output_size) {
    const GameMap map = makeRoom(6, 6);
    const TextureSet tex = testTextures();
    Renderer r(map, tex, smallConfig());
    r.resize(17, 9);

    GameState gs = stateAt(3.0, 3.0);
    const CharGrid grid = r.render(gs);
    ASSERT_EQ(grid.cols, 17);
    ASSERT_EQ(grid.rows, 9);
    ASSERT_EQ(r.depthBuffer().size(), size_t(17));
}

int main() {
    std::cout << "\n=== Frame Compositor Tests ===\n\n";
    RUN_TEST(wall_slice_height_and_jump_offset);
    RUN_TEST(single_room_frame);
    RUN_TEST(texture_toggle_falls_back_to_neutral_texel);
    RUN_TEST(renders_without_any_textures);
    RUN_TEST(sprite_behind_wall_is_hidden);
    RUN_TEST(sprite_in_front_covers_its_rectangle);
    RUN_TEST(nearer_sprite_wins_overlap);
    RUN_TEST(clear_texels_leave_the_wall_visible);
    RUN_TEST(sprite_behind_camera_is_culled);
    RUN_TEST(previous_frame_does_not_occlude_next);
    RUN_TEST(threaded_columns_match_sequential);
    RUN_TEST(worker_error_aborts_the_frame);
    RUN_TEST(renderer_does_not_bind_temporaries);
    RUN_TEST(frame_without_input_keeps_the_player);
    RUN_TEST(minimap_in_bottom_right_corner);
    RUN_TEST(minimap_skipped_when_it_does_not_fit);
    RUN_TEST(resize_changes_output_size);
    return report();
}
