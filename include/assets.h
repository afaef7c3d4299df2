#pragma once
#include <string>
#include <vector>

#include "textures.h"
#include "types.h"
#include "world.h"

// Everything a session needs from disk.
struct Assets {
    GameMap    map;
    TextureSet textures;
    GameState  start;
};

namespace AssetLoader {
    // dir/map.txt, dir/wall_<1..>.{txt,png}, dir/sprite_<0..>.{txt,png}, dir/level.txt.
    // Throws ConfigError on anything malformed or inconsistent.
    Assets loadDirectory(const std::string& dir);

    // "player x y angle_deg" / "sprite x y texture" lines, '#' comments.
    void parseLevel(const std::vector<std::string>& lines, GameState& out);

    // Player start in an open cell, sprite textures loaded, map enclosed.
    void validate(const Assets& a);
}
