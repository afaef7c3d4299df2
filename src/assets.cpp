// assets.cpp
#include "../include/assets.h"
#include "../include/config.h"

#include <fstream>
#include <sstream>

static constexpr double kDegToRad = 0.017453292519943295;

// --------------------- helpers ------------------------
static bool fileExists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

static std::vector<std::string> readLines(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("assets: cannot open '" + path + "'");
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

// <dir>/<stem><n>.txt, else .png; false when neither exists
static bool loadNumbered(const std::string& dir, const std::string& stem, int n,
                         bool sprite, std::vector<Texture>& out) {
    const std::string base = dir + "/" + stem + std::to_string(n);
    if (fileExists(base + ".txt")) { out.push_back(Textures::loadText(base + ".txt", sprite)); return true; }
    if (fileExists(base + ".png")) { out.push_back(Textures::loadImage(base + ".png", sprite)); return true; }
    return false;
}

// ---------------------- API ---------------------------
void AssetLoader::parseLevel(const std::vector<std::string>& lines, GameState& out) {
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string line = lines[i];
        const size_t hash = line.find('#');
        if (hash != std::string::npos) line.resize(hash);

        std::istringstream ss(line);
        std::string kind;
        if (!(ss >> kind)) continue;

        const std::string where = "level line " + std::to_string(i + 1);
        if (kind == "player") {
            double x, y, deg;
            if (!(ss >> x >> y >> deg)) throw ConfigError(where + ": expected 'player x y angle'");
            out.player = Player{};
            out.player.x = x; out.player.y = y; out.player.dir = deg * kDegToRad;
        } else if (kind == "sprite") {
            Sprite s;
            if (!(ss >> s.x >> s.y >> s.texture)) throw ConfigError(where + ": expected 'sprite x y texture'");
            out.sprites.push_back(s);
        } else {
            throw ConfigError(where + ": unknown entry '" + kind + "'");
        }
    }
}

void AssetLoader::validate(const Assets& a) {
    a.map.validateEnclosed();
    if (!a.textures.walls.empty()) a.map.validateTextures((int)a.textures.walls.size());

    const Player& p = a.start.player;
    if (a.map.isWallAt(p.x, p.y))
        throw ConfigError("level: player starts inside a wall or outside the map");

    for (const auto& s : a.start.sprites)
        if (s.texture < 0 || s.texture >= (int)a.textures.sprites.size())
            throw ConfigError("level: sprite uses texture " + std::to_string(s.texture) + " but only "
                              + std::to_string(a.textures.sprites.size()) + " sprite textures are loaded");
}

Assets AssetLoader::loadDirectory(const std::string& dir) {
    Assets a;
    a.map = GameMap::load(dir + "/map.txt");

    for (int n = 1; loadNumbered(dir, "wall_", n, false, a.textures.walls); ++n) {}
    for (int n = 0; loadNumbered(dir, "sprite_", n, true, a.textures.sprites); ++n) {}

    if (fileExists(dir + "/level.txt")) {
        try {
            parseLevel(readLines(dir + "/level.txt"), a.start);
        } catch (const ConfigError& e) {
            throw ConfigError(dir + "/level.txt: " + e.what());
        }
    }

    validate(a);
    return a;
}
