// world.cpp
#include "../include/world.h"
#include "../include/config.h"

#include <fstream>
#include <string>

// --------------------- helpers ------------------------
static std::string cellName(int x, int y) {
    return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
}

// ------------------- builders -------------------------
GameMap GameMap::fromRows(const std::vector<std::string>& rows) {
    if (rows.empty() || rows[0].empty())
        throw ConfigError("map: empty map");

    GameMap m;
    m.W = (int)rows[0].size();
    m.H = (int)rows.size();
    m.cells.assign(size_t(m.W) * size_t(m.H), Cell{});

    for (int y = 0; y < m.H; ++y) {
        const std::string& row = rows[y];
        if ((int)row.size() != m.W)
            throw ConfigError("map: row " + std::to_string(y) + " has " + std::to_string(row.size())
                              + " cells, expected " + std::to_string(m.W));
        for (int x = 0; x < m.W; ++x) {
            const char ch = row[x];
            if (ch == '0' || ch == ' ') continue;
            if (ch < '1' || ch > '9')
                throw ConfigError("map: bad cell '" + std::string(1, ch) + "' at " + cellName(x, y));
            m.set(x, y, Cell{ true, ch - '1' });
        }
    }
    return m;
}

GameMap GameMap::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("map: cannot open '" + path + "'");

    std::vector<std::string> rows;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        rows.push_back(line);
    }
    // trailing blank lines are not rows
    while (!rows.empty() && rows.back().empty()) rows.pop_back();

    try {
        return fromRows(rows);
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

// ------------------- validation -----------------------
void GameMap::validateEnclosed() const {
    for (int x = 0; x < W; ++x) {
        if (!at(x, 0).wall)     throw ConfigError("map: open border cell at " + cellName(x, 0));
        if (!at(x, H - 1).wall) throw ConfigError("map: open border cell at " + cellName(x, H - 1));
    }
    for (int y = 0; y < H; ++y) {
        if (!at(0, y).wall)     throw ConfigError("map: open border cell at " + cellName(0, y));
        if (!at(W - 1, y).wall) throw ConfigError("map: open border cell at " + cellName(W - 1, y));
    }
}

void GameMap::validateTextures(int textureCount) const {
    for (int y = 0; y < H; ++y)
        for (int x = 0; x < W; ++x) {
            const Cell& c = at(x, y);
            if (c.wall && (c.texture < 0 || c.texture >= textureCount))
                throw ConfigError("map: wall at " + cellName(x, y) + " uses texture "
                                  + std::to_string(c.texture + 1) + " but only "
                                  + std::to_string(textureCount) + " wall textures are loaded");
        }
}
