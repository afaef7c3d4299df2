#pragma once
#include <cmath>
#include <string>
#include <vector>

// Map cell; '1'..'9' in map files -> wall with texture id digit - 1
struct Cell {
    bool wall    = false;
    int  texture = 0;
};

class GameMap {
public:
    GameMap() = default;

    // Each string is one row; '0' / ' ' open, '1'..'9' wall. Throws ConfigError
    // when the rows are empty, ragged or contain other characters.
    static GameMap fromRows(const std::vector<std::string>& rows);
    static GameMap load(const std::string& path);

    int width()  const { return W; }
    int height() const { return H; }

    const Cell& at(int mx, int my) const { return cells[size_t(my) * size_t(W) + size_t(mx)]; }
    void set(int mx, int my, Cell c)     { cells[size_t(my) * size_t(W) + size_t(mx)] = c; }

    bool inBounds(int mx, int my) const { return mx >= 0 && my >= 0 && mx < W && my < H; }

    // Out-of-bounds counts as wall so nothing ever leaves the grid.
    bool isWallCell(int mx, int my) const {
        if (!inBounds(mx, my)) return true;
        return at(mx, my).wall;
    }
    bool isWallAt(double x, double y) const {
        return isWallCell((int)std::floor(x), (int)std::floor(y));
    }

    // Every border cell must be a wall; otherwise rays can escape.
    void validateEnclosed() const;

    // Every wall texture id must be < textureCount.
    void validateTextures(int textureCount) const;

private:
    int W = 0, H = 0;
    std::vector<Cell> cells;
};
