#include "../include/display.h"
#include "../include/textures.h"

#include <cstdio>
#include <sys/ioctl.h>
#include <unistd.h>

static constexpr const char* ENTER_ALT = "\033[?1049h\033[?25l";
static constexpr const char* LEAVE_ALT = "\033[0m\033[?25h\033[?1049l";
static constexpr const char* HOME      = "\033[H";

static void appendColor(std::string& s, uint8_t tag) {
    if (tag == COLOR_DEFAULT) { s += "\033[39m"; return; }
    // COLOR_BLACK..COLOR_WHITE -> 30..37
    s += "\033[";
    s += std::to_string(30 + int(tag) - int(COLOR_BLACK));
    s += 'm';
}

TerminalDisplay::TerminalDisplay() {
    std::fputs(ENTER_ALT, stdout);
    std::fflush(stdout);
}

TerminalDisplay::~TerminalDisplay() {
    std::fputs(LEAVE_ALT, stdout);
    std::fflush(stdout);
}

void TerminalDisplay::querySize(int& cols, int& rows) {
    cols = 80; rows = 24;
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        cols = ws.ws_col;
        rows = ws.ws_row;
    }
}

std::string TerminalDisplay::encode(const CharGrid& grid) {
    std::string s;
    s.reserve(size_t(grid.cols + 8) * size_t(grid.rows));
    uint8_t current = COLOR_DEFAULT;
    for (int y = 0; y < grid.rows; ++y) {
        for (int x = 0; x < grid.cols; ++x) {
            const size_t i = size_t(y) * size_t(grid.cols) + size_t(x);
            if (grid.colors[i] != current) {
                current = grid.colors[i];
                appendColor(s, current);
            }
            s += grid.glyphs[i];
        }
        if (y + 1 < grid.rows) s += "\r\n";
    }
    if (current != COLOR_DEFAULT) appendColor(s, COLOR_DEFAULT);
    return s;
}

bool TerminalDisplay::present(const CharGrid& grid) {
    out.assign(HOME);
    out += encode(grid);
    if (std::fwrite(out.data(), 1, out.size(), stdout) != out.size()) return false;
    return std::fflush(stdout) == 0;
}
