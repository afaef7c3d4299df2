#ifndef DISPLAY_H
#define DISPLAY_H

#include <string>

#include "framebuffer.h"

// ANSI terminal output. Alternate screen + hidden cursor for the object's lifetime.
class TerminalDisplay {
public:
    TerminalDisplay();
    ~TerminalDisplay();

    TerminalDisplay(const TerminalDisplay&) = delete;
    TerminalDisplay& operator=(const TerminalDisplay&) = delete;

    // Full redraw; color escapes only where the tag changes. False if stdout failed.
    bool present(const CharGrid& grid);

    // Terminal cols/rows (80x24 when not a tty).
    static void querySize(int& cols, int& rows);

    // Frame text without the cursor-home prefix (also used by tests).
    static std::string encode(const CharGrid& grid);

private:
    std::string out;
};

#endif // DISPLAY_H
