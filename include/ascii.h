#ifndef ASCII_H
#define ASCII_H

#include <string>

#include "framebuffer.h"

// Glyphs ordered dark -> bright. Intensities 0..9 spread evenly over it.
class Palette {
public:
    // Throws ConfigError on an empty palette.
    explicit Palette(std::string glyphs);

    // Intensity must be 0..9 (asserted); shading clips before this point.
    char glyphFor(int intensity) const;
    int  indexFor(int intensity) const;

    const std::string& glyphs() const { return g; }

private:
    std::string g;
};

namespace Ascii {
    // Every pixel -> one glyph; empty pixels become blanks.
    CharGrid quantize(const Framebuffer& fb, const Palette& palette);
}

#endif // ASCII_H
