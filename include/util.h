#ifndef UTIL_H
#define UTIL_H

#include <cstdint>
#include <cmath>

inline uint8_t alphaOf(uint32_t c){ return uint8_t((c>>24)&255); }

// Rec.601 luma of an ARGB pixel, 0..1
inline double luminance(uint32_t c){
    const double r=(c>>16)&255, g=(c>>8)&255, b=c&255;
    return (0.299*r + 0.587*g + 0.114*b) / 255.0;
}

inline int clampi(int v,int lo,int hi){ return v<lo ? lo : (v>hi ? hi : v); }

#endif //UTIL_H
