/**
 * @file Rgb.hpp
 * Background colour as seen by callers. No alpha: it names a hue to remove.
 */
#pragma once

namespace squarify {

struct Rgb
{
    int r {255};
    int g {255};
    int b {255};

    Rgb() = default;
    Rgb(int red, int green, int blue) : r(red), g(green), b(blue) {}

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }
};

}
