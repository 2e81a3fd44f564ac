#pragma once
#include "models/Rgb.hpp"
#include <string>

namespace squarify::util {

// Parse "#rrggbb", "rrggbb", "#rgb", "rgb(r, g, b)" or a basic CSS colour name.
// Throws PipelineError(InvalidParameter) on anything else.
Rgb parseColor(const std::string& text);

// Lowercase "#rrggbb"
std::string toHex(const Rgb& c);

bool isValid(const Rgb& c);

}
