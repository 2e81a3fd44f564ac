/**
 * @file TransparencySettings.hpp
 * Parameters for background-to-alpha conversion, filled by the CLI or any
 * other host.
 */
#pragma once
#include "models/Rgb.hpp"
#include "models/TransparencyMode.hpp"

namespace squarify {

struct TransparencySettings
{
    bool enabled {false};
    bool autoDetect {false};      // take the colour from pixel (0,0), ignoring `color`
    TransparencyMode mode {TransparencyMode::SimilarityFalloff};
    Rgb color {255, 255, 255};
};

}
