/**
 * @file SquareSettings.hpp
 * Settings for a single pipeline run.
 */
#pragma once
#include "models/TransparencySettings.hpp"

namespace squarify {

struct SquareSettings
{
    int desiredSize {500};        // clamped to the natural maximum, never enlarged
    int pngCompression {3};       // 0-9, cv::IMWRITE_PNG_COMPRESSION
    bool verbose {false};
    TransparencySettings transparency;

    SquareSettings() = default;
    explicit SquareSettings(int size) : desiredSize(size) {}
    SquareSettings(int size, const TransparencySettings& t) : desiredSize(size), transparency(t) {}
};

}
