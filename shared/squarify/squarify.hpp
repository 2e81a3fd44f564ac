/*==========================  squarify.hpp  ==========================

   Pads a rectangular image into a centred square canvas.
   --------------------------------------------------------------------
   • canvas side = max(width, height), transparent (all zero) padding
   • requested output side is clamped to that natural maximum and the
     clamped value is handed back
   • downscaling resamples on alpha-premultiplied data

=====================================================================*/
#pragma once
#include <opencv2/core.hpp>

namespace squarify {

struct SquareResult
{
    cv::Mat image;         // CV_8UC4, usedSize x usedSize
    int naturalMaxSize {0};
    int usedSize {0};
    int offsetX {0};       // where the source landed on the full-size canvas
    int offsetY {0};
};

/**
 * @brief Centres `img` on a transparent square canvas and resizes it.
 *
 * @param img          Source image; converted to BGRA if needed. Not modified.
 * @param desiredSize  Requested output side in pixels, >= 1. Values above the
 *                     natural maximum are clamped to it.
 * @throws PipelineError(InvalidParameter) if desiredSize < 1 or img is empty.
 */
SquareResult squarifyImage(const cv::Mat& img, int desiredSize);

}
