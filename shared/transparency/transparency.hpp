/*========================  transparency.hpp  ========================

   Chroma-key background removal.
   --------------------------------------------------------------------
   • rewrites the alpha channel of a BGRA image from its distance to a
     background colour
   • ExactMatch gives binary alpha, SimilarityFalloff a smooth ramp
   • auto-detect samples the top-left pixel (assumes a uniform
     background touching that corner)

=====================================================================*/
#pragma once
#include "models/Rgb.hpp"
#include "models/TransparencySettings.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace squarify {

struct TransparencyResult
{
    cv::Mat image;             // CV_8UC4, same size as the input
    Rgb targetColor;           // colour that was actually removed
    std::string targetHex;     // lowercase "#rrggbb"
    bool autoDetected {false};
};

/**
 * @brief Replaces a background colour with transparency.
 *
 * @param img         Source image; any layout util::toBgra8 accepts. Not modified.
 * @param color       Colour to remove. Ignored when autoDetect is set.
 * @param mode        ExactMatch: alpha 0 where RGB == color or alpha was already 0,
 *                    255 elsewhere. SimilarityFalloff: alpha = max(|dR|, |dG|, |dB|).
 * @param autoDetect  Use the colour of pixel (0,0) instead of `color`.
 * @return the new image plus the effective colour.
 * @throws PipelineError(InvalidParameter) for an empty image or out-of-range colour.
 */
TransparencyResult addTransparency(const cv::Mat& img,
                                   const Rgb& color,
                                   TransparencyMode mode,
                                   bool autoDetect);

TransparencyResult addTransparency(const cv::Mat& img, const TransparencySettings& settings);

}
