/*==========================  pipeline.hpp  ==========================

   decode -> (transparency) -> squarify -> PNG encode, for one image.
   --------------------------------------------------------------------
   • bytes in, bytes out: fetching and saving belong to the host
   • everything a host displays comes back in PipelineResult
   • synchronous and stateless; call it from whatever thread keeps the
     host responsive, one run at a time

=====================================================================*/
#pragma once
#include "models/Rgb.hpp"
#include "models/SquareSettings.hpp"

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace squarify {

struct PipelineResult
{
    cv::Mat image;                 // final CV_8UC4 raster
    std::vector<uchar> png;        // encoded download
    int inputWidth {0};
    int inputHeight {0};
    int naturalMaxSize {0};
    int usedSize {0};
    std::optional<Rgb> detectedColor;   // set only when auto-detect ran
    std::string detectedHex;
};

/**
 * @brief Runs the whole transform on one encoded image.
 *
 * @param imageBytes  Encoded input (PNG, JPEG, BMP, ...).
 * @param settings    Desired size, transparency options, PNG level, verbosity.
 * @throws PipelineError with kind Decode, InvalidParameter or Encode. No partial
 *         result is produced.
 */
PipelineResult runPipeline(const std::vector<uchar>& imageBytes, const SquareSettings& settings);

PipelineResult runPipeline(const std::vector<uchar>& imageBytes,
                           int desiredSize,
                           const TransparencySettings& transparency = TransparencySettings{});

}
