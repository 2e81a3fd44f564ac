#include "pipeline.hpp"
#include "codec/codec.hpp"
#include "squarify/squarify.hpp"
#include "transparency/transparency.hpp"
#include "util/ColorSpec.hpp"
#include "util/PipelineError.hpp"

#include <iostream>
#include <new>
#include <string>

namespace squarify {

PipelineResult runPipeline(const std::vector<uchar>& imageBytes, const SquareSettings& settings)
{
    const bool verbose = settings.verbose;
    const TransparencySettings& t = settings.transparency;

    // Reject bad parameters before touching the data
    if (settings.desiredSize < 1)
        throw PipelineError(ErrorKind::InvalidParameter,
                            "desired size must be a positive integer, got " + std::to_string(settings.desiredSize));
    if (settings.pngCompression < 0 || settings.pngCompression > 9)
        throw PipelineError(ErrorKind::InvalidParameter,
                            "PNG compression must be within 0-9, got " + std::to_string(settings.pngCompression));
    if (t.enabled && !t.autoDetect && !util::isValid(t.color))
        throw PipelineError(ErrorKind::InvalidParameter, "color component outside [0,255]");

    cv::Mat img = decodeImage(imageBytes);
    if (verbose)
        std::cout << "[runPipeline] decoded " << img.cols << "x" << img.rows
                  << " from " << imageBytes.size() << " bytes" << std::endl;

    PipelineResult res;
    res.inputWidth = img.cols;
    res.inputHeight = img.rows;

    SquareResult sq;
    try
    {
        if (t.enabled)
        {
            TransparencyResult tr = addTransparency(img, t);
            if (tr.autoDetected)
            {
                res.detectedColor = tr.targetColor;
                res.detectedHex = tr.targetHex;
            }
            if (verbose)
                std::cout << "[runPipeline] "
                          << (t.mode == TransparencyMode::ExactMatch ? "exact-match" : "similarity")
                          << " transparency, color " << tr.targetHex
                          << (tr.autoDetected ? " (auto-detected)" : "") << std::endl;
            img = tr.image;
        }

        sq = squarifyImage(img, settings.desiredSize);
        res.naturalMaxSize = sq.naturalMaxSize;
        res.usedSize = sq.usedSize;
        if (verbose)
        {
            std::cout << "[runPipeline] canvas " << sq.naturalMaxSize << "x" << sq.naturalMaxSize
                      << ", content at (" << sq.offsetX << ", " << sq.offsetY << ")" << std::endl;
            if (sq.usedSize != settings.desiredSize)
                std::cout << "[runPipeline] requested " << settings.desiredSize
                          << " px clamped to " << sq.usedSize << " px" << std::endl;
        }
    }
    catch (const cv::Exception& e)
    {
        throw PipelineError(ErrorKind::Encode, std::string("image transform failed: ") + e.what());
    }
    catch (const std::bad_alloc&)
    {
        throw PipelineError(ErrorKind::Encode, "out of memory while transforming " + std::to_string(img.cols) +
                                               "x" + std::to_string(img.rows) + " image");
    }

    res.png = encodePng(sq.image, settings.pngCompression);
    res.image = sq.image;
    if (verbose)
        std::cout << "[runPipeline] encoded " << res.usedSize << "x" << res.usedSize
                  << " PNG, " << res.png.size() << " bytes" << std::endl;
    return res;
}

PipelineResult runPipeline(const std::vector<uchar>& imageBytes, int desiredSize, const TransparencySettings& transparency)
{
    return runPipeline(imageBytes, SquareSettings(desiredSize, transparency));
}

}
