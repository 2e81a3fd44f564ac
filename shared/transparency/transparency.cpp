#include "transparency.hpp"
#include "util/ColorSpec.hpp"
#include "util/ImageOps.hpp"
#include "util/PipelineError.hpp"

#include <opencv2/imgproc.hpp>
#include <vector>

namespace squarify {

namespace
{
    cv::Mat exactMatchAlpha(const cv::Mat& bgra, const Rgb& c)
    {
        cv::Mat colorMask;
        cv::inRange(bgra, cv::Scalar(c.b, c.g, c.r, 0), cv::Scalar(c.b, c.g, c.r, 255), colorMask);

        cv::Mat alpha;
        cv::extractChannel(bgra, alpha, 3);
        cv::Mat alreadyClear = alpha == 0;
        cv::Mat mask;
        cv::bitwise_or(colorMask, alreadyClear, mask);

        alpha.setTo(255);
        alpha.setTo(0, mask);
        return alpha;
    }

    cv::Mat similarityAlpha(const cv::Mat& bgra, const Rgb& c)
    {
        cv::Mat bgr;
        cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
        cv::Mat diff;
        cv::absdiff(bgr, util::toScalar(c), diff);

        std::vector<cv::Mat> d;
        cv::split(diff, d);
        cv::Mat alpha;
        cv::max(d[0], d[1], alpha);
        cv::max(alpha, d[2], alpha);
        return alpha;
    }
}

TransparencyResult addTransparency(const cv::Mat& img, const Rgb& color, TransparencyMode mode, bool autoDetect)
{
    cv::Mat bgra = util::toBgra8(img);
    if (bgra.empty())
        throw PipelineError(ErrorKind::InvalidParameter, "addTransparency: empty or unsupported image");

    TransparencyResult res;
    res.autoDetected = autoDetect;
    res.targetColor = autoDetect ? util::pixelColor(bgra, 0, 0) : color;
    if (!util::isValid(res.targetColor))
        throw PipelineError(ErrorKind::InvalidParameter, "addTransparency: color component outside [0,255]");
    res.targetHex = util::toHex(res.targetColor);

    cv::Mat alpha;
    switch (mode)
    {
    case TransparencyMode::ExactMatch: alpha = exactMatchAlpha(bgra, res.targetColor); break;
    case TransparencyMode::SimilarityFalloff: alpha = similarityAlpha(bgra, res.targetColor); break;
    default: throw PipelineError(ErrorKind::InvalidParameter, "addTransparency: unknown transparency mode");
    }

    cv::insertChannel(alpha, bgra, 3);
    res.image = bgra;
    return res;
}

TransparencyResult addTransparency(const cv::Mat& img, const TransparencySettings& settings)
{
    return addTransparency(img, settings.color, settings.mode, settings.autoDetect);
}

}
