#include "squarify.hpp"
#include "util/ImageOps.hpp"
#include "util/PipelineError.hpp"

#include <algorithm>
#include <new>
#include <string>

namespace squarify {

SquareResult squarifyImage(const cv::Mat& img, int desiredSize)
{
    if (desiredSize < 1)
        throw PipelineError(ErrorKind::InvalidParameter,
                            "desired size must be a positive integer, got " + std::to_string(desiredSize));

    cv::Mat bgra = util::toBgra8(img);
    if (bgra.empty())
        throw PipelineError(ErrorKind::InvalidParameter, "squarifyImage: empty or unsupported image");

    SquareResult res;
    res.naturalMaxSize = std::max(bgra.cols, bgra.rows);
    res.usedSize = std::min(desiredSize, res.naturalMaxSize);
    res.offsetX = (res.naturalMaxSize - bgra.cols) / 2;
    res.offsetY = (res.naturalMaxSize - bgra.rows) / 2;

    // The canvas and its float copy grow with naturalMaxSize^2
    try
    {
        cv::Mat canvas(res.naturalMaxSize, res.naturalMaxSize, CV_8UC4, cv::Scalar(0, 0, 0, 0));
        bgra.copyTo(canvas(cv::Rect(res.offsetX, res.offsetY, bgra.cols, bgra.rows)));

        res.image = (res.usedSize == res.naturalMaxSize) ? canvas
                                                          : util::resizePremultiplied(canvas, res.usedSize);
    }
    catch (const cv::Exception& e)
    {
        throw PipelineError(ErrorKind::Encode, "cannot build " + std::to_string(res.naturalMaxSize) +
                                               " px square canvas: " + e.what());
    }
    catch (const std::bad_alloc&)
    {
        throw PipelineError(ErrorKind::Encode, "out of memory building " + std::to_string(res.naturalMaxSize) +
                                               " px square canvas");
    }
    return res;
}

}
