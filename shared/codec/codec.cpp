#include "codec.hpp"
#include "util/ImageOps.hpp"
#include "util/PipelineError.hpp"

#include <opencv2/imgcodecs.hpp>
#include <string>

namespace squarify {

cv::Mat decodeImage(const std::vector<uchar>& bytes)
{
    if (bytes.empty()) throw PipelineError(ErrorKind::Decode, "cannot decode image: no data");

    cv::Mat img;
    try
    {
        img = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    }
    catch (const cv::Exception& e)
    {
        throw PipelineError(ErrorKind::Decode, std::string("cannot decode image: ") + e.what());
    }
    if (img.empty())
        throw PipelineError(ErrorKind::Decode,
                            "cannot decode image (" + std::to_string(bytes.size()) + " bytes): unknown or corrupt format");

    cv::Mat bgra = util::toBgra8(img);
    if (bgra.empty())
        throw PipelineError(ErrorKind::Decode,
                            "unsupported pixel layout (depth " + std::to_string(img.depth()) +
                            ", " + std::to_string(img.channels()) + " channels)");
    return bgra;
}

std::vector<uchar> encodePng(const cv::Mat& bgra, int compression)
{
    if (compression < 0 || compression > 9)
        throw PipelineError(ErrorKind::InvalidParameter,
                            "PNG compression must be within 0-9, got " + std::to_string(compression));
    if (bgra.empty() || bgra.type() != CV_8UC4)
        throw PipelineError(ErrorKind::Encode, "encodePng expects a non-empty 8-bit BGRA image");

    std::vector<uchar> out;
    bool ok = false;
    try
    {
        ok = cv::imencode(".png", bgra, out, { cv::IMWRITE_PNG_COMPRESSION, compression });
    }
    catch (const cv::Exception& e)
    {
        throw PipelineError(ErrorKind::Encode, std::string("PNG encoding failed: ") + e.what());
    }
    if (!ok || out.empty()) throw PipelineError(ErrorKind::Encode, "PNG encoding failed");
    return out;
}

}
