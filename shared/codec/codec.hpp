#pragma once
#include <opencv2/core.hpp>
#include <vector>

namespace squarify {

// Decode any format imgcodecs understands into CV_8UC4 (first frame only).
// Throws PipelineError(Decode) for empty, corrupt or unsupported data.
cv::Mat decodeImage(const std::vector<uchar>& bytes);

// PNG container, 8-bit BGRA in, RGBA file out. compression is 0-9.
// Throws PipelineError(InvalidParameter) for a bad level, (Encode) on failure.
std::vector<uchar> encodePng(const cv::Mat& bgra, int compression = 3);

}
