#pragma once
#include "models/Rgb.hpp"
#include <opencv2/core.hpp>

namespace squarify::util {

// Normalize any decoded layout (gray, BGR, BGRA; 8/16-bit or float) to CV_8UC4.
// Returns an empty Mat for layouts it does not know.
cv::Mat toBgra8(const cv::Mat& img);

// RGB of a BGRA pixel
Rgb pixelColor(const cv::Mat& bgra, int x, int y);

// OpenCV scalar (B, G, R) for an RGB colour
cv::Scalar toScalar(const Rgb& c);

// Area-resample a BGRA image to side x side on alpha-premultiplied data so that
// fully transparent pixels do not bleed their colour into the result.
cv::Mat resizePremultiplied(const cv::Mat& bgra, int side);

}
