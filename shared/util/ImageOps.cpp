#include "util/ImageOps.hpp"
#include <opencv2/imgproc.hpp>
#include <vector>

namespace squarify::util {

cv::Mat toBgra8(const cv::Mat& img)
{
    if (img.empty()) return cv::Mat();

    cv::Mat img8;
    switch (img.depth())
    {
    case CV_8U: img8 = img; break;
    case CV_16U: img.convertTo(img8, CV_8U, 1.0 / 257.0); break;
    case CV_32F: img.convertTo(img8, CV_8U, 255.0); break;
    default: return cv::Mat();
    }

    cv::Mat bgra;
    switch (img8.channels())
    {
    case 1: cv::cvtColor(img8, bgra, cv::COLOR_GRAY2BGRA); break;
    case 3: cv::cvtColor(img8, bgra, cv::COLOR_BGR2BGRA); break;
    case 4: bgra = img8.clone(); break;
    default: return cv::Mat();
    }
    return bgra;
}

Rgb pixelColor(const cv::Mat& bgra, int x, int y)
{
    const cv::Vec4b& p = bgra.at<cv::Vec4b>(y, x);
    return Rgb(p[2], p[1], p[0]);
}

cv::Scalar toScalar(const Rgb& c)
{
    return cv::Scalar(c.b, c.g, c.r); // OpenCV uses BGR
}

cv::Mat resizePremultiplied(const cv::Mat& bgra, int side)
{
    cv::Mat f;
    bgra.convertTo(f, CV_32FC4, 1.0 / 255.0);

    std::vector<cv::Mat> ch;
    cv::split(f, ch);
    for (int i = 0; i < 3; ++i) ch[i] = ch[i].mul(ch[3]);
    cv::merge(ch, f);

    cv::Mat resized;
    cv::resize(f, resized, cv::Size(side, side), 0, 0, cv::INTER_AREA);

    cv::split(resized, ch);
    cv::Mat covered = ch[3] > 0.0f;
    for (int i = 0; i < 3; ++i)
    {
        cv::Mat unpremul;
        cv::divide(ch[i], ch[3], unpremul);
        cv::Mat out = cv::Mat::zeros(ch[3].size(), CV_32F);
        unpremul.copyTo(out, covered); // alpha 0 keeps RGB 0
        ch[i] = out;
    }
    cv::merge(ch, resized);

    cv::Mat out;
    resized.convertTo(out, CV_8UC4, 255.0);
    return out;
}

}
