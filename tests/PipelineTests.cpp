#include "LiteTest.hpp"
#include "codec/codec.hpp"
#include "pipeline/pipeline.hpp"
#include "util/PipelineError.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <string>
#include <vector>

using namespace squarify;

namespace
{
    bool sameImage(const cv::Mat& a, const cv::Mat& b)
    {
        return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0.0;
    }

    std::vector<uchar> encodeAs(const std::string& ext, const cv::Mat& img)
    {
        std::vector<uchar> buf;
        cv::imencode(ext, img, buf);
        return buf;
    }

    // 60x30 white BGR image with a dark block in the middle
    cv::Mat product()
    {
        cv::Mat img(30, 60, CV_8UC3, cv::Scalar(255, 255, 255));
        img(cv::Rect(20, 10, 20, 10)).setTo(cv::Scalar(40, 30, 20));
        return img;
    }
}

static void TestPlainRun()
{
    PipelineResult r = runPipeline(encodeAs(".png", product()), 500);
    EXPECT_EQ(r.inputWidth, 60);
    EXPECT_EQ(r.inputHeight, 30);
    EXPECT_EQ(r.naturalMaxSize, 60);
    EXPECT_EQ(r.usedSize, 60);
    EXPECT_FALSE(r.detectedColor.has_value());
    EXPECT_TRUE(r.detectedHex.empty());
    ASSERT_TRUE(r.image.type() == CV_8UC4);
    EXPECT_EQ(r.image.cols, 60);

    // Opaque content, transparent padding
    EXPECT_EQ(r.image.at<cv::Vec4b>(30, 30)[3], 255);
    EXPECT_EQ(r.image.at<cv::Vec4b>(0, 0)[3], 0);
    EXPECT_EQ(r.image.at<cv::Vec4b>(59, 59)[3], 0);
}

static void TestPngRoundTrip()
{
    TransparencySettings t;
    t.enabled = true;
    PipelineResult r = runPipeline(encodeAs(".png", product()), 24, t);
    EXPECT_EQ(r.usedSize, 24);

    cv::Mat back = decodeImage(r.png);
    EXPECT_TRUE(sameImage(back, r.image));

    cv::Mat raw = cv::imdecode(r.png, cv::IMREAD_UNCHANGED);
    EXPECT_EQ(raw.channels(), 4);
    EXPECT_EQ(raw.depth(), CV_8U);
}

static void TestIdempotent()
{
    const std::vector<uchar> in = encodeAs(".png", product());
    SquareSettings s(40);
    s.transparency.enabled = true;
    s.transparency.autoDetect = true;

    PipelineResult a = runPipeline(in, s);
    PipelineResult b = runPipeline(in, s);
    EXPECT_TRUE(a.png == b.png);
}

static void TestAutoDetectReported()
{
    cv::Mat img = product();
    img.at<cv::Vec3b>(0, 0) = cv::Vec3b(30, 20, 10);

    SquareSettings s(60);
    s.transparency.enabled = true;
    s.transparency.autoDetect = true;
    s.transparency.mode = TransparencyMode::ExactMatch;
    s.transparency.color = Rgb(255, 255, 255);

    PipelineResult r = runPipeline(encodeAs(".png", img), s);
    ASSERT_TRUE(r.detectedColor.has_value());
    EXPECT_TRUE(*r.detectedColor == Rgb(10, 20, 30));
    EXPECT_EQ(r.detectedHex, std::string("#0a141e"));

    // Corner pixel sits at offsetY 15 after centering and is now clear; white stays opaque
    EXPECT_EQ(r.image.at<cv::Vec4b>(15, 0)[3], 0);
    EXPECT_EQ(r.image.at<cv::Vec4b>(15, 1)[3], 255);
}

static void TestExactMatchWhiteBackground()
{
    SquareSettings s(60);
    s.transparency.enabled = true;
    s.transparency.mode = TransparencyMode::ExactMatch;

    PipelineResult r = runPipeline(encodeAs(".png", product()), s);
    EXPECT_FALSE(r.detectedColor.has_value());
    EXPECT_EQ(r.image.at<cv::Vec4b>(15, 5)[3], 0);     // white background
    EXPECT_EQ(r.image.at<cv::Vec4b>(30, 30)[3], 255);  // dark block
}

static void TestGrayAndLossyInputs()
{
    cv::Mat gray(10, 4, CV_8UC1, cv::Scalar(77));
    PipelineResult g = runPipeline(encodeAs(".png", gray), 10);
    ASSERT_TRUE(g.image.type() == CV_8UC4);
    EXPECT_TRUE(g.image.at<cv::Vec4b>(5, 5) == cv::Vec4b(77, 77, 77, 255));

    PipelineResult j = runPipeline(encodeAs(".jpg", product()), 16);
    EXPECT_EQ(j.naturalMaxSize, 60);
    EXPECT_EQ(j.usedSize, 16);
}

static void TestSixteenBitInput()
{
    cv::Mat deep(2, 2, CV_16UC3, cv::Scalar(65535, 65535, 65535));
    deep.row(1).setTo(cv::Scalar(257, 257, 257));

    cv::Mat img = decodeImage(encodeAs(".png", deep));
    ASSERT_TRUE(img.type() == CV_8UC4);
    EXPECT_TRUE(img.at<cv::Vec4b>(0, 0) == cv::Vec4b(255, 255, 255, 255));
    EXPECT_TRUE(img.at<cv::Vec4b>(1, 1) == cv::Vec4b(1, 1, 1, 255));

    PipelineResult r = runPipeline(encodeAs(".png", deep), 2);
    EXPECT_TRUE(r.image.at<cv::Vec4b>(1, 0) == cv::Vec4b(1, 1, 1, 255));
}

static void TestErrors()
{
    const std::vector<uchar> good = encodeAs(".png", product());
    EXPECT_PIPELINE_ERROR(runPipeline(good, 0), ErrorKind::InvalidParameter);
    EXPECT_PIPELINE_ERROR(runPipeline(good, -10), ErrorKind::InvalidParameter);

    // Parameters are checked before decoding
    EXPECT_PIPELINE_ERROR(runPipeline(std::vector<uchar>{ 1, 2, 3 }, 0), ErrorKind::InvalidParameter);

    EXPECT_PIPELINE_ERROR(runPipeline(std::vector<uchar>{}, 10), ErrorKind::Decode);
    std::vector<uchar> junk(256, 0x5a);
    EXPECT_PIPELINE_ERROR(runPipeline(junk, 10), ErrorKind::Decode);
    std::vector<uchar> truncated(good.begin(), good.begin() + 16);
    EXPECT_PIPELINE_ERROR(runPipeline(truncated, 10), ErrorKind::Decode);

    SquareSettings badLevel(10);
    badLevel.pngCompression = 12;
    EXPECT_PIPELINE_ERROR(runPipeline(good, badLevel), ErrorKind::InvalidParameter);

    SquareSettings badColor(10);
    badColor.transparency.enabled = true;
    badColor.transparency.color = Rgb(0, 0, 256);
    EXPECT_PIPELINE_ERROR(runPipeline(good, badColor), ErrorKind::InvalidParameter);

    EXPECT_PIPELINE_ERROR(encodePng(cv::Mat(2, 2, CV_8UC3)), ErrorKind::Encode);
}

int main()
{
    TestPlainRun();
    TestPngRoundTrip();
    TestIdempotent();
    TestAutoDetectReported();
    TestExactMatchWhiteBackground();
    TestGrayAndLossyInputs();
    TestSixteenBitInput();
    TestErrors();
    return finishTests("squarify_pipeline_tests");
}
