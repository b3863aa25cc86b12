#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include "anticaptcha/image_processing.hpp"

using namespace anticaptcha;

TEST(ImageProcessingTest, Base64KnownVectors) {
    auto bytes = [](const std::string& s) { return std::vector<unsigned char>(s.begin(), s.end()); };
    EXPECT_EQ(ImageProcessing::encodeToBase64(bytes("")), "");
    EXPECT_EQ(ImageProcessing::encodeToBase64(bytes("M")), "TQ==");
    EXPECT_EQ(ImageProcessing::encodeToBase64(bytes("Ma")), "TWE=");
    EXPECT_EQ(ImageProcessing::encodeToBase64(bytes("Man")), "TWFu");
}

TEST(ImageProcessingTest, PngEncodingDecodesBackToSameSize) {
    cv::Mat image(12, 40, CV_8UC3, cv::Scalar(10, 200, 30));
    std::vector<unsigned char> png = ImageProcessing::encodeToPng(image);
    ASSERT_GT(png.size(), 8u);
    EXPECT_EQ(png[1], 'P');

    cv::Mat decoded = cv::imdecode(png, cv::IMREAD_COLOR);
    EXPECT_EQ(decoded.cols, 40);
    EXPECT_EQ(decoded.rows, 12);
}

TEST(ImageProcessingTest, LimitWidthKeepsAspectRatio) {
    cv::Mat wide(50, 400, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat limited = ImageProcessing::limitWidth(wide, 200);
    EXPECT_EQ(limited.cols, 200);
    EXPECT_EQ(limited.rows, 25);

    cv::Mat narrow(50, 100, CV_8UC3, cv::Scalar(0, 0, 0));
    EXPECT_EQ(ImageProcessing::limitWidth(narrow, 200).cols, 100);
}

TEST(ImageProcessingTest, MissingFileThrows) {
    EXPECT_THROW(ImageProcessing::encodeImageFile("/nonexistent/captcha.png"), std::runtime_error);
}
