#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace anticaptcha {

class ImageProcessing {
public:
    ImageProcessing() = default;
    ~ImageProcessing() = default;

    // Loads a captcha image and returns it PNG-encoded in base64, ready for
    // ImageToTextTask. A positive maxWidth downsizes wider images.
    static std::string encodeImageFile(const std::string& image_path, int maxWidth = 0);

    static cv::Mat readImage(const std::string& image_path);
    static cv::Mat limitWidth(const cv::Mat& image, int maxWidth);
    static std::vector<unsigned char> encodeToPng(const cv::Mat& image);
    static std::string encodeToBase64(const std::vector<unsigned char>& data);
};

} // namespace anticaptcha
