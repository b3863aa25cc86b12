#include "anticaptcha/image_processing.hpp"
#include <algorithm>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <openssl/evp.h>

namespace anticaptcha {

std::string ImageProcessing::encodeImageFile(const std::string& image_path, int maxWidth) {
    cv::Mat image = readImage(image_path);
    if (maxWidth > 0) {
        image = limitWidth(image, maxWidth);
    }
    return encodeToBase64(encodeToPng(image));
}

cv::Mat ImageProcessing::readImage(const std::string& image_path) {
    cv::Mat image = cv::imread(image_path, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw std::runtime_error("Unable to open image file: " + image_path);
    }
    return image;
}

cv::Mat ImageProcessing::limitWidth(const cv::Mat& image, int maxWidth) {
    if (image.cols <= maxWidth) {
        return image;
    }
    double scale = static_cast<double>(maxWidth) / image.cols;
    int newHeight = std::max(1, static_cast<int>(image.rows * scale));

    cv::Mat resized_image;
    cv::resize(image, resized_image, cv::Size(maxWidth, newHeight), 0, 0, cv::INTER_AREA);
    return resized_image;
}

std::vector<unsigned char> ImageProcessing::encodeToPng(const cv::Mat& image) {
    std::vector<unsigned char> buf;
    if (!cv::imencode(".png", image, buf)) {
        throw std::runtime_error("Failed to encode image as PNG");
    }
    return buf;
}

std::string ImageProcessing::encodeToBase64(const std::vector<unsigned char>& data) {
    if (data.empty()) {
        return std::string();
    }
    // EVP_EncodeBlock appends a NUL terminator.
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                  data.data(), static_cast<int>(data.size()));
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

} // namespace anticaptcha
