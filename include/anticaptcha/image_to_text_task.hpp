#pragma once

#include <optional>
#include <string>

#include "anticaptcha/captcha_task.hpp"

namespace anticaptcha {

// Optional ImageToTextTask hints. Unset fields are left out of the payload.
struct ImageToTextOptions {
    std::optional<bool> phrase;
    std::optional<bool> caseSensitive;
    std::optional<int> numeric;  // 0 any, 1 digits only, 2 no digits
    std::optional<bool> math;
    std::optional<int> minLength;
    std::optional<int> maxLength;
    std::optional<std::string> comment;
    std::optional<std::string> websiteURL;

    static ImageToTextOptions fromJson(const nlohmann::json& params);
};

class ImageToTextTask : public CaptchaTask {
private:
    std::string body;
    ImageToTextOptions options;

protected:
    nlohmann::json preparePayload() const override;

public:
    // `imageData` is base64 and is forwarded without validation.
    explicit ImageToTextTask(std::string imageData, ImageToTextOptions options = {});

    TaskKind kind() const override { return TaskKind::ImageToText; }
    std::string type() const override { return "ImageToTextTask"; }
};

} // namespace anticaptcha
