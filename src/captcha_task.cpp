#include "anticaptcha/captcha_task.hpp"
#include "anticaptcha/hcaptcha_task.hpp"
#include "anticaptcha/image_to_text_task.hpp"
#include <stdexcept>

namespace anticaptcha {

nlohmann::json CaptchaTask::prepareRequest() const {
    return nlohmann::json{{"task", preparePayload()}};
}

std::unique_ptr<CaptchaTask> CaptchaTaskFactory::createTask(
    const std::string& taskType,
    const nlohmann::json& params
) {
    if (taskType == "ImageToTextTask") {
        return std::make_unique<ImageToTextTask>(
            params.at("body").get<std::string>(),
            ImageToTextOptions::fromJson(params)
        );
    } else if (taskType == "HCaptchaTaskProxyless") {
        return std::make_unique<HCaptchaProxylessTask>(HCaptchaConfig::fromJson(params));
    } else {
        throw std::invalid_argument("Unknown task type: " + taskType);
    }
}

} // namespace anticaptcha
