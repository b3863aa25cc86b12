#include "anticaptcha/hcaptcha_task.hpp"

namespace anticaptcha {

HCaptchaConfig HCaptchaConfig::withSolution(const HCaptchaSolution& solution) const {
    HCaptchaConfig enriched = *this;
    if (solution.userAgent) {
        enriched.userAgent = solution.userAgent;
    }
    if (solution.respKey) {
        enriched.respKey = solution.respKey;
    }
    return enriched;
}

HCaptchaConfig HCaptchaConfig::fromJson(const nlohmann::json& params) {
    HCaptchaConfig config;
    config.websiteURL = params.at("websiteURL").get<std::string>();
    config.websiteKey = params.at("websiteKey").get<std::string>();
    config.isInvisible = params.value("isInvisible", false);
    config.isEnterprise = params.value("isEnterprise", false);
    if (params.contains("enterprisePayload") && !params["enterprisePayload"].is_null()) {
        config.enterprisePayload = params["enterprisePayload"];
    }
    if (params.contains("softId") && !params["softId"].is_null()) {
        config.softId = params["softId"].get<int>();
    }
    if (params.contains("userAgent") && !params["userAgent"].is_null()) {
        config.userAgent = params["userAgent"].get<std::string>();
    }
    return config;
}

HCaptchaProxylessTask::HCaptchaProxylessTask(HCaptchaConfig config)
    : config(std::move(config)) {}

nlohmann::json HCaptchaProxylessTask::preparePayload() const {
    nlohmann::json payload{
        {"type", type()},
        {"websiteURL", config.websiteURL},
        {"websiteKey", config.websiteKey},
        {"isInvisible", config.isInvisible},
        {"isEnterprise", config.isEnterprise}
    };
    if (config.enterprisePayload) {
        payload["enterprisePayload"] = *config.enterprisePayload;
    }
    if (config.userAgent) {
        payload["userAgent"] = *config.userAgent;
    }
    return payload;
}

nlohmann::json HCaptchaProxylessTask::prepareRequest() const {
    nlohmann::json request = CaptchaTask::prepareRequest();
    // softId belongs next to "task", not inside it.
    if (config.softId) {
        request["softId"] = *config.softId;
    }
    return request;
}

} // namespace anticaptcha
