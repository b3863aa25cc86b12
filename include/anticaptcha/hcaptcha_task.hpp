#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "anticaptcha/captcha_task.hpp"

namespace anticaptcha {

struct HCaptchaConfig {
    std::string websiteURL;
    std::string websiteKey;
    bool isInvisible = false;
    bool isEnterprise = false;
    std::optional<nlohmann::json> enterprisePayload;
    std::optional<int> softId;
    std::optional<std::string> userAgent;
    std::optional<std::string> respKey;

    // Copy of this config carrying the user agent and response key the
    // service reported with `solution`.
    HCaptchaConfig withSolution(const HCaptchaSolution& solution) const;

    static HCaptchaConfig fromJson(const nlohmann::json& params);
};

class HCaptchaProxylessTask : public CaptchaTask {
private:
    HCaptchaConfig config;

protected:
    nlohmann::json preparePayload() const override;

public:
    explicit HCaptchaProxylessTask(HCaptchaConfig config);

    TaskKind kind() const override { return TaskKind::HCaptcha; }
    std::string type() const override { return "HCaptchaTaskProxyless"; }
    nlohmann::json prepareRequest() const override;
};

} // namespace anticaptcha
