#pragma once

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "anticaptcha/responses.hpp"

namespace anticaptcha {

class CaptchaTask {
public:
    virtual ~CaptchaTask() = default;

    virtual TaskKind kind() const = 0;
    virtual std::string type() const = 0;

    // The createTask request without clientKey: {"task": preparePayload()}
    // plus whatever top-level fields the task needs.
    virtual nlohmann::json prepareRequest() const;

protected:
    // The "task" object sent to /createTask.
    virtual nlohmann::json preparePayload() const = 0;
};

class CaptchaTaskFactory {
public:
    // taskType is "ImageToTextTask" (params: body, plus option fields) or
    // "HCaptchaTaskProxyless" (params: websiteURL, websiteKey, ...).
    static std::unique_ptr<CaptchaTask> createTask(const std::string& taskType,
                                                   const nlohmann::json& params);
};

} // namespace anticaptcha
