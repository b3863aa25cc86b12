#pragma once

#include <string>

#include "anticaptcha/client.hpp"
#include "anticaptcha/hcaptcha_task.hpp"
#include "anticaptcha/image_to_text_task.hpp"
#include "anticaptcha/responses.hpp"

namespace anticaptcha {

// Create / poll / decode workflows on top of a Client. The client must
// outlive the solver.
class Solver {
public:
    explicit Solver(const Client& client);

    TaskHandle createTask(const CaptchaTask& task, const SolveContext& context) const;
    TaskHandle createImageTask(const std::string& imageData,
                               const SolveContext& context,
                               const ImageToTextOptions& options = {}) const;
    TaskHandle createHCaptchaTask(const HCaptchaConfig& config,
                                  const SolveContext& context) const;

    // Polls /getTaskResult every pollInterval until the task is ready.
    // Never polls again after a ready response.
    PollResponse::Ready pollUntilReady(TaskHandle handle, const SolveContext& context) const;

    Solution solve(const CaptchaTask& task, const SolveContext& context) const;

    // Each runs inside a fresh context bounded by the client's solveTimeout.
    std::string solveImage(const std::string& imageData,
                           const ImageToTextOptions& options = {}) const;
    HCaptchaSolution solveHCaptcha(const HCaptchaConfig& config) const;

    std::string solveImage(const std::string& imageData,
                           const ImageToTextOptions& options,
                           const SolveContext& context) const;
    HCaptchaSolution solveHCaptcha(const HCaptchaConfig& config,
                                   const SolveContext& context) const;

private:
    const Client& client;
};

} // namespace anticaptcha
