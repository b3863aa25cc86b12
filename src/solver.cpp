#include "anticaptcha/solver.hpp"
#include "anticaptcha/errors.hpp"
#include <fmt/format.h>

namespace anticaptcha {

Solver::Solver(const Client& client) : client(client) {}

TaskHandle Solver::createTask(const CaptchaTask& task, const SolveContext& context) const {
    Logger& log = client.logger();
    nlohmann::json body = task.prepareRequest();
    if (!body.contains("softId") && client.config().softId) {
        body["softId"] = *client.config().softId;
    }

    log.info(fmt::format("Creating task for {} captcha...", task.type()));

    try {
        nlohmann::json response = client.request("/createTask", std::move(body), context);
        TaskHandle handle = CreateTaskResponse::fromJson(response).taskId;
        log.info(fmt::format("Task created successfully with ID: {}", handle));
        return handle;
    } catch (const APIError& e) {
        log.error(fmt::format("API error creating {} task: {}", task.type(), e.what()));
        throw;
    } catch (const Error& e) {
        log.error(fmt::format("Failed to create {} task: {}", task.type(), e.what()));
        throw;
    }
}

TaskHandle Solver::createImageTask(const std::string& imageData,
                                   const SolveContext& context,
                                   const ImageToTextOptions& options) const {
    return createTask(ImageToTextTask(imageData, options), context);
}

TaskHandle Solver::createHCaptchaTask(const HCaptchaConfig& config,
                                      const SolveContext& context) const {
    return createTask(HCaptchaProxylessTask(config), context);
}

PollResponse::Ready Solver::pollUntilReady(TaskHandle handle, const SolveContext& context) const {
    Logger& log = client.logger();
    const nlohmann::json body{{"taskId", handle}};

    for (int attempt = 1;; ++attempt) {
        log.debug(fmt::format("Checking result for task ID: {}", handle));

        PollResponse poll;
        try {
            poll = PollResponse::fromJson(client.request("/getTaskResult", body, context));
        } catch (const Error& e) {
            log.error(fmt::format("Failed to get result for task {}: {}", handle, e.what()));
            throw;
        }

        if (auto ready = std::get_if<PollResponse::Ready>(&poll.state)) {
            log.info(fmt::format("Task ID {} is ready after {} poll(s)", handle, attempt));
            if (ready->cost) {
                log.info(fmt::format("Task ID {} cost {}", handle, *ready->cost));
            }
            return *ready;
        }

        const auto& pending = std::get<PollResponse::Pending>(poll.state);
        log.info(fmt::format("Task ID {} is still {}...", handle, pending.status));

        if (!context.waitFor(client.config().pollInterval)) {
            std::string reason = context.cancelled() ? "cancelled" : "deadline exceeded";
            log.warn(fmt::format("Stopped waiting for task {}: {}", handle, reason));
            throw CancellationError(fmt::format("waiting for task {}: {}", handle, reason));
        }
    }
}

Solution Solver::solve(const CaptchaTask& task, const SolveContext& context) const {
    TaskHandle handle = createTask(task, context);
    PollResponse::Ready ready = pollUntilReady(handle, context);
    try {
        return decodeSolution(ready, task.kind());
    } catch (const ResponseFormatError& e) {
        client.logger().error(fmt::format("Invalid solution for task {}: {}", handle, e.what()));
        throw;
    }
}

std::string Solver::solveImage(const std::string& imageData,
                               const ImageToTextOptions& options) const {
    SolveContext context(client.config().solveTimeout);
    return solveImage(imageData, options, context);
}

std::string Solver::solveImage(const std::string& imageData,
                               const ImageToTextOptions& options,
                               const SolveContext& context) const {
    Solution solution = solve(ImageToTextTask(imageData, options), context);
    std::string text = std::get<ImageSolution>(solution).text;
    client.logger().info(fmt::format("Captcha solved successfully: {}", text));
    return text;
}

HCaptchaSolution Solver::solveHCaptcha(const HCaptchaConfig& config) const {
    SolveContext context(client.config().solveTimeout);
    return solveHCaptcha(config, context);
}

HCaptchaSolution Solver::solveHCaptcha(const HCaptchaConfig& config,
                                       const SolveContext& context) const {
    Solution solution = solve(HCaptchaProxylessTask(config), context);
    HCaptchaSolution result = std::get<HCaptchaSolution>(std::move(solution));
    client.logger().info(fmt::format("HCaptcha solved successfully ({} byte token)", result.token.size()));
    return result;
}

} // namespace anticaptcha
