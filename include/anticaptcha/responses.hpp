#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace anticaptcha {

using TaskHandle = std::int64_t;

enum class TaskKind {
    ImageToText,
    HCaptcha
};

std::string toString(TaskKind kind);

// Throws APIError if `response` carries a non-zero errorId and
// ResponseFormatError if errorId is present but not an integer.
void throwIfApiError(const nlohmann::json& response);

struct CreateTaskResponse {
    TaskHandle taskId = 0;

    static CreateTaskResponse fromJson(const nlohmann::json& response);
};

struct PollResponse {
    struct Pending {
        std::string status;
    };

    struct Ready {
        nlohmann::json solution;
        std::optional<double> cost;
        std::optional<int> solveCount;
    };

    std::variant<Pending, Ready> state;

    bool ready() const { return std::holds_alternative<Ready>(state); }

    static PollResponse fromJson(const nlohmann::json& response);
};

struct ImageSolution {
    std::string text;
};

struct HCaptchaSolution {
    std::string token;
    std::optional<std::string> userAgent;
    std::optional<std::string> respKey;
};

using Solution = std::variant<ImageSolution, HCaptchaSolution>;

ImageSolution decodeImageSolution(const nlohmann::json& solution);
HCaptchaSolution decodeHCaptchaSolution(const nlohmann::json& solution);
Solution decodeSolution(const PollResponse::Ready& result, TaskKind kind);

} // namespace anticaptcha
