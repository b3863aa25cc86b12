#include "anticaptcha/responses.hpp"
#include "anticaptcha/errors.hpp"
#include <limits>

namespace anticaptcha {

namespace {

std::optional<std::string> optionalString(const nlohmann::json& object, const char* field) {
    auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ResponseFormatError(std::string(field) + " in solution is not a string");
    }
    return it->get<std::string>();
}

const nlohmann::json& requireObject(const nlohmann::json& value, const char* what) {
    if (!value.is_object()) {
        throw ResponseFormatError(std::string("invalid ") + what + " format in response");
    }
    return value;
}

// Integer field that must fit in T; unsigned JSON values above T's range
// are rejected rather than wrapped.
template <typename T>
std::optional<T> checkedInteger(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            return std::nullopt;
        }
        return static_cast<T>(raw);
    }
    if (value.is_number_integer()) {
        auto raw = value.get<std::int64_t>();
        if (raw < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
            raw > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
            return std::nullopt;
        }
        return static_cast<T>(raw);
    }
    return std::nullopt;
}

} // namespace

std::string toString(TaskKind kind) {
    switch (kind) {
    case TaskKind::ImageToText:
        return "ImageToTextTask";
    case TaskKind::HCaptcha:
        return "HCaptchaTaskProxyless";
    }
    return "unknown";
}

void throwIfApiError(const nlohmann::json& response) {
    auto it = response.find("errorId");
    if (it == response.end()) {
        return;
    }
    auto id = checkedInteger<long>(*it);
    if (!id) {
        throw ResponseFormatError("errorId in response is not an integer");
    }
    long errorId = *id;
    if (errorId == 0) {
        return;
    }

    std::string code;
    auto codeIt = response.find("errorCode");
    if (codeIt != response.end() && codeIt->is_string()) {
        code = codeIt->get<std::string>();
    }
    std::string description;
    auto desc = response.find("errorDescription");
    if (desc != response.end() && desc->is_string()) {
        description = desc->get<std::string>();
    } else if (!code.empty()) {
        description = code;
    } else {
        description = "API error " + std::to_string(errorId);
    }
    throw APIError(errorId, code, description);
}

CreateTaskResponse CreateTaskResponse::fromJson(const nlohmann::json& response) {
    requireObject(response, "createTask response");
    throwIfApiError(response);

    auto it = response.find("taskId");
    std::optional<TaskHandle> taskId;
    if (it != response.end()) {
        taskId = checkedInteger<TaskHandle>(*it);
    }
    if (!taskId) {
        throw ResponseFormatError("failed to retrieve taskId from response");
    }
    return CreateTaskResponse{*taskId};
}

PollResponse PollResponse::fromJson(const nlohmann::json& response) {
    requireObject(response, "getTaskResult response");
    throwIfApiError(response);

    auto status = response.find("status");
    if (status == response.end() || !status->is_string()) {
        throw ResponseFormatError("status missing from task result");
    }
    std::string value = status->get<std::string>();
    if (value != "ready") {
        return PollResponse{Pending{value}};
    }

    auto solution = response.find("solution");
    if (solution == response.end()) {
        throw ResponseFormatError("solution missing from ready task result");
    }
    Ready ready{requireObject(*solution, "solution"), std::nullopt, std::nullopt};

    auto cost = response.find("cost");
    if (cost != response.end()) {
        // The service reports cost as a decimal string.
        if (cost->is_number()) {
            ready.cost = cost->get<double>();
        } else if (cost->is_string()) {
            const std::string text = cost->get<std::string>();
            std::size_t parsed = 0;
            try {
                ready.cost = std::stod(text, &parsed);
            } catch (const std::exception&) {
                throw ResponseFormatError("cost in task result is not a number");
            }
            if (parsed != text.size()) {
                throw ResponseFormatError("cost in task result is not a number");
            }
        }
    }
    auto solveCount = response.find("solveCount");
    if (solveCount != response.end() && !solveCount->is_null()) {
        ready.solveCount = checkedInteger<int>(*solveCount);
        if (!ready.solveCount) {
            throw ResponseFormatError("solveCount in task result is not an integer");
        }
    }
    return PollResponse{ready};
}

ImageSolution decodeImageSolution(const nlohmann::json& solution) {
    requireObject(solution, "solution");
    auto it = solution.find("text");
    if (it == solution.end() || !it->is_string()) {
        throw ResponseFormatError("text not found in solution");
    }
    return ImageSolution{it->get<std::string>()};
}

HCaptchaSolution decodeHCaptchaSolution(const nlohmann::json& solution) {
    requireObject(solution, "solution");
    auto it = solution.find("gRecaptchaResponse");
    if (it == solution.end() || !it->is_string()) {
        throw ResponseFormatError("gRecaptchaResponse not found in solution");
    }
    return HCaptchaSolution{it->get<std::string>(),
                            optionalString(solution, "userAgent"),
                            optionalString(solution, "respKey")};
}

Solution decodeSolution(const PollResponse::Ready& result, TaskKind kind) {
    switch (kind) {
    case TaskKind::ImageToText:
        return decodeImageSolution(result.solution);
    case TaskKind::HCaptcha:
        return decodeHCaptchaSolution(result.solution);
    }
    throw ResponseFormatError("unknown task kind");
}

} // namespace anticaptcha
