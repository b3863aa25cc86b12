#include <iostream>
#include <string>
#include <string_view>
#include <optional>
#include <variant>
#include <filesystem>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <nlohmann/json.hpp>

#include "anticaptcha/client.hpp"
#include "anticaptcha/errors.hpp"
#include "anticaptcha/image_processing.hpp"
#include "anticaptcha/logger.hpp"
#include "anticaptcha/solver.hpp"
#include <cxxopts.hpp>

namespace fs = std::filesystem;

std::optional<std::string> getEnvVar(std::string_view key) {
    if (auto val = std::getenv(key.data()))
        return std::string(val);
    return std::nullopt;
}

struct Failure {
    std::string message;
};

template<typename T>
using Result = std::variant<T, Failure>;

template<typename T, typename F>
Result<T> runSolve(F&& solve) {
    try {
        return solve();
    } catch (const std::exception& e) {
        return Failure{e.what()};
    }
}

template<typename T>
int processResult(const Result<T>& result) {
    if (auto error = std::get_if<Failure>(&result)) {
        std::cerr << "Error: " << error->message << std::endl;
        return 1;
    }
    return 0;
}

int main(int argc, char** argv)
{
    cxxopts::Options options("anticaptcha_cli", "Solve image and hCaptcha challenges with the anti-captcha.com API");
    options.add_options()
        ("h,help", "Print help")
        ("t,task", "Task type: image or hcaptcha", cxxopts::value<std::string>()->default_value("image"))
        ("i,input", "Captcha image file (image task)", cxxopts::value<std::string>())
        ("max-width", "Downsize images wider than this before upload", cxxopts::value<int>()->default_value("0"))
        ("u,url", "Website URL (hcaptcha task)", cxxopts::value<std::string>())
        ("k,sitekey", "Website key (hcaptcha task)", cxxopts::value<std::string>())
        ("invisible", "The hCaptcha widget is invisible")
        ("timeout", "Solve timeout in seconds", cxxopts::value<int>()->default_value("60"))
        ("balance", "Print the account balance and exit")
        ("v,verbose", "Log debug messages");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    auto apiKey = getEnvVar("ANTICAPTCHA_KEY");
    if (!apiKey) {
        std::cerr << "Error: ANTICAPTCHA_KEY environment variable is not set." << std::endl;
        return 1;
    }

    anticaptcha::ClientConfig config;
    config.apiKey = *apiKey;
    config.solveTimeout = std::chrono::seconds(result["timeout"].as<int>());

    auto logger = std::make_shared<anticaptcha::StreamLogger>(std::cerr, "AntiCaptcha: ", result.count("verbose") > 0);
    anticaptcha::Client client(config, nullptr, logger);
    anticaptcha::Solver solver(client);

    if (result.count("balance")) {
        const auto balance = runSolve<double>([&] { return client.getBalance(); });
        if (auto value = std::get_if<double>(&balance)) {
            std::cout << "Balance: " << *value << std::endl;
        }
        return processResult(balance);
    }

    const std::string taskType = result["task"].as<std::string>();

    if (taskType == "image") {
        if (!result.count("input")) {
            std::cerr << "Error: --input is required for image tasks." << std::endl;
            return 1;
        }
        const fs::path image_path = result["input"].as<std::string>();
        if (!fs::exists(image_path)) {
            std::cerr << "Error: Image file does not exist." << std::endl;
            return 1;
        }

        const auto text = runSolve<std::string>([&] {
            std::string body = anticaptcha::ImageProcessing::encodeImageFile(
                image_path.string(), result["max-width"].as<int>());
            return solver.solveImage(body);
        });
        if (auto value = std::get_if<std::string>(&text)) {
            std::cout << *value << std::endl;
        }
        return processResult(text);
    }
    else if (taskType == "hcaptcha") {
        if (!result.count("url") || !result.count("sitekey")) {
            std::cerr << "Error: --url and --sitekey are required for hcaptcha tasks." << std::endl;
            return 1;
        }
        anticaptcha::HCaptchaConfig hcaptcha;
        hcaptcha.websiteURL = result["url"].as<std::string>();
        hcaptcha.websiteKey = result["sitekey"].as<std::string>();
        hcaptcha.isInvisible = result.count("invisible") > 0;

        const auto solution = runSolve<anticaptcha::HCaptchaSolution>([&] {
            return solver.solveHCaptcha(hcaptcha);
        });
        if (auto value = std::get_if<anticaptcha::HCaptchaSolution>(&solution)) {
            const auto solved = hcaptcha.withSolution(*value);
            nlohmann::json out{{"gRecaptchaResponse", value->token}};
            if (solved.userAgent) out["userAgent"] = *solved.userAgent;
            if (solved.respKey) out["respKey"] = *solved.respKey;
            std::cout << out.dump(2) << std::endl;
        }
        return processResult(solution);
    }
    else {
        std::cerr << "Error: Invalid task type." << std::endl;
        return 1;
    }
}
