#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "anticaptcha/http_transport.hpp"
#include "anticaptcha/logger.hpp"
#include "anticaptcha/solve_context.hpp"

namespace anticaptcha {

struct ClientConfig {
    std::string apiKey;
    std::string baseUrl = "https://api.anti-captcha.com";
    std::chrono::milliseconds httpTimeout{60000};
    std::chrono::milliseconds pollInterval{2000};
    std::chrono::milliseconds solveTimeout{60000};
    std::optional<int> softId;
};

// Authenticated JSON-over-HTTP exchange with the service. Holds no per-call
// state, so one instance can serve concurrent solve operations.
class Client {
public:
    // A null transport selects CurlTransport; a null logger selects a
    // StreamLogger on std::cout owned by this client.
    explicit Client(ClientConfig config,
                    std::shared_ptr<HttpTransport> transport = nullptr,
                    std::shared_ptr<Logger> logger = nullptr);

    // POSTs `body` (with clientKey added) to `endpoint` and returns the
    // decoded JSON object. One round-trip, no retries.
    nlohmann::json request(const std::string& endpoint,
                           nlohmann::json body,
                           const SolveContext& context) const;

    double getBalance() const;
    double getBalance(const SolveContext& context) const;

    const ClientConfig& config() const { return cfg; }
    Logger& logger() const { return *log; }

private:
    std::string buildUrl(const std::string& endpoint) const;

    ClientConfig cfg;
    std::shared_ptr<HttpTransport> transport;
    std::shared_ptr<Logger> log;
};

} // namespace anticaptcha
