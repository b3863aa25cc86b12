#include "anticaptcha/client.hpp"
#include "anticaptcha/curl_wrapper.hpp"
#include "anticaptcha/errors.hpp"
#include "anticaptcha/responses.hpp"
#include <algorithm>
#include <stdexcept>
#include <fmt/format.h>

namespace anticaptcha {

Client::Client(ClientConfig config,
               std::shared_ptr<HttpTransport> transport,
               std::shared_ptr<Logger> logger)
    : cfg(std::move(config)), transport(std::move(transport)), log(std::move(logger)) {
    if (cfg.apiKey.empty()) {
        throw std::invalid_argument("API key must not be empty");
    }
    if (!this->transport) {
        this->transport = std::make_shared<CurlTransport>();
    }
    if (!log) {
        log = std::make_shared<StreamLogger>();
    }
}

std::string Client::buildUrl(const std::string& endpoint) const {
    auto hasScheme = [](const std::string& url) {
        return url.rfind("https://", 0) == 0 || url.rfind("http://", 0) == 0;
    };
    if (!hasScheme(cfg.baseUrl) || cfg.baseUrl.find(' ') != std::string::npos) {
        throw TransportError("invalid base URL: " + cfg.baseUrl);
    }
    if (endpoint.empty() || endpoint.front() != '/' || endpoint.find(' ') != std::string::npos) {
        throw TransportError("invalid endpoint: " + endpoint);
    }

    std::string base = cfg.baseUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + endpoint;
}

nlohmann::json Client::request(const std::string& endpoint,
                               nlohmann::json body,
                               const SolveContext& context) const {
    std::string url;
    try {
        url = buildUrl(endpoint);
    } catch (const TransportError& e) {
        log->error(fmt::format("Error building URL for {}: {}", endpoint, e.what()));
        throw;
    }

    body["clientKey"] = cfg.apiKey;

    std::string payload;
    try {
        payload = body.dump();
    } catch (const nlohmann::json::exception& e) {
        log->error(fmt::format("Error serializing request body for {}: {}", endpoint, e.what()));
        throw TransportError(fmt::format("failed to serialize request body for {}: {}", endpoint, e.what()));
    }

    try {
        context.throwIfDone(endpoint);
    } catch (const CancellationError& e) {
        log->warn(fmt::format("Not sending request to {}: {}", endpoint, e.what()));
        throw;
    }

    auto timeout = std::min(cfg.httpTimeout, context.remaining());
    log->info(fmt::format("Sending request to {} ({} bytes)", url, payload.size()));

    HttpResponse response;
    try {
        response = transport->post(url, payload, {"Content-Type: application/json"}, timeout, context);
    } catch (const Error& e) {
        log->error(fmt::format("Request to {} failed: {}", endpoint, e.what()));
        throw;
    } catch (const std::exception& e) {
        log->error(fmt::format("Request to {} failed: {}", endpoint, e.what()));
        throw TransportError(fmt::format("request to {} failed: {}", endpoint, e.what()));
    }

    if (response.status < 200 || response.status >= 300) {
        log->error(fmt::format("Received non-2xx status code {} from {} ({} bytes)",
                               response.status, endpoint, response.body.size()));
        throw TransportError(fmt::format("non-2xx status code from {}: {}", endpoint, response.status),
                             response.status);
    }

    nlohmann::json decoded;
    try {
        decoded = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        log->error(fmt::format("Error decoding response from {}: {}", endpoint, e.what()));
        throw TransportError(fmt::format("failed to decode response from {}: {}", endpoint, e.what()),
                             response.status);
    }
    if (!decoded.is_object()) {
        log->error(fmt::format("Response from {} is not a JSON object", endpoint));
        throw TransportError(fmt::format("failed to decode response from {}: not a JSON object", endpoint),
                             response.status);
    }

    log->debug(fmt::format("Received response from {}: status {}, {} bytes",
                           endpoint, response.status, response.body.size()));
    return decoded;
}

double Client::getBalance() const {
    SolveContext context(cfg.httpTimeout);
    return getBalance(context);
}

double Client::getBalance(const SolveContext& context) const {
    nlohmann::json response = request("/getBalance", nlohmann::json::object(), context);
    try {
        throwIfApiError(response);
    } catch (const Error& e) {
        log->error(fmt::format("Failed to get balance: {}", e.what()));
        throw;
    }

    auto it = response.find("balance");
    if (it == response.end() || !it->is_number()) {
        log->error("Balance missing from getBalance response");
        throw ResponseFormatError("failed to retrieve balance from response");
    }
    return it->get<double>();
}

} // namespace anticaptcha
