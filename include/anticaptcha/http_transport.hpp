#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "anticaptcha/solve_context.hpp"

namespace anticaptcha {

struct HttpResponse {
    long status = 0;
    std::string body;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Performs exactly one POST. Throws TransportError on transfer failure
    // and CancellationError when `context` fires mid-transfer.
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<std::string>& headers,
                              std::chrono::milliseconds timeout,
                              const SolveContext& context) = 0;
};

} // namespace anticaptcha
