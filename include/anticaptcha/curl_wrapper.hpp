#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <curl/curl.h>

#include "anticaptcha/errors.hpp"
#include "anticaptcha/http_transport.hpp"

namespace anticaptcha {

// A transfer that libcurl reported as failed.
class CurlError : public TransportError {
public:
    CurlError(const std::string& message, CURLcode code)
        : TransportError(message), result(code) {}

    CURLcode code() const { return result; }

private:
    CURLcode result;
};

class CurlGlobalManager {
public:
    static CurlGlobalManager& getInstance();
    CurlGlobalManager(const CurlGlobalManager&) = delete;
    CurlGlobalManager& operator=(const CurlGlobalManager&) = delete;

private:
    CurlGlobalManager();
    ~CurlGlobalManager();
};

class CurlEasyHandle {
private:
    CURL* handle;

public:
    CurlEasyHandle();
    ~CurlEasyHandle();
    CURL* get();

    CurlEasyHandle(const CurlEasyHandle&) = delete;
    CurlEasyHandle& operator=(const CurlEasyHandle&) = delete;
};

// One POST exchange. Not reusable across threads; create one per request.
class CurlWrapper {
private:
    CurlEasyHandle easyHandle;
    std::string responseBuffer;
    struct curl_slist* headers;
    std::function<bool()> abortCheck;

    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* s);
    static int ProgressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                curl_off_t ultotal, curl_off_t ulnow);

public:
    CurlWrapper();
    ~CurlWrapper();

    CurlWrapper(const CurlWrapper&) = delete;
    CurlWrapper& operator=(const CurlWrapper&) = delete;

    CurlWrapper& setUrl(const std::string& url);
    CurlWrapper& setPostFields(const std::string& data);
    CurlWrapper& addHeader(const std::string& header);
    CurlWrapper& setTimeout(std::chrono::milliseconds timeout);
    // The transfer is aborted as soon as `check` returns true.
    CurlWrapper& setAbortCheck(std::function<bool()> check);

    // Throws CurlError when the transfer itself fails. HTTP error
    // statuses are returned, not thrown.
    HttpResponse perform();
};

// A timeout no shorter than the context's remaining time is the solve
// deadline, so its expiry is reported as CancellationError.
class CurlTransport : public HttpTransport {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<std::string>& headers,
                      std::chrono::milliseconds timeout,
                      const SolveContext& context) override;
};

} // namespace anticaptcha
