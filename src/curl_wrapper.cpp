#include "anticaptcha/curl_wrapper.hpp"
#include "anticaptcha/errors.hpp"
#include <new>

namespace anticaptcha {

// CurlGlobalManager implementation
CurlGlobalManager& CurlGlobalManager::getInstance() {
    static CurlGlobalManager instance;
    return instance;
}

CurlGlobalManager::CurlGlobalManager() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw TransportError("Failed to initialize libcurl");
    }
}

CurlGlobalManager::~CurlGlobalManager() {
    curl_global_cleanup();
}

// CurlEasyHandle implementation
CurlEasyHandle::CurlEasyHandle() : handle(curl_easy_init()) {
    if (!handle) {
        throw TransportError("Failed to create CURL handle");
    }
}

CurlEasyHandle::~CurlEasyHandle() {
    if (handle) {
        curl_easy_cleanup(handle);
    }
}

CURL* CurlEasyHandle::get() {
    return handle;
}

// CurlWrapper implementation
size_t CurlWrapper::WriteCallback(void* contents, size_t size, size_t nmemb, std::string* s) {
    size_t newLength = size * nmemb;
    try {
        s->append(static_cast<char*>(contents), newLength);
        return newLength;
    } catch (std::bad_alloc&) {
        return 0;
    }
}

int CurlWrapper::ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* self = static_cast<CurlWrapper*>(clientp);
    return (self->abortCheck && self->abortCheck()) ? 1 : 0;
}

CurlWrapper::CurlWrapper() : headers(nullptr) {
    CurlGlobalManager::getInstance(); // Ensure global initialization
    curl_easy_setopt(easyHandle.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(easyHandle.get(), CURLOPT_WRITEDATA, &responseBuffer);
    curl_easy_setopt(easyHandle.get(), CURLOPT_NOSIGNAL, 1L);
}

CurlWrapper::~CurlWrapper() {
    if (headers) {
        curl_slist_free_all(headers);
    }
}

CurlWrapper& CurlWrapper::setUrl(const std::string& url) {
    curl_easy_setopt(easyHandle.get(), CURLOPT_URL, url.c_str());
    return *this;
}

CurlWrapper& CurlWrapper::setPostFields(const std::string& data) {
    // Size first: COPYPOSTFIELDS copies exactly POSTFIELDSIZE bytes.
    curl_easy_setopt(easyHandle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(data.length()));
    curl_easy_setopt(easyHandle.get(), CURLOPT_COPYPOSTFIELDS, data.c_str());
    return *this;
}

CurlWrapper& CurlWrapper::addHeader(const std::string& header) {
    headers = curl_slist_append(headers, header.c_str());
    return *this;
}

CurlWrapper& CurlWrapper::setTimeout(std::chrono::milliseconds timeout) {
    // 0 means "no timeout" to curl; keep at least 1ms.
    long ms = timeout.count() > 0 ? static_cast<long>(timeout.count()) : 1L;
    curl_easy_setopt(easyHandle.get(), CURLOPT_TIMEOUT_MS, ms);
    return *this;
}

CurlWrapper& CurlWrapper::setAbortCheck(std::function<bool()> check) {
    abortCheck = std::move(check);
    curl_easy_setopt(easyHandle.get(), CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(easyHandle.get(), CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(easyHandle.get(), CURLOPT_NOPROGRESS, 0L);
    return *this;
}

HttpResponse CurlWrapper::perform() {
    if (headers) {
        curl_easy_setopt(easyHandle.get(), CURLOPT_HTTPHEADER, headers);
    }

    responseBuffer.clear();
    CURLcode res = curl_easy_perform(easyHandle.get());
    if (res != CURLE_OK) {
        throw CurlError(std::string("curl_easy_perform() failed: ") + curl_easy_strerror(res), res);
    }

    long httpCode = 0;
    curl_easy_getinfo(easyHandle.get(), CURLINFO_RESPONSE_CODE, &httpCode);

    return HttpResponse{httpCode, responseBuffer};
}

// CurlTransport implementation
HttpResponse CurlTransport::post(const std::string& url,
                                 const std::string& body,
                                 const std::vector<std::string>& headers,
                                 std::chrono::milliseconds timeout,
                                 const SolveContext& context) {
    const bool boundedByDeadline = timeout >= context.remaining();

    CurlWrapper curl;
    curl.setUrl(url)
        .setPostFields(body)
        .setTimeout(timeout)
        .setAbortCheck([&context] { return context.expired(); });
    for (const auto& header : headers) {
        curl.addHeader(header);
    }

    try {
        return curl.perform();
    } catch (const CurlError& e) {
        bool deadlineHit = e.code() == CURLE_OPERATION_TIMEDOUT && boundedByDeadline;
        if (e.code() == CURLE_ABORTED_BY_CALLBACK || deadlineHit || context.expired()) {
            throw CancellationError(std::string("HTTP request interrupted: ") + e.what());
        }
        throw;
    }
}

} // namespace anticaptcha
