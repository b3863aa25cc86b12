#pragma once

#include <stdexcept>
#include <string>

namespace anticaptcha {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Network, serialisation, HTTP status or JSON decode failure.
class TransportError : public Error {
public:
    explicit TransportError(const std::string& message, long httpStatus = 0)
        : Error(message), httpStatus(httpStatus) {}

    long status() const { return httpStatus; }

private:
    long httpStatus;
};

// The service answered with a non-zero errorId. what() is the service's
// errorDescription, unmodified.
class APIError : public Error {
public:
    APIError(long errorId, const std::string& errorCode, const std::string& description)
        : Error(description), id(errorId), code(errorCode) {}

    long errorId() const { return id; }
    const std::string& errorCode() const { return code; }

private:
    long id;
    std::string code;
};

class ResponseFormatError : public Error {
public:
    using Error::Error;
};

class CancellationError : public Error {
public:
    using Error::Error;
};

} // namespace anticaptcha
