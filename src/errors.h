#pragma once

#include <stdexcept>
#include <string>
#include <chrono>

namespace mockrun {

// Base of every error the engine reports to its callers.
// code() is the stable machine-readable name, status() the HTTP status it maps to.
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(const std::string& code, const std::string& message, int status)
        : std::runtime_error(message), code_(code), status_(status) {}

    const std::string& code() const { return code_; }
    int status() const { return status_; }

private:
    std::string code_;
    int status_;
};

// Rejected before any resource was used
class ValidationError : public ExecutionError {
public:
    explicit ValidationError(const std::string& message,
                             const std::string& code = "CODE_VALIDATION_FAILED")
        : ExecutionError(code, message, 400) {}
};

class AccessDenied : public ExecutionError {
public:
    explicit AccessDenied(const std::string& message)
        : ExecutionError("ACCESS_DENIED", message, 403) {}
};

class NotFound : public ExecutionError {
public:
    NotFound(const std::string& code, const std::string& message)
        : ExecutionError(code, message, 404) {}
};

class RateLimitExceeded : public ExecutionError {
public:
    RateLimitExceeded(const std::string& message, std::chrono::seconds retry_after)
        : ExecutionError("RATE_LIMIT_EXCEEDED", message, 429), retry_after_(retry_after) {}

    std::chrono::seconds retry_after() const { return retry_after_; }

private:
    std::chrono::seconds retry_after_;
};

// Environment ceiling reached
class ResourceExhausted : public ExecutionError {
public:
    explicit ResourceExhausted(const std::string& message)
        : ExecutionError("RESOURCE_EXHAUSTED", message, 503) {}
};

// Heavy isolation required but the backend is unhealthy
class IsolationUnavailable : public ExecutionError {
public:
    explicit IsolationUnavailable(const std::string& message)
        : ExecutionError("ISOLATION_UNAVAILABLE", message, 503) {}
};

// Deadline exceeded; the environment has already been destroyed when this is thrown
class ExecutionTimeout : public ExecutionError {
public:
    explicit ExecutionTimeout(const std::string& message)
        : ExecutionError("EXECUTION_TIMEOUT", message, 504) {}
};

class PersistenceError : public ExecutionError {
public:
    PersistenceError(const std::string& code, const std::string& message)
        : ExecutionError(code, message, 500) {}
};

class InternalError : public ExecutionError {
public:
    explicit InternalError(const std::string& message)
        : ExecutionError("INTERNAL_ERROR", message, 500) {}
};

} // namespace mockrun
