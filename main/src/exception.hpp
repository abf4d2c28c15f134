#pragma once

#include <stdexcept>
#include <string>

class GhrelException : public std::runtime_error {
public:
    explicit GhrelException(const std::string& message) : std::runtime_error(message) {}
};

// Bad endpoint URI, credential or setting. Never retried.
class ConfigurationException : public GhrelException {
public:
    explicit ConfigurationException(const std::string& message) : GhrelException(message) {}
};

// The local archive cache could not be read, written or locked.
class CacheException : public GhrelException {
public:
    explicit CacheException(const std::string& message) : GhrelException(message) {}
};

// Failure of a call against the remote API.
// status is the HTTP status code, or 0 when no response was received.
class RemoteException : public GhrelException {
public:
    RemoteException(const std::string& operation, const std::string& resource, long status, const std::string& detail)
        : GhrelException(describe(operation, resource, status, detail)),
          operation_(operation), resource_(resource), status_(status), detail_(detail) {}

    const std::string& operation() const { return operation_; }
    const std::string& resource() const { return resource_; }
    long status() const { return status_; }
    const std::string& detail() const { return detail_; }

private:
    static std::string describe(const std::string& operation, const std::string& resource, long status, const std::string& detail) {
        std::string message = operation + " [" + resource + "]";
        if (status != 0) {
            message += " HTTP " + std::to_string(status);
        }
        if (!detail.empty()) {
            message += ": " + detail;
        }
        return message;
    }

    std::string operation_;
    std::string resource_;
    long status_;
    std::string detail_;
};

// Timeouts, resets, refused connections, 502/503/504. Eligible for retry.
class TransientException : public RemoteException {
public:
    using RemoteException::RemoteException;
};

class PermanentException : public RemoteException {
public:
    using RemoteException::RemoteException;
};

class TooManyRedirectsException : public PermanentException {
public:
    using PermanentException::PermanentException;
};

class RateLimitedException : public RemoteException {
public:
    using RemoteException::RemoteException;
};

class CircuitOpenException : public RemoteException {
public:
    using RemoteException::RemoteException;
};

class RetryExhaustedException : public RemoteException {
public:
    RetryExhaustedException(const std::string& operation, const std::string& resource, long status,
                            const std::string& detail, int attempts)
        : RemoteException(operation, resource, status, detail), attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};
