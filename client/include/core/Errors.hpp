#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// Base class for every error the client surfaces to its caller.
class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& what) : std::runtime_error(what) {}
};

// Requested alias is not in the model registry. Raised before any network I/O.
class UnknownModel : public ClientError {
public:
    explicit UnknownModel(const std::string& alias)
        : ClientError("Model with alias \"" + alias + "\" not found"), alias_(alias) {}

    const std::string& alias() const { return alias_; }

private:
    std::string alias_;
};

// Network failure, timeout (status 0) or non-2xx answer (status = HTTP code).
class TransportError : public ClientError {
public:
    TransportError(long status, std::string detail, const std::string& what)
        : ClientError(what), status_(status), detail_(std::move(detail)) {}

    long status() const { return status_; }
    const std::string& detail() const { return detail_; }
    bool isNetworkFailure() const { return status_ == 0; }

private:
    long status_;
    std::string detail_;
};

// Caller abandoned the operation; no result was produced.
class OperationCancelled : public ClientError {
public:
    OperationCancelled() : ClientError("Operation cancelled") {}
};
