#pragma once

#include "net/HttpMessage.hpp"

class CancellationToken;

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Performs exactly one exchange. Throws TransportError when no HTTP answer
    // was received (status 0) and OperationCancelled when `cancel` fires.
    // Non-2xx answers are returned, not thrown.
    virtual HttpResponse send(const HttpRequest& req, const CancellationToken* cancel) = 0;
};

// Throws TransportError for a non-2xx response. `operation` prefixes the message;
// the backend's JSON "detail" field (if any) becomes TransportError::detail().
void ensureSuccess(const HttpResponse& res, const std::string& operation);

std::string methodName(HttpMethod m);
