#pragma once
#include "net/HttpTransport.hpp"

// libcurl easy-interface transport. One easy handle per call; safe to share
// between threads once curl_global_init() has run (see CurlGlobal).
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeoutMs);

    HttpResponse send(const HttpRequest& req, const CancellationToken* cancel) override;

private:
    long timeoutMs_;
};

// RAII wrapper around curl_global_init / curl_global_cleanup for main().
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};
