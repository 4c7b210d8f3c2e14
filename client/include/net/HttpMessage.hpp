#pragma once
#include <string>
#include <unordered_map>

enum class HttpMethod { Get, Post };

class HttpRequest {
public:
    HttpMethod method = HttpMethod::Get;
    std::string url;

    std::unordered_map<std::string, std::string> headers;
    std::string body;

    HttpRequest() = default;

    // Adds "Authorization: Bearer <token>".
    void setBearer(const std::string& token) {
        headers["Authorization"] = "Bearer " + token;
    }
};

class HttpResponse {
public:
    long statusCode = 0;
    std::string body;

    bool ok() const { return statusCode >= 200 && statusCode < 300; }
};

// Percent-encodes everything outside RFC 3986 unreserved characters.
std::string urlEncode(const std::string& s);
