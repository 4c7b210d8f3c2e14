#include "net/HttpTransport.hpp"
#include "core/Errors.hpp"

#include <cctype>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Backends answer errors as {"detail": "..."} (or a structured detail list).
static std::string extractDetail(const std::string& body) {
    if (body.empty()) return "";

    json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object() || !j.contains("detail")) return "";

    const json& d = j["detail"];
    if (d.is_string()) return d.get<std::string>();
    return d.dump();
}

std::string methodName(HttpMethod m) {
    return m == HttpMethod::Post ? "POST" : "GET";
}

void ensureSuccess(const HttpResponse& res, const std::string& operation) {
    if (res.ok()) return;

    std::string detail = extractDetail(res.body);
    std::string what = operation + ": request failed with status "
                     + std::to_string(res.statusCode) + ". "
                     + (detail.empty() ? "No additional details." : detail);
    throw TransportError(res.statusCode, detail, what);
}

std::string urlEncode(const std::string& s) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}
