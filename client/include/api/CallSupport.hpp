#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "core/Prediction.hpp"
#include "monitor/Logger.hpp"
#include "net/HttpMessage.hpp"

// Shared plumbing for the API clients: request construction, call-log rows,
// and reporting of normalization notes.

HttpRequest jsonRequest(HttpMethod method, const std::string& url,
                        const std::optional<std::string>& credential);

// Serializes a request body. Strings that are not valid UTF-8 cannot be sent
// as JSON and raise std::invalid_argument.
std::string serializeBody(const nlohmann::json& body);

class CallTimer {
public:
    CallTimer() : start_(std::chrono::steady_clock::now()) {}

    double elapsedMs() const {
        using namespace std::chrono;
        return duration<double, std::milli>(steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Starts a call-log row; the caller fills status/outcome before recordCall().
LogEntry beginEntry(const std::string& operation, const std::string& alias, const std::string& url);

// Classifies the in-flight exception (call from inside a catch block) into
// entry.outcome / entry.http_status, then records the row.
void recordFailure(Logger* logger, LogEntry entry, const CallTimer& timer);

void recordCall(Logger* logger, LogEntry entry, const CallTimer& timer);

// Emits one console line per note under `tag`.
void reportNotes(const CanonicalPredictionResult& r, const std::string& tag);
