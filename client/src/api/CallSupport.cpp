#include "api/CallSupport.hpp"

#include <stdexcept>

#include "core/Errors.hpp"
#include "utils/Log.hpp"
#include "utils/Timestamp.hpp"

HttpRequest jsonRequest(HttpMethod method, const std::string& url,
                        const std::optional<std::string>& credential) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.headers["Content-Type"] = "application/json";
    req.headers["Accept"] = "application/json";
    if (credential && !credential->empty()) {
        req.setBearer(*credential);
    }
    return req;
}

std::string serializeBody(const nlohmann::json& body) {
    try {
        return body.dump();
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument(std::string("Request text is not valid UTF-8: ") + e.what());
    }
}

LogEntry beginEntry(const std::string& operation, const std::string& alias, const std::string& url) {
    LogEntry e;
    e.operation = operation;
    e.model_alias = alias;
    e.url = url;
    e.http_status = 0;
    e.outcome = "ok";
    e.confidence = 0.0;
    e.confidence_source = "";
    e.latency_ms = 0.0;
    return e;
}

void recordCall(Logger* logger, LogEntry entry, const CallTimer& timer) {
    if (!logger) return;
    entry.timestamp = nowIso8601();
    entry.latency_ms = timer.elapsedMs();
    logger->log(entry);
}

void recordFailure(Logger* logger, LogEntry entry, const CallTimer& timer) {
    try {
        throw;
    } catch (const OperationCancelled&) {
        entry.outcome = "cancelled";
    } catch (const UnknownModel&) {
        entry.outcome = "unknown_model";
    } catch (const TransportError& e) {
        entry.http_status = e.status();
        entry.outcome = e.isNetworkFailure() ? "network_error" : "http_error";
    } catch (const std::invalid_argument&) {
        entry.outcome = "invalid_input";
    } catch (const std::exception&) {
        entry.outcome = "error";
    }
    recordCall(logger, std::move(entry), timer);
}

void reportNotes(const CanonicalPredictionResult& r, const std::string& tag) {
    for (const auto& n : r.notes) {
        if (n.kind == NoteKind::ConfidenceUnresolved || n.kind == NoteKind::MalformedResponse) {
            LOGW(tag, toString(n.kind) << ": " << n.message);
        } else {
            LOGX(tag, toString(n.kind) << ": " << n.message);
        }
    }
}
