#include "api/PurchaseStatusClient.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

#include "api/CallSupport.hpp"
#include "core/Errors.hpp"
#include "net/HttpTransport.hpp"
#include "utils/Log.hpp"

using json = nlohmann::json;

PurchaseStatusClient::PurchaseStatusClient(HttpTransport& transport, std::string purchaseServiceUrl,
                                           Logger* callLog)
    : transport_(transport), purchaseServiceUrl_(std::move(purchaseServiceUrl)), callLog_(callLog) {}

static std::optional<std::string> optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

PurchaseStatus PurchaseStatusClient::fetchStatus(const std::string& uid, const std::string& sessionId,
                                                 const CancellationToken* cancel) const {
    if (uid.empty() && sessionId.empty()) {
        throw std::invalid_argument("Purchase status needs a user ID or a session ID");
    }

    std::string url = purchaseServiceUrl_ + "/purchase/status";
    char sep = '?';
    if (!uid.empty()) {
        url += sep + std::string("firebase_uid=") + urlEncode(uid);
        sep = '&';
    }
    if (!sessionId.empty()) {
        url += sep + std::string("session_id=") + urlEncode(sessionId);
    }

    CallTimer timer;
    LogEntry entry = beginEntry("purchase_status", "", url);
    HttpRequest req = jsonRequest(HttpMethod::Get, url, std::nullopt);

    PurchaseStatus status;
    try {
        HttpResponse res = transport_.send(req, cancel);
        entry.http_status = res.statusCode;
        ensureSuccess(res, "Purchase status");

        json j = json::parse(res.body, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object()) {
            LOGW("PURCHASE", toString(NoteKind::MalformedResponse)
                             << ": purchase status is not a JSON object, treating as no access");
        } else {
            auto access = j.find("has_access");
            status.hasAccess = access != j.end() && access->is_boolean() && access->get<bool>();
            status.tier = optionalString(j, "tier");
            status.expiresAt = optionalString(j, "expires_at");
        }
    } catch (const ClientError& e) {
        LOGE("PURCHASE", e.what());
        recordFailure(callLog_, entry, timer);
        throw;
    }
    recordCall(callLog_, entry, timer);

    LOGX("PURCHASE", "Access " << (status.hasAccess ? "granted" : "not granted")
                     << (status.tier ? ", tier " + *status.tier : std::string()));
    return status;
}
