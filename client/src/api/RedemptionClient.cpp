#include "api/RedemptionClient.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

#include "api/CallSupport.hpp"
#include "core/Errors.hpp"
#include "entitlement/EntitlementPoller.hpp"
#include "net/HttpTransport.hpp"
#include "utils/Log.hpp"

using json = nlohmann::json;

RedemptionClient::RedemptionClient(HttpTransport& transport, std::string userServiceUrl,
                                   std::string purchaseServiceUrl, EntitlementPoller* poller,
                                   Logger* callLog)
    : transport_(transport),
      userServiceUrl_(std::move(userServiceUrl)),
      purchaseServiceUrl_(std::move(purchaseServiceUrl)),
      poller_(poller),
      callLog_(callLog) {}

void RedemptionClient::post(const std::string& operation, const std::string& url,
                            const std::string& body, const CancellationToken* cancel) const {
    CallTimer timer;
    LogEntry entry = beginEntry(operation, "", url);

    HttpRequest req = jsonRequest(HttpMethod::Post, url, std::nullopt);
    req.body = body;

    try {
        HttpResponse res = transport_.send(req, cancel);
        entry.http_status = res.statusCode;
        ensureSuccess(res, "Redeem " + operation);
    } catch (const ClientError& e) {
        LOGE("REDEEM", e.what());
        recordFailure(callLog_, entry, timer);
        throw;
    }
    recordCall(callLog_, entry, timer);

    if (poller_) poller_->triggerRefresh();
}

void RedemptionClient::redeemCoupon(const std::string& uid, const std::string& couponCode,
                                    const CancellationToken* cancel) const {
    if (uid.empty()) {
        throw std::invalid_argument("User ID not found. Please log in.");
    }
    if (couponCode.empty()) {
        throw std::invalid_argument("Coupon code must not be empty");
    }

    json body = {
        {"firebase_uid", uid},
        {"coupon_code", couponCode}
    };
    post("coupon", userServiceUrl_ + "/purchase/coupon", serializeBody(body), cancel);
    LOGX("REDEEM", "Coupon redeemed for '" << uid << "', premium access granted");
}

void RedemptionClient::redeemOneTimeCode(const std::string& sessionId, const std::string& code,
                                         const CancellationToken* cancel) const {
    if (sessionId.empty()) {
        throw std::invalid_argument("Session ID must not be empty");
    }
    if (code.empty()) {
        throw std::invalid_argument("One-time code must not be empty");
    }

    json body = {
        {"session_id", sessionId},
        {"one_time_code", code}
    };
    post("one_time", purchaseServiceUrl_ + "/purchase/one-time", serializeBody(body), cancel);
    LOGX("REDEEM", "One-time code redeemed for session '" << sessionId << "'");
}
