#pragma once
#include <string>

class HttpTransport;
class CancellationToken;
class EntitlementPoller;
class Logger;

// Redeems premium access codes. A successful redemption triggers an
// entitlement refresh so new models unlock without waiting for the next poll.
class RedemptionClient {
public:
    RedemptionClient(HttpTransport& transport, std::string userServiceUrl,
                     std::string purchaseServiceUrl, EntitlementPoller* poller = nullptr,
                     Logger* callLog = nullptr);

    // POST <user-service>/purchase/coupon {firebase_uid, coupon_code}.
    // std::invalid_argument for an empty uid or code; TransportError carries the
    // backend's "detail" (e.g. invalid or expired coupon).
    void redeemCoupon(const std::string& uid, const std::string& couponCode,
                      const CancellationToken* cancel = nullptr) const;

    // POST <purchase-service>/purchase/one-time {session_id, one_time_code}.
    void redeemOneTimeCode(const std::string& sessionId, const std::string& code,
                           const CancellationToken* cancel = nullptr) const;

private:
    void post(const std::string& operation, const std::string& url, const std::string& body,
              const CancellationToken* cancel) const;

    HttpTransport& transport_;
    std::string userServiceUrl_;
    std::string purchaseServiceUrl_;
    EntitlementPoller* poller_;
    Logger* callLog_;
};
