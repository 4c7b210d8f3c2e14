#pragma once
#include <optional>
#include <string>

class HttpTransport;
class CancellationToken;
class Logger;

struct PurchaseStatus {
    bool hasAccess = false;
    std::optional<std::string> tier;
    std::optional<std::string> expiresAt;
};

// Reads the premium access state recorded by the purchase service, e.g. to
// confirm a redemption went through.
class PurchaseStatusClient {
public:
    PurchaseStatusClient(HttpTransport& transport, std::string purchaseServiceUrl,
                         Logger* callLog = nullptr);

    // GET /purchase/status?firebase_uid=..&session_id=.. (empty keys are left
    // out; both empty is std::invalid_argument). A reply that is not an object
    // reads as no access.
    PurchaseStatus fetchStatus(const std::string& uid, const std::string& sessionId,
                               const CancellationToken* cancel = nullptr) const;

private:
    HttpTransport& transport_;
    std::string purchaseServiceUrl_;
    Logger* callLog_;
};
