#pragma once
#include <string>
#include <vector>

#include "core/Prediction.hpp"

class HttpTransport;
class CancellationToken;
class Logger;

// Fetches the caller's saved predictions and returns them normalized, newest first.
class HistoryReconciler {
public:
    HistoryReconciler(HttpTransport& transport, std::string userServiceUrl,
                      Logger* callLog = nullptr);

    // GET <user-service>/users/me/predictions. Throws TransportError, OperationCancelled.
    std::vector<CanonicalPredictionResult> fetchHistory(const std::string& credential,
                                                        const CancellationToken* cancel = nullptr) const;

    // Returns a copy ordered by descending prediction timestamp. Records with a
    // missing or unparseable timestamp go last; ties keep their input order.
    static std::vector<CanonicalPredictionResult>
    orderByRecency(const std::vector<CanonicalPredictionResult>& records);

private:
    HttpTransport& transport_;
    std::string userServiceUrl_;
    Logger* callLog_;
};
