#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/ModelRegistry.hpp"
#include "core/Prediction.hpp"

class HttpTransport;
class CancellationToken;
class Logger;

// Resolves a model alias, calls its endpoint once and normalizes the answer.
// Does not check entitlements; callers gate with EntitlementGate first.
class PredictionOrchestrator {
public:
    PredictionOrchestrator(const ModelRegistry& registry, HttpTransport& transport,
                           Logger* callLog = nullptr);

    // Throws UnknownModel or std::invalid_argument (non-UTF-8 team names) before
    // any network call, then TransportError or OperationCancelled.
    CanonicalPredictionResult predict(const PredictionRequest& request,
                                      const std::string& alias,
                                      const std::optional<std::string>& credential = std::nullopt,
                                      const CancellationToken* cancel = nullptr) const;

    // JSON body for `model`. odd_a/odd_b are sent only to models that accept
    // bookmaker odds; odds_home_win/odds_away_win are always sent (null if unknown).
    static nlohmann::json buildRequestBody(const PredictionRequest& request,
                                           const ModelDescriptor& model);

private:
    const ModelRegistry& registry_;
    HttpTransport& transport_;
    Logger* callLog_;
};
