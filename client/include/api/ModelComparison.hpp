#pragma once
#include <optional>
#include <string>
#include <vector>

#include "core/Prediction.hpp"

class PredictionOrchestrator;
class ThreadPool;
class CancellationToken;

struct ComparisonOutcome {
    std::string alias;
    std::optional<CanonicalPredictionResult> result;
    std::string error;   // set when result is empty
};

// Runs one prediction per alias concurrently on a worker pool. Calls are
// independent: one failing model does not affect the others.
class ModelComparison {
public:
    ModelComparison(const PredictionOrchestrator& orchestrator, ThreadPool& pool);

    // Outcomes come back in the order of `aliases`.
    std::vector<ComparisonOutcome> compare(const PredictionRequest& request,
                                           const std::vector<std::string>& aliases,
                                           const std::optional<std::string>& credential,
                                           const CancellationToken* cancel = nullptr) const;

private:
    const PredictionOrchestrator& orchestrator_;
    ThreadPool& pool_;
};
