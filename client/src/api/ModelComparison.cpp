#include "api/ModelComparison.hpp"

#include <future>
#include <stdexcept>

#include "api/PredictionOrchestrator.hpp"
#include "core/Errors.hpp"
#include "threadpool/ThreadPool.hpp"

ModelComparison::ModelComparison(const PredictionOrchestrator& orchestrator, ThreadPool& pool)
    : orchestrator_(orchestrator), pool_(pool) {}

std::vector<ComparisonOutcome> ModelComparison::compare(const PredictionRequest& request,
                                                        const std::vector<std::string>& aliases,
                                                        const std::optional<std::string>& credential,
                                                        const CancellationToken* cancel) const {
    std::vector<std::future<CanonicalPredictionResult>> futures;
    futures.reserve(aliases.size());

    for (const auto& alias : aliases) {
        futures.push_back(pool_.submit([this, request, alias, credential, cancel]() {
            return orchestrator_.predict(request, alias, credential, cancel);
        }));
    }

    std::vector<ComparisonOutcome> outcomes;
    outcomes.reserve(aliases.size());

    bool cancelled = false;
    for (std::size_t i = 0; i < futures.size(); ++i) {
        ComparisonOutcome o;
        o.alias = aliases[i];
        try {
            o.result = futures[i].get();
        } catch (const OperationCancelled&) {
            cancelled = true;
        } catch (const std::exception& e) {
            o.error = e.what();
        }
        outcomes.push_back(std::move(o));
    }

    // All futures are drained first so no task outlives this call.
    if (cancelled) throw OperationCancelled();
    return outcomes;
}
