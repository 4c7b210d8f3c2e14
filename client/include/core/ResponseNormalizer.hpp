#pragma once

#include "core/Prediction.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Maps the heterogeneous model responses (standard, reinforcement-learning,
// generic) onto CanonicalPredictionResult. Pure and total: never performs I/O
// and never throws on any input shape. Anything worth logging is returned in
// CanonicalPredictionResult::notes.
class ResponseNormalizer {
public:
    static CanonicalPredictionResult normalize(const nlohmann::json& raw,
                                               const std::string& requestedAlias);

    // Same, from an unparsed body. Unparseable text yields a MalformedResponse note.
    static CanonicalPredictionResult normalizeBody(const std::string& body,
                                                   const std::string& requestedAlias);

    // History record: the stored "model" field is the alias; history-only
    // fields (timestamp, teams, rating, actual result) are copied.
    static CanonicalPredictionResult normalizeHistoryRecord(const nlohmann::json& raw);
};
