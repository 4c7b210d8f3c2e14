#include "api/PredictionOrchestrator.hpp"

#include "api/CallSupport.hpp"
#include "core/Errors.hpp"
#include "core/ResponseNormalizer.hpp"
#include "net/HttpTransport.hpp"
#include "utils/Log.hpp"

using json = nlohmann::json;

PredictionOrchestrator::PredictionOrchestrator(const ModelRegistry& registry,
                                               HttpTransport& transport,
                                               Logger* callLog)
    : registry_(registry), transport_(transport), callLog_(callLog) {}

json PredictionOrchestrator::buildRequestBody(const PredictionRequest& request,
                                              const ModelDescriptor& model) {
    json body = {
        {"team_a", request.teamA},
        {"team_b", request.teamB},
        {"match_date_str", request.matchDateISO}
    };

    if (model.sendsBookmakerOdds) {
        if (request.oddsHome) body["odd_a"] = *request.oddsHome;
        if (request.oddsAway) body["odd_b"] = *request.oddsAway;
    }

    body["odds_home_win"] = request.oddsHome ? json(*request.oddsHome) : json(nullptr);
    body["odds_away_win"] = request.oddsAway ? json(*request.oddsAway) : json(nullptr);
    return body;
}

CanonicalPredictionResult PredictionOrchestrator::predict(const PredictionRequest& request,
                                                          const std::string& alias,
                                                          const std::optional<std::string>& credential,
                                                          const CancellationToken* cancel) const {
    CallTimer timer;
    LogEntry entry = beginEntry("predict", alias, "");

    const ModelDescriptor* model = registry_.findByAlias(alias);
    if (!model) {
        LOGE("PREDICT", "Configuration error: model with alias \"" << alias << "\" not found");
        entry.outcome = "unknown_model";
        recordCall(callLog_, entry, timer);
        throw UnknownModel(alias);
    }
    entry.url = model->endpoint;

    HttpRequest req = jsonRequest(HttpMethod::Post, model->endpoint, credential);
    try {
        req.body = serializeBody(buildRequestBody(request, *model));
    } catch (const std::invalid_argument& e) {
        LOGE("PREDICT", e.what());
        recordFailure(callLog_, entry, timer);
        throw;
    }

    LOGX("PREDICT", "POST " << model->endpoint << " model=" << alias
                    << (req.headers.count("Authorization") ? " (authenticated)" : " (anonymous)"));

    try {
        HttpResponse res = transport_.send(req, cancel);
        entry.http_status = res.statusCode;
        ensureSuccess(res, "Prediction " + alias);

        CanonicalPredictionResult result = ResponseNormalizer::normalizeBody(res.body, alias);
        reportNotes(result, "PREDICT");

        entry.confidence = result.confidence;
        entry.confidence_source = toString(result.confidenceSource);
        recordCall(callLog_, entry, timer);

        LOGX("PREDICT", result.modelAlias << " predicts " << result.predictedWinner
                        << " (confidence " << result.confidence << ")");
        return result;
    } catch (const ClientError& e) {
        LOGE("PREDICT", e.what());
        recordFailure(callLog_, entry, timer);
        throw;
    }
}
