#include "api/FeedbackClient.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

#include "api/CallSupport.hpp"
#include "core/Errors.hpp"
#include "net/HttpTransport.hpp"
#include "utils/Log.hpp"

using json = nlohmann::json;

FeedbackClient::FeedbackClient(HttpTransport& transport, std::string userServiceUrl, Logger* callLog)
    : transport_(transport), userServiceUrl_(std::move(userServiceUrl)), callLog_(callLog) {}

void FeedbackClient::post(const std::string& operation, const std::string& url,
                          const std::string& body, const std::string& credential,
                          const CancellationToken* cancel) const {
    CallTimer timer;
    LogEntry entry = beginEntry(operation, "", url);

    HttpRequest req = jsonRequest(HttpMethod::Post, url, credential);
    req.body = body;

    try {
        HttpResponse res = transport_.send(req, cancel);
        entry.http_status = res.statusCode;
        ensureSuccess(res, "Submit " + operation);
    } catch (const ClientError& e) {
        LOGE("FEEDBACK", e.what());
        recordFailure(callLog_, entry, timer);
        throw;
    }
    recordCall(callLog_, entry, timer);
}

void FeedbackClient::submitRating(std::int64_t predictionId, int rating,
                                  const std::string& credential,
                                  const CancellationToken* cancel) const {
    if (rating < 1 || rating > 5) {
        throw std::invalid_argument("Rating must be between 1 and 5, got " + std::to_string(rating));
    }

    const std::string url = userServiceUrl_ + "/users/feedback/rating";
    LOGX("FEEDBACK", "Submitting rating " << rating << " for prediction " << predictionId);

    json body = {
        {"prediction_id", predictionId},
        {"rating_value", rating}
    };
    post("rating", url, serializeBody(body), credential, cancel);

    LOGX("FEEDBACK", "Rating submitted for prediction " << predictionId);
}

void FeedbackClient::submitActualResult(std::int64_t predictionId, const std::string& winner,
                                        double margin, const std::string& credential,
                                        const CancellationToken* cancel) const {
    if (winner.empty()) {
        throw std::invalid_argument("Actual winner must not be empty");
    }
    if (margin < 0.0) {
        throw std::invalid_argument("Actual margin must not be negative");
    }

    const std::string url = userServiceUrl_ + "/users/feedback/result";
    LOGX("FEEDBACK", "Submitting actual result for prediction " << predictionId
                     << ": " << winner << " by " << margin);

    json body = {
        {"prediction_id", predictionId},
        {"actual_winner", winner},
        {"actual_margin", margin}
    };
    post("result", url, serializeBody(body), credential, cancel);
}
