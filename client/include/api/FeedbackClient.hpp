#pragma once
#include <cstdint>
#include <string>

class HttpTransport;
class CancellationToken;
class Logger;

// Posts user feedback on saved predictions to the user service.
class FeedbackClient {
public:
    FeedbackClient(HttpTransport& transport, std::string userServiceUrl,
                   Logger* callLog = nullptr);

    // POST /users/feedback/rating. `rating` must be 1..5 (std::invalid_argument
    // otherwise, raised before any network call).
    void submitRating(std::int64_t predictionId, int rating, const std::string& credential,
                      const CancellationToken* cancel = nullptr) const;

    // POST /users/feedback/result with the match outcome; `margin` must be >= 0.
    void submitActualResult(std::int64_t predictionId, const std::string& winner, double margin,
                            const std::string& credential,
                            const CancellationToken* cancel = nullptr) const;

private:
    void post(const std::string& operation, const std::string& url, const std::string& body,
              const std::string& credential, const CancellationToken* cancel) const;

    HttpTransport& transport_;
    std::string userServiceUrl_;
    Logger* callLog_;
};
