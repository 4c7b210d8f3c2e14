#include "api/HistoryReconciler.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

#include "api/CallSupport.hpp"
#include "core/Errors.hpp"
#include "core/ResponseNormalizer.hpp"
#include "net/HttpTransport.hpp"
#include "utils/Log.hpp"
#include "utils/Timestamp.hpp"

using json = nlohmann::json;

HistoryReconciler::HistoryReconciler(HttpTransport& transport, std::string userServiceUrl,
                                     Logger* callLog)
    : transport_(transport), userServiceUrl_(std::move(userServiceUrl)), callLog_(callLog) {}

std::vector<CanonicalPredictionResult>
HistoryReconciler::orderByRecency(const std::vector<CanonicalPredictionResult>& records) {
    struct Keyed {
        std::optional<std::int64_t> ts;
        const CanonicalPredictionResult* rec;
    };

    std::vector<Keyed> keyed;
    keyed.reserve(records.size());
    for (const auto& r : records) {
        std::optional<std::int64_t> ts;
        if (r.predictionTimestamp) ts = parseIsoTimestampMs(*r.predictionTimestamp);
        keyed.push_back(Keyed{ts, &r});
    }

    std::stable_sort(keyed.begin(), keyed.end(), [](const Keyed& a, const Keyed& b) {
        if (!a.ts) return false;
        if (!b.ts) return true;
        return *a.ts > *b.ts;
    });

    std::vector<CanonicalPredictionResult> ordered;
    ordered.reserve(keyed.size());
    for (const auto& k : keyed) ordered.push_back(*k.rec);
    return ordered;
}

std::vector<CanonicalPredictionResult>
HistoryReconciler::fetchHistory(const std::string& credential, const CancellationToken* cancel) const {
    const std::string url = userServiceUrl_ + "/users/me/predictions";
    CallTimer timer;
    LogEntry entry = beginEntry("history", "", url);

    LOGX("HISTORY", "Fetching user predictions from " << url);

    HttpRequest req = jsonRequest(HttpMethod::Get, url, credential);

    std::vector<CanonicalPredictionResult> records;
    try {
        HttpResponse res = transport_.send(req, cancel);
        entry.http_status = res.statusCode;
        ensureSuccess(res, "Fetch history");

        json raw = json::parse(res.body, nullptr, /*allow_exceptions=*/false);
        if (raw.is_discarded() || !raw.is_array()) {
            LOGW("HISTORY", toString(NoteKind::MalformedResponse)
                            << ": expected a JSON array of predictions, returning empty history");
        } else {
            records.reserve(raw.size());
            for (const auto& item : raw) {
                CanonicalPredictionResult r = ResponseNormalizer::normalizeHistoryRecord(item);
                if (r.hasNote(NoteKind::ConfidenceUnresolved)) {
                    LOGW("HISTORY", "Could not determine confidence for prediction ID "
                                    << (r.predictionId ? std::to_string(*r.predictionId) : "?")
                                    << ". Using 0.");
                }
                records.push_back(std::move(r));
            }
        }
    } catch (const ClientError& e) {
        LOGE("HISTORY", e.what());
        recordFailure(callLog_, entry, timer);
        throw;
    }

    recordCall(callLog_, entry, timer);
    LOGX("HISTORY", "Fetched and processed " << records.size() << " user predictions");
    return orderByRecency(records);
}
