#include "core/ResponseNormalizer.hpp"

#include <algorithm>

using json = nlohmann::json;

namespace {

// -------------------------------
//   Confidence rule table
// -------------------------------
// Evaluated top to bottom, first match wins. A rule with a winner label needs
// both the label and the field; a rule without one needs only the field.
struct ConfidenceRule {
    const char* winner;   // nullptr = any winner
    const char* field;
    ConfidenceSource source;
    bool fallback;
};

const ConfidenceRule kConfidenceRules[] = {
    {"Home",     "prob_home_rl",       ConfidenceSource::ProbHomeRl,        false},
    {"Away",     "prob_away_rl",       ConfidenceSource::ProbAwayRl,        false},
    {"Draw",     "prob_draw_rl",       ConfidenceSource::ProbDrawRl,        false},
    {"Home Win", "prob_home_win",      ConfidenceSource::ProbHomeWin,       false},
    {"Away Win", "prob_away_win",      ConfidenceSource::ProbAwayWin,       false},
    {"Draw",     "prob_draw",          ConfidenceSource::ProbDraw,          false},
    {nullptr,    "winner_confidence",  ConfidenceSource::WinnerConfidence,  true},
    {nullptr,    "overall_confidence", ConfidenceSource::OverallConfidence, true},
    {nullptr,    "confidence",         ConfidenceSource::GenericConfidence, true},
};

const json* findField(const json& raw, const char* key) {
    if (!raw.is_object()) return nullptr;
    auto it = raw.find(key);
    if (it == raw.end() || it->is_null()) return nullptr;
    return &*it;
}

void addNote(CanonicalPredictionResult& r, NoteKind kind, std::string msg) {
    r.notes.push_back(NormalizationNote{kind, std::move(msg)});
}

// Wrongly typed values count as absent and leave a MalformedResponse note.
std::optional<double> numberField(const json& raw, const char* key, CanonicalPredictionResult& r) {
    const json* v = findField(raw, key);
    if (!v) return std::nullopt;
    if (!v->is_number()) {
        addNote(r, NoteKind::MalformedResponse,
                std::string("Field '") + key + "' is not a number, ignored.");
        return std::nullopt;
    }
    return v->get<double>();
}

// Empty strings count as absent.
std::optional<std::string> stringField(const json& raw, const char* key, CanonicalPredictionResult& r) {
    const json* v = findField(raw, key);
    if (!v) return std::nullopt;
    if (!v->is_string()) {
        addNote(r, NoteKind::MalformedResponse,
                std::string("Field '") + key + "' is not a string, ignored.");
        return std::nullopt;
    }
    std::string s = v->get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

std::optional<std::int64_t> integerField(const json& raw, const char* key, CanonicalPredictionResult& r) {
    const json* v = findField(raw, key);
    if (!v) return std::nullopt;
    if (!v->is_number_integer()) {
        addNote(r, NoteKind::MalformedResponse,
                std::string("Field '") + key + "' is not an integer, ignored.");
        return std::nullopt;
    }
    return v->get<std::int64_t>();
}

void resolveConfidence(const json& raw, CanonicalPredictionResult& r) {
    for (const auto& rule : kConfidenceRules) {
        if (rule.winner && r.predictedWinner != rule.winner) continue;

        std::optional<double> value = numberField(raw, rule.field, r);
        if (!value) continue;

        r.confidence = *value;
        r.confidenceSource = rule.source;
        if (rule.fallback) {
            addNote(r, NoteKind::ConfidenceFallback,
                    std::string("Using fallback '") + rule.field + "' field from backend.");
        }
        return;
    }

    r.confidence = 0.0;
    r.confidenceSource = ConfidenceSource::Unresolved;
    addNote(r, NoteKind::ConfidenceUnresolved,
            "Could not determine confidence for predicted winner '" + r.predictedWinner + "'. Using 0.");
}

// Backend value wins over the requested alias; a difference is only noted.
void resolveAlias(const json& raw, const std::string& requestedAlias, CanonicalPredictionResult& r) {
    std::optional<std::string> alias = stringField(raw, "model_alias", r);
    std::optional<std::string> name  = stringField(raw, "model_name", r);

    if (alias) {
        r.modelAlias = *alias;
    } else if (name) {
        r.modelAlias = *name;
    } else {
        r.modelAlias = requestedAlias;
        addNote(r, NoteKind::AliasMissing,
                "Backend response missing 'model_alias' and 'model_name', using requested alias '"
                + requestedAlias + "'.");
        return;
    }

    if (!requestedAlias.empty() && r.modelAlias != requestedAlias) {
        addNote(r, NoteKind::AliasMismatch,
                "Backend returned alias '" + r.modelAlias + "' but requested '" + requestedAlias
                + "'. Using backend alias.");
    }
}

void copyPassThrough(const json& raw, CanonicalPredictionResult& r) {
    if (const json* m = findField(raw, "margin")) {
        r.margin = *m;
    }
    r.predictionId = integerField(raw, "prediction_id", r);
}

CanonicalPredictionResult normalizeFields(const json& raw, const std::string& requestedAlias) {
    CanonicalPredictionResult r;

    if (!raw.is_object()) {
        addNote(r, NoteKind::MalformedResponse,
                std::string("Expected a JSON object, got ") + raw.type_name() + ".");
    }

    r.predictedWinner = stringField(raw, "predicted_winner", r).value_or("");
    resolveConfidence(raw, r);
    resolveAlias(raw, requestedAlias, r);
    copyPassThrough(raw, r);
    return r;
}

} // namespace

CanonicalPredictionResult ResponseNormalizer::normalize(const json& raw,
                                                        const std::string& requestedAlias) {
    return normalizeFields(raw, requestedAlias);
}

CanonicalPredictionResult ResponseNormalizer::normalizeBody(const std::string& body,
                                                            const std::string& requestedAlias) {
    json raw = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (raw.is_discarded()) {
        CanonicalPredictionResult r = normalizeFields(json::object(), requestedAlias);
        r.notes.insert(r.notes.begin(),
                       NormalizationNote{NoteKind::MalformedResponse, "Response body is not valid JSON."});
        return r;
    }
    return normalizeFields(raw, requestedAlias);
}

CanonicalPredictionResult ResponseNormalizer::normalizeHistoryRecord(const json& raw) {
    CanonicalPredictionResult tmp;
    std::string storedModel = stringField(raw, "model", tmp).value_or("");

    CanonicalPredictionResult r = normalizeFields(raw, storedModel);
    r.notes.insert(r.notes.begin(), tmp.notes.begin(), tmp.notes.end());

    // The stored model is what the user ran; it replaces whatever the record echoes.
    if (!storedModel.empty()) {
        r.modelAlias = storedModel;
        r.notes.erase(std::remove_if(r.notes.begin(), r.notes.end(),
                                     [](const NormalizationNote& n) {
                                         return n.kind == NoteKind::AliasMismatch ||
                                                n.kind == NoteKind::AliasMissing;
                                     }),
                      r.notes.end());
    }

    r.matchDate           = stringField(raw, "match_date", r);
    r.homeTeamName        = stringField(raw, "home_team_name", r);
    r.awayTeamName        = stringField(raw, "away_team_name", r);
    r.predictionTimestamp = stringField(raw, "prediction_timestamp", r);
    r.actualWinner        = stringField(raw, "actual_winner", r);
    r.actualMargin        = numberField(raw, "actual_margin", r);
    if (std::optional<std::int64_t> rating = integerField(raw, "user_rating", r)) {
        r.userRating = static_cast<int>(*rating);
    }
    return r;
}
