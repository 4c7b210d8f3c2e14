#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct PredictionRequest {
    std::string teamA;          // home
    std::string teamB;          // away
    std::string matchDateISO;   // YYYY-MM-DD
    std::optional<double> oddsHome;
    std::optional<double> oddsAway;
};

// Which rule of the confidence table produced CanonicalPredictionResult::confidence.
enum class ConfidenceSource {
    ProbHomeRl,
    ProbAwayRl,
    ProbDrawRl,
    ProbHomeWin,
    ProbAwayWin,
    ProbDraw,
    WinnerConfidence,
    OverallConfidence,
    GenericConfidence,
    Unresolved
};

std::string toString(ConfidenceSource s);

enum class NoteKind {
    ConfidenceFallback,   // rules 7-9
    ConfidenceUnresolved, // rule 10, confidence defaulted to 0
    AliasMissing,         // requested alias substituted
    AliasMismatch,        // backend alias differs from requested
    MalformedResponse     // body not a JSON object / wrong field types
};

std::string toString(NoteKind k);

struct NormalizationNote {
    NoteKind kind;
    std::string message;
};

struct CanonicalPredictionResult {
    std::string predictedWinner;
    double confidence = 0.0;
    ConfidenceSource confidenceSource = ConfidenceSource::Unresolved;
    std::optional<nlohmann::json> margin;   // number or [lo, hi], passed through
    std::string modelAlias;
    std::optional<std::int64_t> predictionId;

    // Present on history records only.
    std::optional<std::string> matchDate;
    std::optional<std::string> homeTeamName;
    std::optional<std::string> awayTeamName;
    std::optional<std::string> predictionTimestamp;
    std::optional<int> userRating;
    std::optional<std::string> actualWinner;
    std::optional<double> actualMargin;

    std::vector<NormalizationNote> notes;

    bool hasNote(NoteKind k) const;
};
