#include "core/Prediction.hpp"

#include <algorithm>

std::string toString(ConfidenceSource s) {
    switch (s) {
        case ConfidenceSource::ProbHomeRl:        return "prob_home_rl";
        case ConfidenceSource::ProbAwayRl:        return "prob_away_rl";
        case ConfidenceSource::ProbDrawRl:        return "prob_draw_rl";
        case ConfidenceSource::ProbHomeWin:       return "prob_home_win";
        case ConfidenceSource::ProbAwayWin:       return "prob_away_win";
        case ConfidenceSource::ProbDraw:          return "prob_draw";
        case ConfidenceSource::WinnerConfidence:  return "winner_confidence";
        case ConfidenceSource::OverallConfidence: return "overall_confidence";
        case ConfidenceSource::GenericConfidence: return "confidence";
        case ConfidenceSource::Unresolved:        return "unresolved";
    }
    return "unresolved";
}

std::string toString(NoteKind k) {
    switch (k) {
        case NoteKind::ConfidenceFallback:   return "CONFIDENCE_FALLBACK";
        case NoteKind::ConfidenceUnresolved: return "CONFIDENCE_UNRESOLVED";
        case NoteKind::AliasMissing:         return "ALIAS_MISSING";
        case NoteKind::AliasMismatch:        return "ALIAS_MISMATCH";
        case NoteKind::MalformedResponse:    return "MALFORMED_RESPONSE";
    }
    return "UNKNOWN";
}

bool CanonicalPredictionResult::hasNote(NoteKind k) const {
    return std::any_of(notes.begin(), notes.end(),
                       [k](const NormalizationNote& n) { return n.kind == k; });
}
