#include "matchtrack/events/event_types.h"

namespace matchtrack {
namespace events {

const char* to_string(EndReason reason) {
    switch (reason) {
        case EndReason::Pass: return "pass";
        case EndReason::Lost: return "lost";
        case EndReason::Unknown: break;
    }
    return "unknown";
}

const char* to_string(PassOutcome outcome) {
    switch (outcome) {
        case PassOutcome::Complete: return "complete";
        case PassOutcome::Intercepted: return "intercepted";
        case PassOutcome::Incomplete: break;
    }
    return "incomplete";
}

bool parse_pass_outcome(const std::string& text, PassOutcome& out) {
    if (text == "complete") { out = PassOutcome::Complete; return true; }
    if (text == "incomplete") { out = PassOutcome::Incomplete; return true; }
    if (text == "intercepted") { out = PassOutcome::Intercepted; return true; }
    return false;
}

const char* to_string(TurnoverType type) {
    return type == TurnoverType::Won ? "won" : "lost";
}

const char* to_string(ReviewReason reason) {
    switch (reason) {
        case ReviewReason::AmbiguousPlayer: return "ambiguous_player";
        case ReviewReason::MultipleCandidates: return "multiple_candidates";
        case ReviewReason::LowConfidence: break;
    }
    return "low_confidence";
}

} // namespace events
} // namespace matchtrack
