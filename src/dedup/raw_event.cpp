#include "matchtrack/dedup/raw_event.h"

namespace matchtrack {
namespace dedup {

const char* to_string(EventType type) {
    switch (type) {
        case EventType::Pass: return "pass";
        case EventType::Carry: return "carry";
        case EventType::Turnover: return "turnover";
        case EventType::Shot: return "shot";
        case EventType::SetPiece: return "setPiece";
    }
    return "pass";
}

bool parse_event_type(std::string_view text, EventType& out) {
    if (text == "pass") { out = EventType::Pass; return true; }
    if (text == "carry") { out = EventType::Carry; return true; }
    if (text == "turnover") { out = EventType::Turnover; return true; }
    if (text == "shot") { out = EventType::Shot; return true; }
    if (text == "setPiece") { out = EventType::SetPiece; return true; }
    return false;
}

float effective_confidence(const RawEvent& e) {
    return e.window_confidence ? *e.window_confidence : e.confidence;
}

} // namespace dedup
} // namespace matchtrack
