#include "matchtrack/events/review_queue.h"

namespace matchtrack {
namespace events {

namespace {

ReviewReason pass_review_reason(const PassEvent& p, float threshold) {
    if (p.kicker.confidence < threshold) return ReviewReason::LowConfidence;
    if (p.receiver && p.receiver->confidence < threshold) return ReviewReason::LowConfidence;
    if (p.outcome_confidence < threshold) return ReviewReason::AmbiguousPlayer;
    return ReviewReason::LowConfidence;
}

ReviewCandidate candidate(const PlayerRef& ref) {
    ReviewCandidate c;
    c.track_id = ref.track_id;
    c.player_id = ref.player_id;
    c.confidence = ref.confidence;
    return c;
}

} // namespace

std::vector<PendingReview> extract_pending_reviews(const DetectedEvents& events, float review_threshold) {
    std::vector<PendingReview> out;

    for (const auto& p : events.pass_events) {
        if (!p.needs_review) continue;
        PendingReview r;
        r.event_id = p.event_id;
        r.event_type = "pass";
        r.reason = pass_review_reason(p, review_threshold);
        r.candidates.push_back(candidate(p.kicker));
        if (p.receiver) r.candidates.push_back(candidate(*p.receiver));
        out.push_back(r);
    }

    for (const auto& c : events.carry_events) {
        if (c.confidence >= review_threshold) continue;
        PendingReview r;
        r.event_id = c.event_id;
        r.event_type = "carry";
        r.reason = ReviewReason::LowConfidence;
        out.push_back(r);
    }

    for (const auto& t : events.turnover_events) {
        if (!t.needs_review || t.turnover_type == TurnoverType::Won) continue;
        PendingReview r;
        r.event_id = t.event_id;
        r.event_type = "turnover";
        r.reason = ReviewReason::LowConfidence;
        out.push_back(r);
    }
    return out;
}

} // namespace events
} // namespace matchtrack
