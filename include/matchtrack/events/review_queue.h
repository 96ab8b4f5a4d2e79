#pragma once

#include <vector>

#include "matchtrack/events/event_types.h"

namespace matchtrack {
namespace events {

// Одна запись на физическое событие: у turnover попадает только "lost".
std::vector<PendingReview> extract_pending_reviews(const DetectedEvents& events, float review_threshold = 0.6f);

} // namespace events
} // namespace matchtrack
