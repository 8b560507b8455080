#include "fablecore/timeline.hpp"
#include "fablecore/errors.hpp"
#include "fablecore/event_renderer.hpp"
#include "fablecore/mechanics.pb.h"
#include <algorithm>
#include <string>

namespace fablecore {

Timeline::Timeline(std::vector<v1::TimelineEvent> events, int64_t next_sequence)
    : events_(std::move(events)), next_sequence_(next_sequence) {
    int64_t previous = 0;
    for (const auto& event : events_) {
        if (event.sequence() <= previous) {
            throw PersistenceError("Timeline events out of order at sequence " +
                                   std::to_string(event.sequence()));
        }
        previous = event.sequence();
    }
    if (next_sequence_ <= previous) {
        throw PersistenceError("next_sequence " + std::to_string(next_sequence_) +
                               " does not follow last event " + std::to_string(previous));
    }
}

int64_t Timeline::append(v1::TimelineEvent event) {
    int64_t sequence = next_sequence_++;
    event.set_sequence(sequence);
    events_.push_back(std::move(event));
    return sequence;
}

std::vector<v1::TimelineEvent> Timeline::read(int64_t from, int64_t to) const {
    std::vector<v1::TimelineEvent> result;
    if (from > to) {
        return result;
    }
    auto first = std::lower_bound(events_.begin(), events_.end(), from,
        [](const v1::TimelineEvent& e, int64_t seq) { return e.sequence() < seq; });
    for (auto it = first; it != events_.end() && it->sequence() <= to; ++it) {
        result.push_back(*it);
    }
    return result;
}

std::vector<v1::RestorePoint> Timeline::restore_points() const {
    std::vector<v1::RestorePoint> points;
    int64_t previous = 0;
    for (const auto& event : events_) {
        if (event.kind() == v1::USER_INPUT) {
            v1::UserInput input;
            event.payload().UnpackTo(&input);

            v1::RestorePoint point;
            point.set_sequence(previous);
            *point.mutable_timestamp() = event.timestamp();
            point.set_human_preview(std::string(EventRenderer::icon_for(v1::USER_INPUT)) + " " +
                                    EventRenderer::preview(input.text()));
            points.push_back(std::move(point));
        }
        previous = event.sequence();
    }
    return points;
}

std::size_t Timeline::truncate_after(int64_t sequence) {
    auto first_dropped = std::upper_bound(events_.begin(), events_.end(), sequence,
        [](int64_t seq, const v1::TimelineEvent& e) { return seq < e.sequence(); });
    auto removed = static_cast<std::size_t>(std::distance(first_dropped, events_.end()));
    events_.erase(first_dropped, events_.end());
    return removed;
}

int64_t Timeline::tail_sequence() const {
    return events_.empty() ? 0 : events_.back().sequence();
}

} // namespace fablecore
