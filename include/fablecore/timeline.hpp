#pragma once

#include <cstdint>
#include <limits>
#include <vector>
#include "fablecore/timeline.pb.h"

namespace fablecore {

/**
 * Append-only event log of one session.
 *
 * Sequence numbers start at 1, strictly increase and are never reused, not
 * even after truncate_after() removed the events that carried them.
 * Not synchronized; Session serializes access.
 */
class Timeline {
public:
    static constexpr int64_t kEnd = std::numeric_limits<int64_t>::max();

    Timeline() = default;

    /**
     * Restore a persisted log. Throws PersistenceError when the events are
     * out of order or next_sequence does not lie past the last event.
     */
    Timeline(std::vector<v1::TimelineEvent> events, int64_t next_sequence);

    /**
     * Assign the next sequence number to the event and append it.
     */
    int64_t append(v1::TimelineEvent event);

    /**
     * Events with from <= sequence <= to, in order.
     */
    std::vector<v1::TimelineEvent> read(int64_t from = 0, int64_t to = kEnd) const;

    /**
     * One restore point per user-input event: rolling back to it drops that
     * input and everything after it.
     */
    std::vector<v1::RestorePoint> restore_points() const;

    /**
     * Drop every event with a sequence strictly greater than the given one.
     * Returns the number of events removed.
     */
    std::size_t truncate_after(int64_t sequence);

    /// Sequence of the last retained event, 0 when empty.
    int64_t tail_sequence() const;

    int64_t next_sequence() const { return next_sequence_; }
    const std::vector<v1::TimelineEvent>& events() const { return events_; }
    std::size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }

private:
    std::vector<v1::TimelineEvent> events_;
    int64_t next_sequence_ = 1;
};

} // namespace fablecore
