#pragma once

#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "fablecore/timeline.pb.h"
#include "errors.hpp"
#include "event_renderer.hpp"

namespace fablecore {

/**
 * Helper functions for working with timeline events.
 */
namespace helpers {

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Format a protobuf Timestamp as RFC 3339 text.
 */
std::string format_timestamp(const google::protobuf::Timestamp& ts);

/**
 * Build an uncommitted event (sequence 0) of the given kind. The sequence
 * number is assigned by the Timeline when the event is appended.
 */
template<typename T>
v1::TimelineEvent make_event(v1::EventKind kind, const T& payload) {
    v1::TimelineEvent event;
    event.set_kind(kind);
    *event.mutable_timestamp() = now();
    event.mutable_payload()->PackFrom(payload, TYPE_URL_PREFIX);
    event.set_display_icon(EventRenderer::icon_for(kind));
    return event;
}

/**
 * Unpack an event payload; throws PersistenceError when the payload does not
 * hold a T.
 */
template<typename T>
T unpack(const v1::TimelineEvent& event) {
    T payload;
    if (!event.payload().UnpackTo(&payload)) {
        throw PersistenceError("Event " + std::to_string(event.sequence()) +
                               " does not carry a " + T::descriptor()->full_name() +
                               " payload (found " + event.payload().type_url() + ")");
    }
    return payload;
}

/**
 * Check whether an event payload holds a T.
 */
template<typename T>
bool holds(const v1::TimelineEvent& event) {
    return event.payload().Is<T>();
}

} // namespace helpers
} // namespace fablecore
