#include "fablecore/stream_coordinator.hpp"
#include "fablecore/event_renderer.hpp"
#include "fablecore/helpers.hpp"
#include "fablecore/logging.hpp"
#include "fablecore/tag_filter.hpp"
#include <optional>
#include <thread>

namespace fablecore {

StreamCoordinator::StreamCoordinator(Mechanics& mechanics, IntentResolver& resolver, Narrator& narrator,
                                     SessionRepository& repository, StreamOptions options)
    : mechanics_(mechanics),
      resolver_(resolver),
      narrator_(narrator),
      repository_(repository),
      options_(options) {}

StreamCoordinator::~StreamCoordinator() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto& pending : pending_) {
        pending.thread.join();
    }
}

// ============================================================================
// Frames
// ============================================================================

v1::TurnFrame StreamCoordinator::event_frame(const v1::TimelineEvent& event) {
    v1::TurnFrame frame;
    *frame.mutable_mechanical_event() = event;
    return frame;
}

v1::TurnFrame StreamCoordinator::token_frame(const std::string& token) {
    v1::TurnFrame frame;
    frame.set_narration_token(token);
    return frame;
}

v1::TurnFrame StreamCoordinator::error_frame(const MechanicsError& error) {
    v1::TurnFrame frame;
    auto* err = frame.mutable_error();
    err->set_code(static_cast<int32_t>(error.status_code()));
    err->set_kind(error.kind());
    err->set_message(error.what());
    return frame;
}

v1::TurnFrame StreamCoordinator::end_frame(int64_t tail_sequence) {
    v1::TurnFrame frame;
    frame.mutable_end_of_turn()->set_tail_sequence(tail_sequence);
    return frame;
}

// ============================================================================
// Turn
// ============================================================================

TurnReport StreamCoordinator::run_turn(Session& session, const v1::PlayerInput& input, FrameSink& sink) {
    TurnReport report;

    std::optional<TurnGuard> guard;
    try {
        guard.emplace(session);
    } catch (const StateConflictError& e) {
        report.rejected = true;
        report.tail_sequence = session.tail_sequence();
        log_warn("stream", "turn_rejected", {
            {"session_id", session.id()},
            {"error", e.what()}
        });
        report.disconnected = !sink.send(error_frame(e)) || !sink.send(end_frame(report.tail_sequence));
        return report;
    }

    int64_t turn_start = session.tail_sequence();
    auto before_turn = session.checkpoint();
    std::optional<v1::TurnFrame> failure;
    try {
        mechanics_.record_user_input(session, input.text());
        resolver_.resolve(input, session, mechanics_);
    } catch (const MechanicsError& e) {
        report.mechanics_failed = true;
        failure = error_frame(e);
        log_warn("stream", "turn_action_rejected", {
            {"session_id", session.id()},
            {"kind", e.kind()},
            {"error", e.what()}
        });
    }

    // Nothing is emitted before the store accepted it; a refused save leaves no trace.
    if (auto refused = persist(session, before_turn, report)) {
        failure = std::move(refused);
    }

    bool connected = emit_committed(session, turn_start, sink, report);
    if (connected && failure) {
        connected = sink.send(*failure);
    }
    if (connected && !failure) {
        stream_narration(session, input, turn_start, sink, report);
        connected = !report.disconnected;
    }

    if (!connected) {
        report.disconnected = true;
        log_info("stream", "consumer_disconnected", {
            {"session_id", session.id()},
            {"tail_sequence", session.tail_sequence()}
        });
        return report;
    }

    report.tail_sequence = session.tail_sequence();
    report.disconnected = !sink.send(end_frame(report.tail_sequence));

    log_info("stream", "turn_completed", {
        {"session_id", session.id()},
        {"mechanical_events", report.mechanical_events},
        {"narration_chars", report.narration.size()},
        {"narration_unavailable", report.narration_unavailable},
        {"persistence_failed", report.persistence_failed},
        {"tail_sequence", report.tail_sequence}
    });
    return report;
}

bool StreamCoordinator::emit_committed(Session& session, int64_t after_sequence, FrameSink& sink,
                                       TurnReport& report) {
    for (const auto& event : session.read(after_sequence + 1)) {
        if (!sink.send(event_frame(event))) {
            return false;
        }
        ++report.mechanical_events;
        log_debug("stream", "event_emitted", {
            {"session_id", session.id()},
            {"sequence", event.sequence()},
            {"kind", EventRenderer::kind_name(event.kind())},
            {"timestamp", helpers::format_timestamp(event.timestamp())}
        });
    }
    return true;
}

std::optional<v1::TurnFrame> StreamCoordinator::persist(Session& session, const Session::Checkpoint& checkpoint,
                                                        TurnReport& report) {
    try {
        repository_.save_or_restore(session, checkpoint);
        return std::nullopt;
    } catch (const PersistenceError& e) {
        report.persistence_failed = true;
        return error_frame(e);
    }
}

void StreamCoordinator::retire(PendingNarrator pending) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = pending_.erase(it);
        } else {
            ++it;
        }
    }
    pending_.push_back(std::move(pending));
    log_debug("stream", "narrator_retired", {{"pending_narrators", pending_.size()}});
}

void StreamCoordinator::stream_narration(Session& session, const v1::PlayerInput& input, int64_t turn_start,
                                         FrameSink& sink, TurnReport& report) {
    // The producer owns its inputs, so it can outlive this turn.
    auto request = std::make_shared<NarrationRequest>();
    request->session_id = session.id();
    request->player_text = input.text();
    request->history = session.read();
    for (const auto& event : request->history) {
        if (event.sequence() > turn_start) {
            request->turn_events.push_back(event);
        }
    }

    auto channel = std::make_shared<TokenChannel>(options_.token_buffer);
    log_debug("stream", "narration_started", {
        {"session_id", session.id()},
        {"turn_events", request->turn_events.size()},
        {"token_buffer", channel->capacity()}
    });

    PendingNarrator producer;
    producer.done = std::make_shared<std::atomic<bool>>(false);
    producer.thread = std::thread([&narrator = narrator_, request, channel, done = producer.done] {
        try {
            narrator.narrate(*request, *channel);
            channel->finish();
        } catch (const std::exception& e) {
            channel->fail(e.what());
        }
        done->store(true);
    });

    TagFilter filter;
    std::optional<std::string> unavailable;
    bool producer_ended = false;
    auto deadline = std::chrono::steady_clock::now() + options_.narration_timeout;
    std::string token;

    for (bool done = false; !done;) {
        switch (channel->pop_until(token, deadline)) {
            case TokenChannel::PopStatus::Token: {
                std::string text = filter.feed(token);
                if (!text.empty()) {
                    report.narration += text;
                    if (!sink.send(token_frame(text))) {
                        report.disconnected = true;
                        done = true;
                    }
                }
                break;
            }
            case TokenChannel::PopStatus::Finished: {
                producer_ended = true;
                std::string rest = filter.finish();
                if (!rest.empty()) {
                    report.narration += rest;
                    report.disconnected = !sink.send(token_frame(rest));
                }
                done = true;
                break;
            }
            case TokenChannel::PopStatus::Failed:
                producer_ended = true;
                unavailable = channel->failure().value_or("narrator failed");
                done = true;
                break;
            case TokenChannel::PopStatus::TimedOut:
                unavailable = "narration timed out after " +
                              std::to_string(options_.narration_timeout.count()) + " ms";
                done = true;
                break;
            case TokenChannel::PopStatus::Cancelled:
                report.disconnected = true;
                done = true;
                break;
        }
    }
    channel->cancel();
    if (producer_ended) {
        producer.thread.join();
    } else {
        retire(std::move(producer));
    }

    if (report.disconnected) {
        log_info("stream", "narration_abandoned", {
            {"session_id", session.id()},
            {"narration_chars", report.narration.size()}
        });
        return;
    }

    auto before_narration = session.checkpoint();
    if (!report.narration.empty()) {
        mechanics_.record_narrative(session, report.narration);
    }

    if (!unavailable) {
        if (auto refused = persist(session, before_narration, report)) {
            report.disconnected = !sink.send(*refused);
        }
        return;
    }

    report.narration_unavailable = true;
    log_warn("stream", "narration_unavailable", {
        {"session_id", session.id()},
        {"reason", *unavailable}
    });

    // The narrative chunk, if any, was already streamed; only the notice is new to the consumer.
    int64_t notice_after = session.tail_sequence();
    mechanics_.record_system_log(session, "Narration unavailable: " + *unavailable, "narrator");
    if (auto refused = persist(session, before_narration, report)) {
        report.disconnected = !sink.send(*refused) ||
                              !sink.send(error_frame(NarrationUnavailableError(*unavailable)));
        return;
    }
    report.disconnected = !emit_committed(session, notice_after, sink, report) ||
                          !sink.send(error_frame(NarrationUnavailableError(*unavailable)));
}

} // namespace fablecore
