#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "errors.hpp"
#include "mechanics.hpp"
#include "session.hpp"
#include "session_repository.hpp"
#include "token_channel.hpp"

namespace fablecore {

/**
 * Executes the player's already-resolved intent against the session.
 * Every action goes through Mechanics, so each one commits atomically;
 * throwing a MechanicsError stops the remaining actions.
 */
class IntentResolver {
public:
    virtual ~IntentResolver() = default;

    virtual void resolve(const v1::PlayerInput& input, Session& session, Mechanics& mechanics) = 0;
};

struct NarrationRequest {
    std::string session_id;
    std::string player_text;
    /// Events committed by this turn, user input first.
    std::vector<v1::TimelineEvent> turn_events;
    /// Whole committed timeline, this turn included.
    std::vector<v1::TimelineEvent> history;
};

/**
 * Produces narration tokens for a turn whose mechanics are already
 * committed. Runs on its own thread.
 *
 * Implementations should return promptly once out.push() returns false.
 * One that overruns the narration timeout is left to finish on its own, so
 * narrate() may overlap the next turn's call. Throwing reports the narration
 * as unavailable.
 */
class Narrator {
public:
    virtual ~Narrator() = default;

    virtual void narrate(const NarrationRequest& request, TokenChannel& out) = 0;
};

/**
 * Outbound side of a turn stream. send() returns false once the consumer
 * has gone away.
 */
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual bool send(const v1::TurnFrame& frame) = 0;
};

struct StreamOptions {
    std::chrono::milliseconds narration_timeout{30000};
    std::size_t token_buffer = 64;
};

struct TurnReport {
    std::size_t mechanical_events = 0;
    std::string narration;
    int64_t tail_sequence = 0;
    bool rejected = false;
    bool mechanics_failed = false;
    bool narration_unavailable = false;
    bool persistence_failed = false;
    bool disconnected = false;
};

/**
 * Runs one player turn and writes it to a FrameSink in a fixed order:
 *
 *   1. the user-input event and every mechanical event of the turn, each
 *      emitted right after it is committed;
 *   2. narration tokens, with `<<...>>` control tags filtered out;
 *   3. an end-of-turn frame carrying the tail sequence.
 *
 * Narration starts only after all of the turn's mechanics are committed
 * and persisted. Errors are reported as error frames; the session stays
 * usable afterwards. A narrator that misses the timeout no longer holds the
 * turn: its thread is kept here and joined once it returns, at the latest
 * by the destructor.
 */
class StreamCoordinator {
public:
    StreamCoordinator(Mechanics& mechanics, IntentResolver& resolver, Narrator& narrator,
                      SessionRepository& repository, StreamOptions options = {});
    ~StreamCoordinator();

    StreamCoordinator(const StreamCoordinator&) = delete;
    StreamCoordinator& operator=(const StreamCoordinator&) = delete;

    TurnReport run_turn(Session& session, const v1::PlayerInput& input, FrameSink& sink);

    static v1::TurnFrame event_frame(const v1::TimelineEvent& event);
    static v1::TurnFrame token_frame(const std::string& token);
    static v1::TurnFrame error_frame(const MechanicsError& error);
    static v1::TurnFrame end_frame(int64_t tail_sequence);

private:
    /// Returns false when the consumer disconnected.
    bool emit_committed(Session& session, int64_t after_sequence, FrameSink& sink, TurnReport& report);

    /**
     * Persist the session. When the store refuses, the session goes back to
     * the checkpoint and the error frame for the consumer is returned.
     */
    std::optional<v1::TurnFrame> persist(Session& session, const Session::Checkpoint& checkpoint,
                                         TurnReport& report);

    void stream_narration(Session& session, const v1::PlayerInput& input, int64_t turn_start,
                          FrameSink& sink, TurnReport& report);

    struct PendingNarrator {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    /// Keep a narrator thread that outlived its turn; joins the ones that finished since.
    void retire(PendingNarrator pending);

    Mechanics& mechanics_;
    IntentResolver& resolver_;
    Narrator& narrator_;
    SessionRepository& repository_;
    StreamOptions options_;

    std::mutex pending_mutex_;
    std::vector<PendingNarrator> pending_;
};

} // namespace fablecore
