#include "mechanics_grpc_service.hpp"
#include "fablecore/errors.hpp"
#include "fablecore/logging.hpp"
#include <grpcpp/grpcpp.h>

namespace fablecore {

namespace {

void fill_combat_response(const CombatResult& result, v1::CombatResponse* response) {
    for (const auto& event : result.events) {
        *response->add_events() = event;
    }
    if (result.combat_state) {
        *response->mutable_combat_state() = result.combat_state->to_snapshot();
    }
}

/// Writes frames to the gRPC stream; a failed write means the client left.
class WriterSink final : public FrameSink {
public:
    WriterSink(grpc::ServerContext* context, grpc::ServerWriter<v1::TurnFrame>* writer)
        : context_(context), writer_(writer) {}

    bool send(const v1::TurnFrame& frame) override {
        if (context_->IsCancelled()) {
            return false;
        }
        return writer_->Write(frame);
    }

private:
    grpc::ServerContext* context_;
    grpc::ServerWriter<v1::TurnFrame>* writer_;
};

} // anonymous namespace

class MechanicsGrpcService final : public v1::MechanicsService::Service {
public:
    explicit MechanicsGrpcService(SessionService& sessions) : sessions_(sessions) {}

    grpc::Status CreateSession(grpc::ServerContext*, const v1::CreateSessionRequest* request,
                               v1::CreateSessionResponse* response) override {
        return guarded("CreateSession", [&] {
            response->set_session_id(sessions_.create_session(request->session_id()));
        });
    }

    grpc::Status DeleteSession(grpc::ServerContext*, const v1::DeleteSessionRequest* request,
                               v1::DeleteSessionResponse*) override {
        return guarded("DeleteSession", [&] {
            sessions_.delete_session(request->session_id());
        });
    }

    grpc::Status ListSessions(grpc::ServerContext*, const v1::ListSessionsRequest*,
                              v1::ListSessionsResponse* response) override {
        return guarded("ListSessions", [&] {
            for (const auto& id : sessions_.list_sessions()) {
                response->add_session_ids(id);
            }
        });
    }

    grpc::Status BeginCombat(grpc::ServerContext*, const v1::BeginCombatRequest* request,
                             v1::CombatResponse* response) override {
        return guarded("BeginCombat", [&] {
            std::vector<v1::Combatant> roster(request->roster().begin(), request->roster().end());
            fill_combat_response(sessions_.begin_combat(request->session_id(), roster), response);
        });
    }

    grpc::Status PerformAttack(grpc::ServerContext*, const v1::PerformAttackRequest* request,
                               v1::CombatResponse* response) override {
        return guarded("PerformAttack", [&] {
            AttackOptions options;
            options.situational_modifier = request->attack_modifier();
            options.advantage = request->advantage();
            fill_combat_response(sessions_.perform_attack(request->session_id(), request->actor_id(),
                                                          request->target_id(), request->weapon(), options),
                                 response);
        });
    }

    grpc::Status Flee(grpc::ServerContext*, const v1::ActorRequest* request,
                      v1::CombatResponse* response) override {
        return guarded("Flee", [&] {
            fill_combat_response(sessions_.flee(request->session_id(), request->actor_id()), response);
        });
    }

    grpc::Status EndTurn(grpc::ServerContext*, const v1::ActorRequest* request,
                         v1::CombatResponse* response) override {
        return guarded("EndTurn", [&] {
            fill_combat_response(sessions_.end_turn(request->session_id(), request->actor_id()), response);
        });
    }

    grpc::Status ApplyDirectDamage(grpc::ServerContext*, const v1::ApplyDirectDamageRequest* request,
                                   v1::CombatResponse* response) override {
        return guarded("ApplyDirectDamage", [&] {
            fill_combat_response(sessions_.apply_direct_damage(request->session_id(), request->target_id(),
                                                               request->amount(), request->source()),
                                 response);
        });
    }

    grpc::Status EndCombat(grpc::ServerContext*, const v1::EndCombatRequest* request,
                           v1::CombatResponse* response) override {
        return guarded("EndCombat", [&] {
            fill_combat_response(sessions_.end_combat(request->session_id(), request->reason()), response);
        });
    }

    grpc::Status PerformSkillCheck(grpc::ServerContext*, const v1::PerformSkillCheckRequest* request,
                                   v1::PerformSkillCheckResponse* response) override {
        return guarded("PerformSkillCheck", [&] {
            auto outcome = sessions_.perform_skill_check(
                request->session_id(), SkillCheckRequest::from_proto(request->check()));
            response->set_target(outcome.result.target);
            response->set_roll(outcome.result.roll);
            response->set_success(outcome.result.success);
            response->set_margin(outcome.result.margin);
            *response->mutable_event() = outcome.event;
        });
    }

    grpc::Status ApplyInventoryDelta(grpc::ServerContext*, const v1::ApplyInventoryDeltaRequest* request,
                                     v1::EventsResponse* response) override {
        return guarded("ApplyInventoryDelta", [&] {
            for (const auto& event : sessions_.apply_inventory_delta(
                     request->session_id(), request->item_id(),
                     request->quantity_delta(), request->currency_delta())) {
                *response->add_events() = event;
            }
        });
    }

    grpc::Status OfferChoices(grpc::ServerContext*, const v1::OfferChoicesRequest* request,
                              v1::EventsResponse* response) override {
        return guarded("OfferChoices", [&] {
            std::vector<v1::Choice> choices(request->choices().begin(), request->choices().end());
            *response->add_events() = sessions_.offer_choices(request->session_id(), choices);
        });
    }

    grpc::Status GetHistory(grpc::ServerContext*, const v1::GetHistoryRequest* request,
                            v1::EventsResponse* response) override {
        return guarded("GetHistory", [&] {
            for (const auto& event : sessions_.get_history(request->session_id(), request->from_sequence())) {
                *response->add_events() = event;
            }
        });
    }

    grpc::Status GetRestorePoints(grpc::ServerContext*, const v1::GetRestorePointsRequest* request,
                                  v1::GetRestorePointsResponse* response) override {
        return guarded("GetRestorePoints", [&] {
            for (const auto& point : sessions_.get_restore_points(request->session_id())) {
                *response->add_restore_points() = point;
            }
        });
    }

    grpc::Status RestoreHistory(grpc::ServerContext*, const v1::RestoreHistoryRequest* request,
                                v1::RestoreHistoryResponse* response) override {
        return guarded("RestoreHistory", [&] {
            response->set_tail_sequence(
                sessions_.restore_history(request->session_id(), request->target_sequence()));
        });
    }

    grpc::Status StreamTurn(grpc::ServerContext* context, const v1::StreamTurnRequest* request,
                            grpc::ServerWriter<v1::TurnFrame>* writer) override {
        WriterSink sink(context, writer);
        auto report = sessions_.stream_turn(request->session_id(), request->input(), sink);
        if (report.disconnected) {
            return grpc::Status(grpc::StatusCode::CANCELLED, "Client disconnected");
        }
        return grpc::Status::OK;
    }

private:
    template<typename Fn>
    grpc::Status guarded(const char* method, Fn&& fn) {
        try {
            fn();
            return grpc::Status::OK;
        } catch (const MechanicsError& e) {
            log_warn("grpc", "request_rejected", {
                {"method", method},
                {"kind", e.kind()},
                {"error", e.what()}
            });
            return e.to_grpc_status();
        }
    }

    SessionService& sessions_;
};

std::unique_ptr<v1::MechanicsService::Service> create_mechanics_service(SessionService& sessions) {
    return std::make_unique<MechanicsGrpcService>(sessions);
}

} // namespace fablecore
