#include "mechanics_grpc_service.hpp"
#include "fablecore/action_intent_resolver.hpp"
#include "fablecore/config.hpp"
#include "fablecore/dice.hpp"
#include "fablecore/errors.hpp"
#include "fablecore/json_file_session_store.hpp"
#include "fablecore/logging.hpp"
#include "fablecore/rendering_narrator.hpp"
#include "fablecore/session_service.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    fablecore::Config config;
    try {
        config = fablecore::Config::from_env();
    } catch (const fablecore::ValidationError& e) {
        fablecore::log_error("server", "invalid_configuration", {{"error", e.what()}});
        return 1;
    }
    fablecore::set_log_level(config.log_level);

    std::unique_ptr<fablecore::JsonFileSessionStore> store;
    try {
        store = std::make_unique<fablecore::JsonFileSessionStore>(config.data_dir);
    } catch (const fablecore::PersistenceError& e) {
        fablecore::log_error("server", "session_store_unavailable", {{"error", e.what()}});
        return 1;
    }
    fablecore::SeededDice dice(config.rng_seed);
    fablecore::ActionIntentResolver resolver;
    fablecore::RenderingNarrator narrator;

    fablecore::StreamOptions options;
    options.narration_timeout = config.narration_timeout;
    options.token_buffer = config.token_buffer;

    fablecore::SessionService sessions(*store, dice, resolver, narrator, options);

    std::string server_address = "0.0.0.0:" + std::to_string(config.port);

    grpc::EnableDefaultHealthCheckService(true);

    auto service = fablecore::create_mechanics_service(sessions);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        fablecore::log_error("server", "server_start_failed", {{"address", server_address}});
        return 1;
    }

    fablecore::log_info("server", "mechanics_server_started", {
        {"port", config.port},
        {"data_dir", config.data_dir},
        {"seeded", config.rng_seed.has_value()}
    });

    server->Wait();

    return 0;
}
