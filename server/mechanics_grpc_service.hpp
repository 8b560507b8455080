#pragma once

#include <memory>
#include "fablecore/mechanics_service.grpc.pb.h"
#include "fablecore/session_service.hpp"

namespace fablecore {

/// gRPC adapter over SessionService. MechanicsErrors become grpc::Status codes.
std::unique_ptr<v1::MechanicsService::Service> create_mechanics_service(SessionService& sessions);

} // namespace fablecore
