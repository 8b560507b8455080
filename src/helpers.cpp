#include "fablecore/helpers.hpp"
#include <chrono>
#include <google/protobuf/util/time_util.h>

namespace fablecore {
namespace helpers {

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

std::string format_timestamp(const google::protobuf::Timestamp& ts) {
    return google::protobuf::util::TimeUtil::ToString(ts);
}

} // namespace helpers
} // namespace fablecore
