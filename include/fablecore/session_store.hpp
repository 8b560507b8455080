#pragma once

#include <optional>
#include <string>
#include <vector>
#include "fablecore/mechanics.pb.h"

namespace fablecore {

/**
 * Durable storage for session records, keyed by session id.
 *
 * Implementations report I/O and decoding failures as PersistenceError.
 */
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual std::optional<v1::SessionRecord> load(const std::string& session_id) = 0;
    virtual void save(const v1::SessionRecord& record) = 0;

    /// Returns false when no record existed.
    virtual bool remove(const std::string& session_id) = 0;

    /// Stored session ids in ascending order.
    virtual std::vector<std::string> list() = 0;
};

} // namespace fablecore
