#pragma once

#include <map>
#include <mutex>
#include "session_store.hpp"

namespace fablecore {

/// Process-local store, for tests and embedding.
class InMemorySessionStore final : public SessionStore {
public:
    std::optional<v1::SessionRecord> load(const std::string& session_id) override;
    void save(const v1::SessionRecord& record) override;
    bool remove(const std::string& session_id) override;
    std::vector<std::string> list() override;

private:
    std::mutex mutex_;
    std::map<std::string, v1::SessionRecord> records_;
};

} // namespace fablecore
