#include "fablecore/in_memory_session_store.hpp"

namespace fablecore {

std::optional<v1::SessionRecord> InMemorySessionStore::load(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(session_id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemorySessionStore::save(const v1::SessionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.session_id()] = record;
}

bool InMemorySessionStore::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(session_id) > 0;
}

std::vector<std::string> InMemorySessionStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace fablecore
