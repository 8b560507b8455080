#pragma once

#include <filesystem>
#include <mutex>
#include "session_store.hpp"

namespace fablecore {

/**
 * One JSON document per session under a base directory
 * (`<base_dir>/<session_id>.json`), in protobuf's canonical JSON mapping.
 *
 * Writes go to a temporary file that is then renamed over the old record,
 * so a crash mid-write never leaves a truncated document behind.
 */
class JsonFileSessionStore final : public SessionStore {
public:
    explicit JsonFileSessionStore(std::filesystem::path base_dir);

    std::optional<v1::SessionRecord> load(const std::string& session_id) override;
    void save(const v1::SessionRecord& record) override;
    bool remove(const std::string& session_id) override;
    std::vector<std::string> list() override;

    const std::filesystem::path& base_dir() const { return base_dir_; }

    /**
     * Session ids become file names, so only letters, digits, '-' and '_'
     * are accepted. Throws ValidationError otherwise.
     */
    static void validate_session_id(const std::string& session_id);

private:
    std::filesystem::path path_for(const std::string& session_id) const;

    std::filesystem::path base_dir_;
    std::mutex mutex_;
};

} // namespace fablecore
