#include "fablecore/json_file_session_store.hpp"
#include "fablecore/errors.hpp"
#include "fablecore/logging.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <google/protobuf/util/json_util.h>

namespace fablecore {

namespace fs = std::filesystem;

namespace {

constexpr const char* kExtension = ".json";

} // anonymous namespace

JsonFileSessionStore::JsonFileSessionStore(fs::path base_dir)
    : base_dir_(std::move(base_dir)) {
    std::error_code ec;
    fs::create_directories(base_dir_, ec);
    if (ec) {
        throw PersistenceError("Cannot create session directory " + base_dir_.string() +
                               ": " + ec.message());
    }
}

void JsonFileSessionStore::validate_session_id(const std::string& session_id) {
    if (session_id.empty()) {
        throw ValidationError("session_id must not be empty");
    }
    bool valid = std::all_of(session_id.begin(), session_id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '-' || c == '_';
    });
    if (!valid) {
        throw ValidationError("session_id may only contain letters, digits, '-' and '_': " +
                              session_id);
    }
}

fs::path JsonFileSessionStore::path_for(const std::string& session_id) const {
    validate_session_id(session_id);
    return base_dir_ / (session_id + kExtension);
}

std::optional<v1::SessionRecord> JsonFileSessionStore::load(const std::string& session_id) {
    fs::path path = path_for(session_id);
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    v1::SessionRecord record;
    auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &record, options);
    if (!status.ok()) {
        throw PersistenceError("Corrupt session record " + path.string() + ": " + status.ToString());
    }
    return record;
}

void JsonFileSessionStore::save(const v1::SessionRecord& record) {
    fs::path path = path_for(record.session_id());

    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(record, &json, options);
    if (!status.ok()) {
        throw PersistenceError("Cannot encode session " + record.session_id() + ": " + status.ToString());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    fs::path temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            throw PersistenceError("Cannot open " + temp.string() + " for writing");
        }
        out << json;
        out.flush();
        if (!out) {
            throw PersistenceError("Failed writing " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, path, ec);
    if (ec) {
        fs::remove(temp, ec);
        throw PersistenceError("Cannot replace " + path.string() + ": " + ec.message());
    }
    log_debug("session_store", "session_saved", {
        {"session_id", record.session_id()},
        {"events", record.events_size()},
        {"path", path.string()}
    });
}

bool JsonFileSessionStore::remove(const std::string& session_id) {
    fs::path path = path_for(session_id);
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throw PersistenceError("Cannot remove " + path.string() + ": " + ec.message());
    }
    return removed;
}

std::vector<std::string> JsonFileSessionStore::list() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> ids;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(base_dir_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == kExtension) {
            ids.push_back(entry.path().stem().string());
        }
    }
    if (ec) {
        throw PersistenceError("Cannot list " + base_dir_.string() + ": " + ec.message());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace fablecore
