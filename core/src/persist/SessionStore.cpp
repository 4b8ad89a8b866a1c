#include "tablepod/core/persist/SessionStore.h"

#include "tablepod/core/persist/SessionCodec.h"
#include "tablepod/core/util/AtomicFileWriter.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace tablepod::core::persist {

JsonFileSessionStore::JsonFileSessionStore(std::string directory,
                                           std::function<void(const std::string&)> log_fn)
    : directory_(std::move(directory)), log_fn_(std::move(log_fn)) {}

std::string JsonFileSessionStore::PathFor(const std::string& code) const {
    return (std::filesystem::path(directory_) / (code + ".json")).string();
}

bool JsonFileSessionStore::Save(const model::Session& session, std::string* error) {
    if (session.code.empty()) {
        if (error) {
            *error = "Cannot save a session without a code";
        }
        return false;
    }
    return util::AtomicFileWriter::Write(PathFor(session.code), SessionToJson(session).dump(2), error);
}

std::vector<model::Session> JsonFileSessionStore::LoadAll(std::string* error) {
    std::vector<model::Session> sessions;
    std::error_code ec;
    if (!std::filesystem::exists(directory_, ec)) {
        return sessions;
    }

    std::ostringstream failures;
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        std::ifstream input(entry.path(), std::ios::binary);
        if (!input) {
            failures << "cannot open " << entry.path().string() << "; ";
            continue;
        }
        std::ostringstream buffer;
        buffer << input.rdbuf();

        model::Session session;
        std::string decode_error;
        if (!ParseSession(buffer.str(), session, &decode_error)) {
            Log(entry.path().string() + ": " + decode_error);
            failures << entry.path().filename().string() << ": " << decode_error << "; ";
            continue;
        }
        sessions.push_back(std::move(session));
    }
    if (ec) {
        failures << "cannot list " << directory_ << ": " << ec.message();
    }

    if (error) {
        *error = failures.str();
    }
    Log("loaded " + std::to_string(sessions.size()) + " sessions from " + directory_);
    return sessions;
}

void JsonFileSessionStore::Log(const std::string& message) const {
    if (log_fn_) {
        log_fn_("[store] " + message);
    } else {
        std::cerr << "[store] " << message << "\n";
    }
}

}  // namespace tablepod::core::persist
