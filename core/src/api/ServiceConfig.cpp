#include "tablepod/core/api/ServiceConfig.h"

#include "tablepod/core/persist/SessionCodec.h"
#include "tablepod/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>

namespace tablepod::core::api {

namespace {

bool LoadJson(const std::string& path, nlohmann::json& config, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open config: " + path;
        }
        return false;
    }
    try {
        input >> config;
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    return true;
}

nlohmann::json ToJson(const ServiceConfig& config) {
    nlohmann::json root;
    root["sessions"] = {
        {"code_length", config.sessions.code_length},
        {"ttl_minutes", config.sessions.ttl_minutes},
        {"sweep_interval_seconds", config.sessions.sweep_interval_seconds},
        {"min_participants", config.sessions.min_participants},
    };
    root["defaults"] = persist::SettingsToJson(config.defaults);
    root["pairing"] = {
        {"score_against_pool", config.pairing.score_against_pool},
        {"fairness", config.pairing.fairness},
    };
    root["storage"] = {
        {"enabled", config.storage.enabled},
        {"sessions_dir", config.storage.sessions_dir},
    };
    root["broadcast"] = {
        {"adapter", config.broadcast.adapter},
        {"feed_path", config.broadcast.feed_path},
        {"include_session", config.broadcast.include_session},
    };
    root["logging"] = {
        {"max_lines", config.logging.max_lines},
        {"mirror_stderr", config.logging.mirror_stderr},
    };
    return root;
}

}  // namespace

pairing::SelectorOptions ServiceConfig::selector_options() const {
    pairing::SelectorOptions options;
    options.score_against_pool = pairing.score_against_pool;
    options.fairness = pairing.fairness == "flat" ? pairing::FairnessMode::Flat : pairing::FairnessMode::Progressive;
    return options;
}

bool ServiceConfig::LoadFromFile(const std::string& path, ServiceConfig& config, std::string* error) {
    nlohmann::json root;
    if (!LoadJson(path, root, error)) {
        return false;
    }

    config = ServiceConfig{};

    try {
        if (root.contains("sessions")) {
            const auto& node = root.at("sessions");
            config.sessions.code_length = node.value("code_length", config.sessions.code_length);
            config.sessions.ttl_minutes = node.value("ttl_minutes", config.sessions.ttl_minutes);
            config.sessions.sweep_interval_seconds =
                node.value("sweep_interval_seconds", config.sessions.sweep_interval_seconds);
            config.sessions.min_participants = node.value("min_participants", config.sessions.min_participants);
        }

        if (root.contains("defaults")) {
            config.defaults = persist::SettingsFromJson(root.at("defaults"), config.defaults);
        }

        if (root.contains("pairing")) {
            const auto& node = root.at("pairing");
            config.pairing.score_against_pool = node.value("score_against_pool", config.pairing.score_against_pool);
            config.pairing.fairness = node.value("fairness", config.pairing.fairness);
        }

        if (root.contains("storage")) {
            const auto& node = root.at("storage");
            config.storage.enabled = node.value("enabled", config.storage.enabled);
            config.storage.sessions_dir = node.value("sessions_dir", config.storage.sessions_dir);
        }

        if (root.contains("broadcast")) {
            const auto& node = root.at("broadcast");
            config.broadcast.adapter = node.value("adapter", config.broadcast.adapter);
            config.broadcast.feed_path = node.value("feed_path", config.broadcast.feed_path);
            config.broadcast.include_session = node.value("include_session", config.broadcast.include_session);
        }

        if (root.contains("logging")) {
            const auto& node = root.at("logging");
            config.logging.max_lines = node.value("max_lines", config.logging.max_lines);
            config.logging.mirror_stderr = node.value("mirror_stderr", config.logging.mirror_stderr);
        }
    } catch (const nlohmann::json::exception& ex) {
        if (error) {
            *error = std::string("Invalid config value: ") + ex.what();
        }
        return false;
    }

    if (config.pairing.fairness != "progressive" && config.pairing.fairness != "flat") {
        if (error) {
            *error = "pairing.fairness must be \"progressive\" or \"flat\"";
        }
        return false;
    }
    if (config.defaults.max_table_size < 3 || config.defaults.max_table_size > 4) {
        if (error) {
            *error = "defaults.max_table_size must be 3 or 4";
        }
        return false;
    }
    if (config.sessions.min_participants < 1) {
        if (error) {
            *error = "sessions.min_participants must be positive";
        }
        return false;
    }
    return true;
}

bool ServiceConfig::SaveToFile(const std::string& path, const ServiceConfig& config, std::string* error) {
    return util::AtomicFileWriter::Write(path, ToJson(config).dump(2), error);
}

std::string ServiceConfig::ToJsonString(const ServiceConfig& config) {
    return ToJson(config).dump(2);
}

}  // namespace tablepod::core::api
