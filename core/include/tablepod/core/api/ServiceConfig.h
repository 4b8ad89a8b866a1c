#pragma once

#include "tablepod/core/model/Settings.h"
#include "tablepod/core/pairing/RoundTypes.h"

#include <string>

namespace tablepod::core::api {

struct SessionsConfig {
    int code_length = 6;
    int ttl_minutes = 7 * 24 * 60;
    int sweep_interval_seconds = 60;
    int min_participants = 6;
};

struct PairingConfig {
    bool score_against_pool = true;
    // "progressive" or "flat".
    std::string fairness = "progressive";
};

struct StorageConfig {
    bool enabled = false;
    std::string sessions_dir = "data/sessions";
};

struct BroadcastConfig {
    // Empty or "event_feed".
    std::string adapter;
    std::string feed_path = "out/events.jsonl";
    bool include_session = false;
};

struct LoggingConfig {
    int max_lines = 2000;
    bool mirror_stderr = true;
};

struct ServiceConfig {
    SessionsConfig sessions;
    model::Settings defaults;
    PairingConfig pairing;
    StorageConfig storage;
    BroadcastConfig broadcast;
    LoggingConfig logging;

    pairing::SelectorOptions selector_options() const;

    static bool LoadFromFile(const std::string& path, ServiceConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const ServiceConfig& config, std::string* error);
    static std::string ToJsonString(const ServiceConfig& config);
};

}  // namespace tablepod::core::api
