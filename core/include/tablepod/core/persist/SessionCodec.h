#pragma once

#include "tablepod/core/model/Participant.h"
#include "tablepod/core/model/Session.h"
#include "tablepod/core/model/Settings.h"
#include "tablepod/core/model/Table.h"

#include <nlohmann/json.hpp>

#include <string>

namespace tablepod::core::persist {

// Timestamps are written as ISO-8601 UTC with millisecond precision.
constexpr int kSessionFormatVersion = 1;

nlohmann::json SettingsToJson(const model::Settings& settings);
// Missing keys keep the value from defaults.
model::Settings SettingsFromJson(const nlohmann::json& node, const model::Settings& defaults = {});

nlohmann::json ParticipantToJson(const model::Participant& participant);
nlohmann::json TableToJson(const model::Table& table);
nlohmann::json RoundToJson(const model::Round& round);
nlohmann::json SessionToJson(const model::Session& session);

// Throw nlohmann::json::exception or std::invalid_argument on malformed input.
model::Participant ParticipantFromJson(const nlohmann::json& node);
model::Table TableFromJson(const nlohmann::json& node);
model::Round RoundFromJson(const nlohmann::json& node);

bool SessionFromJson(const nlohmann::json& node, model::Session& session, std::string* error);
bool ParseSession(const std::string& text, model::Session& session, std::string* error);

}  // namespace tablepod::core::persist
