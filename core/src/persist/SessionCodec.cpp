#include "tablepod/core/persist/SessionCodec.h"

#include "tablepod/core/util/Timestamp.h"

#include <stdexcept>

namespace tablepod::core::persist {

namespace {

nlohmann::json TimeToJson(util::TimePoint timestamp) {
    return util::FormatUtcTimestamp(timestamp);
}

nlohmann::json OptionalTimeToJson(const std::optional<util::TimePoint>& timestamp) {
    if (!timestamp.has_value()) {
        return nullptr;
    }
    return util::FormatUtcTimestamp(*timestamp);
}

util::TimePoint TimeFromJson(const nlohmann::json& node, const char* key) {
    util::TimePoint timestamp{};
    if (!node.contains(key) || node.at(key).is_null()) {
        return timestamp;
    }
    const auto text = node.at(key).get<std::string>();
    if (!util::ParseUtcTimestamp(text, timestamp)) {
        throw std::invalid_argument(std::string("invalid timestamp for ") + key + ": " + text);
    }
    return timestamp;
}

std::optional<util::TimePoint> OptionalTimeFromJson(const nlohmann::json& node, const char* key) {
    if (!node.contains(key) || node.at(key).is_null()) {
        return std::nullopt;
    }
    return TimeFromJson(node, key);
}

}  // namespace

nlohmann::json SettingsToJson(const model::Settings& settings) {
    return {
        {"allow_join_after_start", settings.allow_join_after_start},
        {"prioritize_winners", settings.prioritize_winners},
        {"allow_three_seat_tables", settings.allow_three_seat_tables},
        {"extra_three_seat_penalty", settings.extra_three_seat_penalty},
        {"allow_custom_groups", settings.allow_custom_groups},
        {"round_length_minutes", settings.round_length_minutes},
        {"use_points", settings.use_points},
        {"points_for_win", settings.points_for_win},
        {"points_for_draw", settings.points_for_draw},
        {"points_for_loss", settings.points_for_loss},
        {"points_for_bye", settings.points_for_bye},
        {"max_rounds", settings.max_rounds},
        {"max_table_size", settings.max_table_size},
    };
}

model::Settings SettingsFromJson(const nlohmann::json& node, const model::Settings& defaults) {
    model::Settings settings = defaults;
    if (!node.is_object()) {
        return settings;
    }
    settings.allow_join_after_start = node.value("allow_join_after_start", settings.allow_join_after_start);
    settings.prioritize_winners = node.value("prioritize_winners", settings.prioritize_winners);
    settings.allow_three_seat_tables = node.value("allow_three_seat_tables", settings.allow_three_seat_tables);
    settings.extra_three_seat_penalty = node.value("extra_three_seat_penalty", settings.extra_three_seat_penalty);
    settings.allow_custom_groups = node.value("allow_custom_groups", settings.allow_custom_groups);
    settings.round_length_minutes = node.value("round_length_minutes", settings.round_length_minutes);
    settings.use_points = node.value("use_points", settings.use_points);
    settings.points_for_win = node.value("points_for_win", settings.points_for_win);
    settings.points_for_draw = node.value("points_for_draw", settings.points_for_draw);
    settings.points_for_loss = node.value("points_for_loss", settings.points_for_loss);
    settings.points_for_bye = node.value("points_for_bye", settings.points_for_bye);
    settings.max_rounds = node.value("max_rounds", settings.max_rounds);
    settings.max_table_size = node.value("max_table_size", settings.max_table_size);
    return settings;
}

nlohmann::json ParticipantToJson(const model::Participant& participant) {
    return {
        {"id", participant.id},
        {"name", participant.name},
        {"role", participant.role},
        {"points", participant.points},
        {"joined_at", TimeToJson(participant.joined_at)},
        {"dropped", participant.dropped},
        {"order", participant.order},
        {"custom_group_id", participant.custom_group_id},
        {"auto_fill", participant.auto_fill},
    };
}

nlohmann::json TableToJson(const model::Table& table) {
    nlohmann::json node = {
        {"number", table.number},
        {"round_number", table.round_number},
        {"result", model::ToString(table.result)},
        {"winner_id", table.winner_id},
        {"started_at", OptionalTimeToJson(table.started_at)},
        {"completed_at", OptionalTimeToJson(table.completed_at)},
        {"round_started", table.round_started},
        {"statistics", table.statistics},
        {"is_custom", table.is_custom},
        {"auto_fill", table.auto_fill},
    };
    node["seats"] = nlohmann::json::array();
    for (const auto& seat : table.seats) {
        node["seats"].push_back(ParticipantToJson(seat));
    }
    return node;
}

nlohmann::json RoundToJson(const model::Round& round) {
    nlohmann::json node = nlohmann::json::array();
    for (const auto& table : round) {
        node.push_back(TableToJson(table));
    }
    return node;
}

nlohmann::json SessionToJson(const model::Session& session) {
    nlohmann::json root;
    root["version"] = kSessionFormatVersion;
    root["code"] = session.code;
    root["host_id"] = session.host_id;
    root["event_name"] = session.event_name;
    root["created_at"] = TimeToJson(session.created_at);
    root["expires_at"] = TimeToJson(session.expires_at);
    root["settings"] = SettingsToJson(session.settings);
    root["current_round"] = session.current_round;
    root["started"] = session.started;
    root["ended"] = session.ended;
    root["archived"] = session.archived;

    root["participants"] = nlohmann::json::array();
    for (const auto& [id, participant] : session.participants) {
        root["participants"].push_back(ParticipantToJson(participant));
    }

    root["tables"] = session.tables.has_value() ? RoundToJson(*session.tables) : nlohmann::json(nullptr);

    root["archived_rounds"] = nlohmann::json::array();
    for (const auto& round : session.archived_rounds) {
        root["archived_rounds"].push_back(RoundToJson(round));
    }
    return root;
}

model::Participant ParticipantFromJson(const nlohmann::json& node) {
    model::Participant participant;
    participant.id = node.at("id").get<std::string>();
    if (participant.id.empty()) {
        throw std::invalid_argument("participant without id");
    }
    participant.name = node.value("name", "");
    participant.role = node.value("role", "");
    participant.points = node.value("points", 0);
    participant.joined_at = TimeFromJson(node, "joined_at");
    participant.dropped = node.value("dropped", false);
    participant.order = node.value("order", 0);
    participant.custom_group_id = node.value("custom_group_id", "");
    participant.auto_fill = node.value("auto_fill", false);
    return participant;
}

model::Table TableFromJson(const nlohmann::json& node) {
    model::Table table;
    table.number = node.value("number", 0);
    table.round_number = node.value("round_number", 0);
    const auto result = node.value("result", "none");
    if (!model::ResultKindFromString(result, table.result)) {
        throw std::invalid_argument("unknown table result: " + result);
    }
    table.winner_id = node.value("winner_id", "");
    table.started_at = OptionalTimeFromJson(node, "started_at");
    table.completed_at = OptionalTimeFromJson(node, "completed_at");
    table.round_started = node.value("round_started", false);
    if (node.contains("statistics") && node.at("statistics").is_object()) {
        table.statistics = node.at("statistics");
    }
    table.is_custom = node.value("is_custom", false);
    table.auto_fill = node.value("auto_fill", false);
    if (node.contains("seats")) {
        for (const auto& seat : node.at("seats")) {
            table.AddSeat(ParticipantFromJson(seat));
        }
    }
    return table;
}

model::Round RoundFromJson(const nlohmann::json& node) {
    model::Round round;
    for (const auto& table : node) {
        round.push_back(TableFromJson(table));
    }
    return round;
}

bool SessionFromJson(const nlohmann::json& node, model::Session& session, std::string* error) {
    try {
        model::Session loaded;
        const int version = node.value("version", kSessionFormatVersion);
        if (version > kSessionFormatVersion) {
            throw std::invalid_argument("unsupported session format version " + std::to_string(version));
        }
        loaded.code = node.at("code").get<std::string>();
        if (loaded.code.empty()) {
            throw std::invalid_argument("session without code");
        }
        loaded.host_id = node.value("host_id", "");
        loaded.event_name = node.value("event_name", "");
        loaded.created_at = TimeFromJson(node, "created_at");
        loaded.expires_at = TimeFromJson(node, "expires_at");
        loaded.settings = SettingsFromJson(node.value("settings", nlohmann::json::object()));
        loaded.current_round = node.value("current_round", 0);
        loaded.started = node.value("started", false);
        loaded.ended = node.value("ended", false);
        loaded.archived = node.value("archived", false);

        if (node.contains("participants")) {
            for (const auto& entry : node.at("participants")) {
                auto participant = ParticipantFromJson(entry);
                const auto id = participant.id;
                if (!loaded.participants.emplace(id, std::move(participant)).second) {
                    throw std::invalid_argument("duplicate participant id: " + id);
                }
            }
        }
        if (node.contains("tables") && !node.at("tables").is_null()) {
            loaded.tables = RoundFromJson(node.at("tables"));
        }
        if (node.contains("archived_rounds")) {
            for (const auto& round : node.at("archived_rounds")) {
                loaded.archived_rounds.push_back(RoundFromJson(round));
            }
        }
        session = std::move(loaded);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to decode session: ") + ex.what();
        }
        return false;
    }
    return true;
}

bool ParseSession(const std::string& text, model::Session& session, std::string* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse session: ") + ex.what();
        }
        return false;
    }
    return SessionFromJson(root, session, error);
}

}  // namespace tablepod::core::persist
