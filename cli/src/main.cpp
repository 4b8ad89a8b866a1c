#include "tablepod/core/api/ServiceConfig.h"
#include "tablepod/core/api/SessionService.h"
#include "tablepod/core/persist/SessionCodec.h"
#include "tablepod/core/session/RoundController.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using tablepod::core::api::CommandResult;
using tablepod::core::api::ServiceConfig;
using tablepod::core::api::SessionService;

struct ScriptState {
    std::string code;
    std::string host_id;
    int failures = 0;
};

std::vector<std::string> Tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream input(line);
    std::string token;
    while (input >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string JoinTokens(const std::vector<std::string>& tokens, size_t first) {
    std::string joined;
    for (size_t i = first; i < tokens.size(); ++i) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += tokens[i];
    }
    return joined;
}

bool ParseInt(const std::string& text, int& value) {
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

void PrintTables(const tablepod::core::model::Round& tables) {
    for (const auto& table : tables) {
        std::cout << "  table " << std::setw(2) << table.number << (table.is_custom ? " (custom)" : "")
                  << " [" << tablepod::core::model::ToString(table.state()) << "]";
        if (table.result == tablepod::core::model::ResultKind::Win) {
            std::cout << " winner=" << table.winner_id;
        } else if (table.result == tablepod::core::model::ResultKind::Draw) {
            std::cout << " draw";
        }
        std::cout << ":";
        for (const auto& seat : table.seats) {
            std::cout << ' ' << seat.order << '.' << seat.name;
            if (!seat.role.empty()) {
                std::cout << '(' << seat.role << ')';
            }
        }
        std::cout << '\n';
    }
}

bool Report(const std::string& command, const CommandResult& result, ScriptState& state) {
    if (!result.ok()) {
        std::cout << "[tablepodcli] " << command << " failed: " << tablepod::core::session::ToString(result.status)
                  << " (" << result.message << ")" << '\n';
        state.failures += 1;
        return false;
    }
    std::cout << "[tablepodcli] " << command << " ok";
    if (result.round_number > 0) {
        std::cout << ", round " << result.round_number;
    }
    if (!result.custom_group_id.empty()) {
        std::cout << ", group " << result.custom_group_id;
    }
    std::cout << '\n';
    PrintTables(result.tables);
    return true;
}

// Builds a settings object from key=value tokens; values are parsed as JSON
// when possible so booleans and numbers keep their types.
bool ApplySettings(const std::vector<std::string>& tokens,
                   const tablepod::core::model::Settings& current,
                   tablepod::core::model::Settings& updated,
                   std::string& event_name) {
    nlohmann::json node = tablepod::core::persist::SettingsToJson(current);
    for (size_t i = 1; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        const auto eq = token.find('=');
        if (eq == std::string::npos) {
            std::cerr << "[tablepodcli] expected key=value, got " << token << '\n';
            return false;
        }
        const auto key = token.substr(0, eq);
        const auto value = token.substr(eq + 1);
        if (key == "event") {
            event_name = value;
            continue;
        }
        if (!node.contains(key)) {
            std::cerr << "[tablepodcli] unknown setting " << key << '\n';
            return false;
        }
        try {
            node[key] = nlohmann::json::parse(value);
        } catch (const nlohmann::json::exception&) {
            std::cerr << "[tablepodcli] invalid value for " << key << ": " << value << '\n';
            return false;
        }
    }
    try {
        updated = tablepod::core::persist::SettingsFromJson(node, current);
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[tablepodcli] " << ex.what() << '\n';
        return false;
    }
    return true;
}

void RunLine(SessionService& service, const std::vector<std::string>& tokens, ScriptState& state) {
    namespace session = tablepod::core::session;
    const auto& command = tokens.front();

    if (command == "create") {
        if (tokens.size() < 2) {
            std::cerr << "[tablepodcli] usage: create <host> [event name]" << '\n';
            state.failures += 1;
            return;
        }
        const auto result = service.createSession(tokens[1], 0, std::chrono::minutes(0), JoinTokens(tokens, 2));
        if (Report("create", result, state)) {
            state.code = result.code;
            state.host_id = tokens[1];
            std::cout << "  code " << state.code << '\n';
        }
        return;
    }
    if (command == "use" && tokens.size() >= 2) {
        state.code = tokens[1];
        return;
    }
    if (command == "restore") {
        std::string error;
        const int restored = service.restoreSessions(&error);
        std::cout << "[tablepodcli] restored " << restored << " sessions" << '\n';
        if (!error.empty()) {
            std::cout << "  " << error << '\n';
        }
        return;
    }
    if (command == "join" && tokens.size() >= 2) {
        const auto result = service.join(state.code, tokens[1], tokens.size() > 2 ? tokens[2] : "",
                                         tokens.size() > 3 ? tokens[3] : "");
        if (!result.ok()) {
            std::cout << "[tablepodcli] join " << tokens[1] << " failed: " << session::ToString(result.status)
                      << " (" << result.message << ")" << '\n';
            state.failures += 1;
        }
        return;
    }
    if (command == "settings") {
        const auto snapshot = service.getSession(state.code);
        if (!snapshot.has_value()) {
            std::cout << "[tablepodcli] settings failed: unknown session" << '\n';
            state.failures += 1;
            return;
        }
        tablepod::core::model::Settings updated;
        std::string event_name;
        if (!ApplySettings(tokens, snapshot->settings, updated, event_name)) {
            state.failures += 1;
            return;
        }
        Report("settings", service.updateSettings(state.code, state.host_id, updated, event_name), state);
        return;
    }
    if (command == "generate" && tokens.size() >= 2) {
        session::RoundCommand round_command;
        if (!session::RoundCommandFromString(tokens[1], round_command)) {
            std::cerr << "[tablepodcli] generate expects first, next or regenerate" << '\n';
            state.failures += 1;
            return;
        }
        Report("generate " + tokens[1], service.generateRound(state.code, round_command), state);
        return;
    }
    if (command == "start") {
        Report("start", service.startRound(state.code), state);
        return;
    }
    if (command == "reset") {
        Report("reset", service.resetRound(state.code), state);
        return;
    }
    if (command == "report" && tokens.size() >= 3) {
        session::OutcomeRequest request;
        request.participant_id = tokens[1];
        if (!session::OutcomeTypeFromString(tokens[2], request.outcome)) {
            std::cerr << "[tablepodcli] report expects win, draw, drop or data" << '\n';
            state.failures += 1;
            return;
        }
        if (tokens.size() > 3) {
            request.role = tokens[3];
        }
        const auto report = service.reportOutcome(state.code, request);
        std::cout << "[tablepodcli] report " << tokens[1] << ' ' << tokens[2] << ": "
                  << session::ToString(report.status);
        if (report.table_number.has_value()) {
            std::cout << ", table " << *report.table_number;
        }
        std::cout << '\n';
        if (!report.ok()) {
            state.failures += 1;
        }
        return;
    }
    if (command == "result" && tokens.size() >= 3) {
        int table = 0;
        tablepod::core::model::ResultKind kind;
        if (!ParseInt(tokens[1], table) || !tablepod::core::model::ResultKindFromString(tokens[2], kind)) {
            std::cerr << "[tablepodcli] usage: result <table> win <id> | draw | none" << '\n';
            state.failures += 1;
            return;
        }
        Report("result", service.setTableResult(state.code, table, kind, tokens.size() > 3 ? tokens[3] : ""), state);
        return;
    }
    if (command == "group" && tokens.size() >= 3) {
        const bool auto_fill = tokens[1] == "autofill";
        const std::vector<std::string> ids(tokens.begin() + 2, tokens.end());
        Report("group", service.createCustomGroup(state.code, ids, auto_fill), state);
        return;
    }
    if (command == "ungroup" && tokens.size() >= 2) {
        Report("ungroup", service.deleteCustomGroup(state.code, tokens[1]), state);
        return;
    }
    if (command == "move" && tokens.size() >= 4) {
        int from = 0;
        int to = 0;
        const auto snapshot = service.getSession(state.code);
        if (!ParseInt(tokens[1], from) || !ParseInt(tokens[2], to) || !snapshot.has_value()) {
            std::cerr << "[tablepodcli] usage: move <from> <to> <participant>" << '\n';
            state.failures += 1;
            return;
        }
        Report("move", service.moveParticipant(state.code, from, to, snapshot->current_round, tokens[3]), state);
        return;
    }
    if (command == "end-round") {
        Report("end-round", service.endRound(state.code), state);
        return;
    }
    if (command == "end-game") {
        Report("end-game", service.endGame(state.code), state);
        return;
    }
    if (command == "show") {
        const auto snapshot = service.getSession(state.code);
        if (!snapshot.has_value()) {
            std::cout << "[tablepodcli] unknown session " << state.code << '\n';
            return;
        }
        std::cout << "[tablepodcli] " << snapshot->code << " " << tablepod::core::model::ToString(snapshot->state())
                  << ", round " << snapshot->current_round << ", " << snapshot->participants.size()
                  << " participants, " << snapshot->archived_rounds.size() << " archived rounds" << '\n';
        if (snapshot->tables.has_value()) {
            PrintTables(*snapshot->tables);
        }
        return;
    }
    if (command == "standings") {
        std::cout << "[tablepodcli] standings" << '\n';
        int rank = 1;
        for (const auto& row : service.getStandings(state.code)) {
            std::cout << "  " << std::setw(2) << rank++ << ' ' << std::left << std::setw(16) << row.name
                      << std::right << " pts " << row.points << "  w" << row.wins << " d" << row.draws << " l"
                      << row.losses << " bye" << row.byes << (row.active ? "" : " (dropped)") << '\n';
        }
        return;
    }
    if (command == "export" && tokens.size() >= 2) {
        std::string error;
        if (!service.exportResults(state.code, tokens[1], &error)) {
            std::cout << "[tablepodcli] export failed: " << error << '\n';
            state.failures += 1;
        }
        return;
    }

    std::cerr << "[tablepodcli] unknown command: " << JoinTokens(tokens, 0) << '\n';
    state.failures += 1;
}

}  // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string script_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (script_path.empty()) {
            script_path = arg;
        }
    }

    if (script_path.empty()) {
        std::cerr << "Usage: tablepodcli [--config <config.json>] <script.txt>" << '\n';
        return 1;
    }

    ServiceConfig config;
    if (!config_path.empty()) {
        std::string error;
        if (!ServiceConfig::LoadFromFile(config_path, config, &error)) {
            std::cerr << "[tablepodcli] " << error << '\n';
            return 1;
        }
        std::cout << "[tablepodcli] Service config: " << config_path << '\n';
    }
    config.logging.mirror_stderr = false;

    std::ifstream script(script_path);
    if (!script) {
        std::cerr << "[tablepodcli] Failed to open script: " << script_path << '\n';
        return 1;
    }

    SessionService service(config);
    ScriptState state;
    std::string line;
    int line_no = 0;
    while (std::getline(script, line)) {
        ++line_no;
        const auto hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        const auto tokens = Tokenize(line);
        if (tokens.empty()) {
            continue;
        }
        try {
            RunLine(service, tokens, state);
        } catch (const std::logic_error& ex) {
            std::cerr << "[tablepodcli] line " << line_no << ": internal error: " << ex.what() << '\n';
            std::cerr << service.getLastLogLines(20) << '\n';
            return 3;
        }
    }

    if (state.failures > 0) {
        std::cout << "[tablepodcli] " << state.failures << " commands failed" << '\n';
        return 2;
    }
    return 0;
}
