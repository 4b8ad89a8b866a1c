#include "tablepod/core/export/ExportWriter.h"

#include "tablepod/core/util/AtomicFileWriter.h"
#include "tablepod/core/util/Timestamp.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>

namespace tablepod::core::exporter {

namespace {

std::string CsvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (const char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

}  // namespace

bool WriteStandingsCsv(const std::string& path,
                       const std::vector<tablepod::core::stats::ParticipantStats>& standings,
                       std::string* error) {
    std::ostringstream output;
    output << "rank,id,name,pts,g,w,d,l,byes,active\n";
    int rank = 1;
    for (const auto& row : standings) {
        output << rank++ << ','
               << CsvField(row.id) << ','
               << CsvField(row.name) << ','
               << row.points << ','
               << row.games << ','
               << row.wins << ','
               << row.draws << ','
               << row.losses << ','
               << row.byes << ','
               << (row.active ? 1 : 0)
               << "\n";
    }
    return tablepod::core::util::AtomicFileWriter::Write(path, output.str(), error);
}

bool WriteSummaryJson(const std::string& path,
                      const tablepod::core::model::Session& session,
                      std::string* error) {
    const auto table = tablepod::core::stats::StandingsTable::FromSession(session);
    const auto ranked = table.Ranked();

    nlohmann::json summary;
    summary["code"] = session.code;
    summary["event"] = session.event_name;
    summary["state"] = tablepod::core::model::ToString(session.state());
    summary["created_at"] = tablepod::core::util::FormatUtcTimestamp(session.created_at);
    summary["rounds_played"] = static_cast<int>(session.archived_rounds.size());
    summary["current_round"] = session.current_round;
    summary["participants"] = static_cast<int>(session.participants.size());
    summary["total_games"] = table.games_played();
    summary["top10"] = nlohmann::json::array();
    const size_t limit = std::min<size_t>(10, ranked.size());
    for (size_t i = 0; i < limit; ++i) {
        const auto& row = ranked[i];
        summary["top10"].push_back({
            {"rank", static_cast<int>(i + 1)},
            {"id", row.id},
            {"name", row.name},
            {"pts", row.points},
            {"g", row.games},
            {"w", row.wins},
            {"d", row.draws},
            {"l", row.losses},
            {"byes", row.byes},
        });
    }
    return tablepod::core::util::AtomicFileWriter::Write(path, summary.dump(2), error);
}

}  // namespace tablepod::core::exporter
