#pragma once

#include "tablepod/core/model/Session.h"
#include "tablepod/core/stats/StandingsTable.h"

#include <string>
#include <vector>

namespace tablepod::core::exporter {

// Expects standings already ranked.
bool WriteStandingsCsv(const std::string& path,
                       const std::vector<tablepod::core::stats::ParticipantStats>& standings,
                       std::string* error = nullptr);

bool WriteSummaryJson(const std::string& path,
                      const tablepod::core::model::Session& session,
                      std::string* error = nullptr);

}  // namespace tablepod::core::exporter
