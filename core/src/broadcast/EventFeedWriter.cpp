#include "tablepod/core/broadcast/EventFeedWriter.h"

#include "tablepod/core/util/AtomicFileWriter.h"
#include "tablepod/core/util/Timestamp.h"

#include <iostream>

namespace tablepod::core::broadcast {

bool EventFeedWriter::Configure(const std::string& feed_path) {
    std::lock_guard<std::mutex> lock(mutex_);
    feed_path_ = feed_path;
    sequence_ = 0;
    if (feed_path_.empty()) {
        std::cerr << "[feed] event feed path is not configured." << '\n';
        return false;
    }
    std::cerr << "[feed] writing events to " << feed_path_ << '\n';
    return true;
}

bool EventFeedWriter::Publish(const SessionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (feed_path_.empty()) {
        return false;
    }

    nlohmann::json line;
    line["seq"] = ++sequence_;
    line["at"] = util::FormatUtcTimestamp(util::Clock::now());
    line["type"] = ToString(event.type);
    line["code"] = event.code;
    line["payload"] = nlohmann::json::object();
    if (event.payload.is_object()) {
        for (auto it = event.payload.begin(); it != event.payload.end(); ++it) {
            if (it.key() == "session" && !include_session_) {
                continue;
            }
            line["payload"][it.key()] = it.value();
        }
    }

    std::string error;
    if (!util::AtomicFileWriter::AppendLine(feed_path_, line.dump(), &error)) {
        std::cerr << "[feed] append failed: " << error << '\n';
        return false;
    }
    return true;
}

}  // namespace tablepod::core::broadcast
