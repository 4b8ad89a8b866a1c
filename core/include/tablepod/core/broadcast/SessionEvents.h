#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace tablepod::core::broadcast {

enum class SessionEventType {
    ParticipantJoined,
    RoundGenerated,
    RoundStarted,
    GameEnded,
    ParticipantDropped,
    SessionExpired,
    SettingsChanged
};

const char* ToString(SessionEventType type);

struct SessionEvent {
    SessionEventType type = SessionEventType::RoundGenerated;
    std::string code;
    // Session snapshot under "session" plus event specific fields.
    nlohmann::json payload = nlohmann::json::object();
};

using SessionListener = std::function<void(const SessionEvent&)>;

// Multicast listener list. Delivery is best effort: a throwing listener is
// logged and the remaining listeners still run.
class SessionEvents {
public:
    explicit SessionEvents(std::function<void(const std::string&)> log_fn = {});

    int Subscribe(SessionListener listener);
    bool Unsubscribe(int id);
    void Emit(const SessionEvent& event) const;
    size_t listener_count() const;

private:
    struct Entry {
        int id = 0;
        SessionListener listener;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> listeners_;
    int next_id_ = 1;
    std::function<void(const std::string&)> log_fn_;
};

}  // namespace tablepod::core::broadcast
