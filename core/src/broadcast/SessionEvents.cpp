#include "tablepod/core/broadcast/SessionEvents.h"

#include <algorithm>
#include <iostream>

namespace tablepod::core::broadcast {

const char* ToString(SessionEventType type) {
    switch (type) {
        case SessionEventType::ParticipantJoined:
            return "participant_joined";
        case SessionEventType::RoundGenerated:
            return "round_generated";
        case SessionEventType::RoundStarted:
            return "round_started";
        case SessionEventType::GameEnded:
            return "game_ended";
        case SessionEventType::ParticipantDropped:
            return "participant_dropped";
        case SessionEventType::SessionExpired:
            return "session_expired";
        case SessionEventType::SettingsChanged:
            return "settings_changed";
    }
    return "unknown";
}

SessionEvents::SessionEvents(std::function<void(const std::string&)> log_fn) : log_fn_(std::move(log_fn)) {}

int SessionEvents::Subscribe(SessionListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int id = next_id_++;
    listeners_.push_back({id, std::move(listener)});
    return id;
}

bool SessionEvents::Unsubscribe(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::find_if(listeners_.begin(), listeners_.end(), [id](const Entry& entry) {
        return entry.id == id;
    });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

void SessionEvents::Emit(const SessionEvent& event) const {
    std::vector<Entry> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners = listeners_;
    }
    for (const auto& entry : listeners) {
        try {
            entry.listener(event);
        } catch (const std::exception& ex) {
            const std::string message = std::string("[events] listener ") + std::to_string(entry.id) + " failed on " +
                                        ToString(event.type) + ": " + ex.what();
            if (log_fn_) {
                log_fn_(message);
            } else {
                std::cerr << message << '\n';
            }
        }
    }
}

size_t SessionEvents::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

}  // namespace tablepod::core::broadcast
