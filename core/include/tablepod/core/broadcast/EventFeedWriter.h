#pragma once

#include "tablepod/core/broadcast/IBroadcastAdapter.h"

#include <mutex>
#include <string>

namespace tablepod::core::broadcast {

// Appends one JSON object per event to a feed file for external readers.
class EventFeedWriter : public IBroadcastAdapter {
public:
    bool Configure(const std::string& feed_path) override;
    bool Publish(const SessionEvent& event) override;

    const std::string& feed_path() const { return feed_path_; }
    // The session snapshot is left out of feed lines unless enabled.
    void set_include_session(bool include) { include_session_ = include; }

private:
    std::mutex mutex_{};
    std::string feed_path_{};
    bool include_session_ = false;
    long long sequence_ = 0;
};

}  // namespace tablepod::core::broadcast
