#pragma once

#include "tablepod/core/broadcast/SessionEvents.h"

#include <string>

namespace tablepod::core::broadcast {

class IBroadcastAdapter {
public:
    virtual ~IBroadcastAdapter() = default;
    virtual bool Configure(const std::string& target) = 0;
    virtual bool Publish(const SessionEvent& event) = 0;
};

}  // namespace tablepod::core::broadcast
