#pragma once

#include "Network.hpp"

#include <cstddef>
#include <string>

namespace signalnet
{
    // Read-only JSON view of a published state for external collaborators.
    std::string networkStateToJson(const NetworkState &state);

    // The newest `limit` events, newest first.
    std::string eventsToJson(const NetworkState &state, std::size_t limit);
} // namespace signalnet
