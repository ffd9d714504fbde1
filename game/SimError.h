// Failure taxonomy for simulation commands and the protocol gateway.
#pragma once

#include <string_view>

namespace Game {

enum class SimError {
    None,
    OutOfBounds,
    CellOccupied,
    DefenderNotFound,
    NoRouteAvailable,
    RoomNotFound,
    MalformedMessage,
    ChannelSaturated
};

inline std::string_view toString(SimError err) {
    switch (err) {
        case SimError::None: return "None";
        case SimError::OutOfBounds: return "OutOfBounds";
        case SimError::CellOccupied: return "CellOccupied";
        case SimError::DefenderNotFound: return "DefenderNotFound";
        case SimError::NoRouteAvailable: return "NoRouteAvailable";
        case SimError::RoomNotFound: return "RoomNotFound";
        case SimError::MalformedMessage: return "MalformedMessage";
        case SimError::ChannelSaturated: return "ChannelSaturated";
    }
    return "Unknown";
}

}  // namespace Game
