// Tunables for the server process; loaded from JSON at startup.
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "../../engine/core/Logger.h"

namespace Game::Net {

struct ServerConfig {
    uint16_t port{37015};
    double tickRate{60.0};
    std::size_t broadcastQueueCapacity{256};
    std::size_t subscriberQueueCapacity{32};
    std::size_t roomCommandCapacity{256};
    double subscriberTimeoutSeconds{30.0};
    Engine::LogLevel logLevel{Engine::LogLevel::Info};
    bool autoStartRooms{true};
};

class ServerConfigLoader {
public:
    // Unknown keys are ignored; ill-typed or out-of-range keys keep their defaults.
    static std::optional<ServerConfig> loadFromFile(const std::string& path);
    static std::optional<ServerConfig> loadFromString(const std::string& text);
};

}  // namespace Game::Net
