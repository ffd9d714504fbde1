#include <csignal>
#include <cstdlib>
#include <optional>
#include <string>

#include "../engine/core/Logger.h"
#include "../game/net/GameServer.h"
#include "../game/net/ServerConfig.h"

namespace {
Game::Net::GameServer* gServer = nullptr;

void onSignal(int) {
    // requestStop only stores a lock-free atomic flag.
    if (gServer) gServer->requestStop();
}

bool parsePort(const std::string& text, uint16_t& out) {
    char* end = nullptr;
    const long value = std::strtol(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || value < 0 || value > 65535) {
        return false;
    }
    out = static_cast<uint16_t>(value);
    return true;
}
}  // namespace

int main(int argc, char** argv) {
    std::string configPath = "config/server.json";
    std::optional<uint16_t> portOverride;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--port") {
            uint16_t port = 0;
            if (i + 1 >= argc || !parsePort(argv[i + 1], port)) {
                Engine::logError("--port expects a number between 0 and 65535");
                return 1;
            }
            portOverride = port;
            ++i;
        } else {
            configPath = arg;
        }
    }

    Game::Net::ServerConfig config;
    if (auto loaded = Game::Net::ServerConfigLoader::loadFromFile(configPath)) {
        config = *loaded;
    } else {
        Engine::logWarn("Could not load " + configPath + "; using default settings");
    }
    if (portOverride) {
        config.port = *portOverride;
    }
    Engine::Logger::setMinLevel(config.logLevel);

    Game::Net::GameServer server(config);
    if (!server.start()) {
        return 1;
    }
    gServer = &server;
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    server.run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    gServer = nullptr;
    Engine::logInfo("Shutting down");
    server.stop();
    return 0;
}
