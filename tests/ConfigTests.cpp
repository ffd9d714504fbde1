// Server configuration loading and log level parsing.
#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>

#include "../engine/core/Logger.h"
#include "../game/net/ServerConfig.h"

using Game::Net::ServerConfig;
using Game::Net::ServerConfigLoader;

int main() {
    {
        ServerConfig defaults;
        assert(defaults.port == 37015);
        assert(defaults.tickRate == 60.0);
        assert(defaults.broadcastQueueCapacity == 256);
        assert(defaults.subscriberQueueCapacity == 32);
        assert(defaults.roomCommandCapacity == 256);
        assert(defaults.autoStartRooms);
    }
    {
        auto cfg = ServerConfigLoader::loadFromString(R"({
            "port": 40000, "tickRate": 30, "broadcastQueueCapacity": 64,
            "subscriberQueueCapacity": 8, "roomCommandCapacity": 16,
            "subscriberTimeoutSeconds": 5.5, "logLevel": "debug", "autoStartRooms": false
        })");
        assert(cfg);
        assert(cfg->port == 40000);
        assert(cfg->tickRate == 30.0);
        assert(cfg->broadcastQueueCapacity == 64);
        assert(cfg->subscriberQueueCapacity == 8);
        assert(cfg->roomCommandCapacity == 16);
        assert(cfg->subscriberTimeoutSeconds == 5.5);
        assert(cfg->logLevel == Engine::LogLevel::Debug);
        assert(!cfg->autoStartRooms);
    }
    {
        // Ill-typed or out-of-range values keep defaults; unknown keys are ignored.
        auto cfg = ServerConfigLoader::loadFromString(
            R"({"port": 70000, "tickRate": "fast", "roomCommandCapacity": -4, "logLevel": "loud", "extra": 1})");
        assert(cfg);
        assert(cfg->port == 37015);
        assert(cfg->tickRate == 60.0);
        assert(cfg->roomCommandCapacity == 256);
        assert(cfg->logLevel == Engine::LogLevel::Info);
    }
    {
        assert(!ServerConfigLoader::loadFromString("{ not json"));
        assert(!ServerConfigLoader::loadFromString("[1, 2]"));
        assert(!ServerConfigLoader::loadFromFile("/nonexistent/bastion/server.json"));
    }
    {
        const auto path = std::filesystem::temp_directory_path() / "bastion_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"port": 41000, "logLevel": "warn"})";
        }
        auto cfg = ServerConfigLoader::loadFromFile(path.string());
        std::filesystem::remove(path);
        assert(cfg);
        assert(cfg->port == 41000);
        assert(cfg->logLevel == Engine::LogLevel::Warning);
    }
    {
        assert(Engine::parseLogLevel("error") == Engine::LogLevel::Error);
        assert(Engine::parseLogLevel("warning") == Engine::LogLevel::Warning);
        assert(!Engine::parseLogLevel("verbose"));
        Engine::Logger::setMinLevel(Engine::LogLevel::Error);
        assert(Engine::Logger::minLevel() == Engine::LogLevel::Error);
        Engine::logInfo("filtered out");
        Engine::Logger::setMinLevel(Engine::LogLevel::Info);
    }
    return 0;
}
