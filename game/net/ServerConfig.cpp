#include "ServerConfig.h"

#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

namespace Game::Net {

namespace {
void readCapacity(const nlohmann::json& j, const char* key, std::size_t& dst) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_integer()) return;
    const auto value = it->get<long long>();
    if (value > 0) dst = static_cast<std::size_t>(value);
}

void readPositive(const nlohmann::json& j, const char* key, double& dst) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return;
    const double value = it->get<double>();
    if (value > 0.0) dst = value;
}

ServerConfig fromJson(const nlohmann::json& j) {
    ServerConfig cfg;
    auto port = j.find("port");
    if (port != j.end() && port->is_number_integer()) {
        const auto value = port->get<long long>();
        if (value >= 0 && value <= std::numeric_limits<uint16_t>::max()) {
            cfg.port = static_cast<uint16_t>(value);
        }
    }
    readPositive(j, "tickRate", cfg.tickRate);
    readCapacity(j, "broadcastQueueCapacity", cfg.broadcastQueueCapacity);
    readCapacity(j, "subscriberQueueCapacity", cfg.subscriberQueueCapacity);
    readCapacity(j, "roomCommandCapacity", cfg.roomCommandCapacity);
    readPositive(j, "subscriberTimeoutSeconds", cfg.subscriberTimeoutSeconds);
    auto level = j.find("logLevel");
    if (level != j.end() && level->is_string()) {
        if (auto parsed = Engine::parseLogLevel(level->get<std::string>())) {
            cfg.logLevel = *parsed;
        }
    }
    auto autoStart = j.find("autoStartRooms");
    if (autoStart != j.end() && autoStart->is_boolean()) {
        cfg.autoStartRooms = autoStart->get<bool>();
    }
    return cfg;
}
}  // namespace

std::optional<ServerConfig> ServerConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return loadFromString(buffer.str());
}

std::optional<ServerConfig> ServerConfigLoader::loadFromString(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
    if (!j.is_object()) {
        return std::nullopt;
    }
    return fromJson(j);
}

}  // namespace Game::Net
