#include "game_context.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

#include <toml++/toml.hpp>

namespace {

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    const toml::node_view<const toml::node> view = root[section][key];
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto v = view.value<bool>()) {
            target = *v;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto v = view.value<std::string>()) {
            target = *v;
        }
    }
}

std::string toLowerAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

} // namespace

GameContext::GameContext(std::uint64_t seed, const std::string& runtimeConfigPath)
    : gameSeed(seed), gameRng(seed), config(), configPath(runtimeConfigPath), configHash("defaults") {
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            std::cerr << "[Config] " << err << " Using built-in defaults.\n";
        }
    }
}

int GameContext::randInt(int a, int b) {
    if (a > b) {
        std::swap(a, b);
    }
    std::uniform_int_distribution<int> dist(a, b);
    return dist(gameRng);
}

bool GameContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = GameConfig{};
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);

        readTomlValue(root, "game", "mapPath", config.game.mapPath);
        readTomlValue(root, "game", "maxRounds", config.game.maxRounds);
        readTomlValue(root, "game", "strictMoves", config.game.strictMoves);
        readTomlValue(root, "game", "echoLog", config.game.echoLog);

        if (const toml::array* armies = root["setup"]["startingArmies"].as_array()) {
            std::vector<int> parsed;
            for (const toml::node& node : *armies) {
                if (const auto v = node.value<std::int64_t>()) {
                    parsed.push_back(static_cast<int>(*v));
                }
            }
            // One entry per supported player count (2..6); anything else keeps the defaults.
            if (parsed.size() == 5) {
                config.setup.startingArmies = parsed;
            } else {
                std::cerr << "[Config] setup.startingArmies needs 5 entries, got " << parsed.size()
                          << "; keeping defaults.\n";
            }
        }

        readTomlValue(root, "combat", "estimateTrials", config.combat.estimateTrials);
        readTomlValue(root, "combat", "pilotTrials", config.combat.pilotTrials);
        readTomlValue(root, "combat", "adaptiveSampleScale", config.combat.adaptiveSampleScale);
        config.combat.estimateTrials = std::max(1, config.combat.estimateTrials);
        config.combat.pilotTrials = std::max(1, config.combat.pilotTrials);

        if (const toml::array* seats = root["seats"].as_array()) {
            std::vector<GameConfig::Seat> parsed;
            for (const toml::node& node : *seats) {
                const toml::table* seatTable = node.as_table();
                if (!seatTable) {
                    continue;
                }
                GameConfig::Seat seat;
                if (const auto name = (*seatTable)["name"].value<std::string>()) {
                    seat.name = *name;
                }
                if (const auto policy = (*seatTable)["policy"].value<std::string>()) {
                    seat.policy = toLowerAscii(*policy);
                }
                if (seat.name.empty()) {
                    seat.name = "P" + std::to_string(parsed.size() + 1);
                }
                parsed.push_back(seat);
            }
            if (!parsed.empty()) {
                config.seats = parsed;
            }
        }

        configHash = hashFileFNV1a(path);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    return false;
}

std::string GameContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}

std::uint64_t GameContext::seedForPlayer(int playerId) const {
    const std::uint64_t idx = static_cast<std::uint64_t>(std::max(0, playerId));
    return mix64(gameSeed ^ (idx * 0x9E3779B97F4A7C15ull) ^ 0xC0C0C0C0C0C0C0C0ull);
}

std::mt19937_64 GameContext::makeRng(std::uint64_t salt) const {
    return std::mt19937_64(mix64(gameSeed ^ salt));
}

std::uint64_t GameContext::mix64(std::uint64_t x) {
    // SplitMix64 finalizer.
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

std::vector<GameConfig::Seat> GameConfig::defaultSeats() {
    return {
        {"P1", "greedy"},
        {"P2", "greedy"},
        {"P3", "greedy"},
        {"P4", "passive"},
    };
}
