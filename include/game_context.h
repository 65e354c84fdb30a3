#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

struct GameConfig {
    struct Seat {
        std::string name;
        std::string policy = "greedy";
    };

    struct Game {
        std::string mapPath = "data/classic_map.toml";
        int maxRounds = 500;
        // Throw InvalidMoveError on a rejected move instead of ending the phase.
        bool strictMoves = false;
        bool echoLog = false;
    } game{};

    struct Setup {
        // Starting armies for 2..6 players.
        std::vector<int> startingArmies = {40, 35, 30, 25, 20};
    } setup{};

    struct Combat {
        int estimateTrials = 10000;
        int pilotTrials = 400;
        double adaptiveSampleScale = 154000.0;
    } combat{};

    std::vector<Seat> seats = defaultSeats();

    static std::vector<Seat> defaultSeats();
};

struct GameContext {
    std::uint64_t gameSeed = 0;
    std::mt19937_64 gameRng;
    GameConfig config;
    std::string configPath;
    std::string configHash;

    explicit GameContext(std::uint64_t seed, const std::string& runtimeConfigPath = "data/conquest_config.toml");

    int randInt(int a, int b); // inclusive

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);

    std::uint64_t seedForPlayer(int playerId) const;
    std::mt19937_64 makeRng(std::uint64_t salt) const;

    static std::uint64_t mix64(std::uint64_t x);
};
