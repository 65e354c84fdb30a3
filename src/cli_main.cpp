#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "combat.h"
#include "game_context.h"
#include "game_engine.h"
#include "game_errors.h"
#include "map_loader.h"

namespace {

struct RunOptions {
    std::uint64_t seed = 1;
    std::string configPath = "data/conquest_config.toml";
    std::string mapPath;    // empty means "use config value"
    int maxRounds = -1;     // -1 means "use config value"
    int strictMoves = -1;   // -1 means "use config value", 0/1 are explicit overrides
    std::string seats;      // comma separated policy names, overrides config seats
    std::string logOut;     // optional path for the full event log
    bool quiet = false;
    bool shuffleSeats = true;
    int estimateAttackers = 0; // > 0 switches to probability mode
    int estimateDefenders = 0;
    int estimateTrials = -1;
    bool adaptive = false;
};

bool parseUInt64(const std::string& s, std::uint64_t& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoull(s, &pos);
        if (pos != s.size()) return false;
        out = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size()) return false;
        if (v < static_cast<long long>(std::numeric_limits<int>::min()) ||
            v > static_cast<long long>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseBool01(const std::string& s, int& out) {
    if (s == "1" || s == "true" || s == "TRUE") {
        out = 1;
        return true;
    }
    if (s == "0" || s == "false" || s == "FALSE") {
        out = 0;
        return true;
    }
    return false;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "conquest_cli")
              << " [--seed N] [--config path] [--map path] [--maxRounds N]\n"
              << "       [--seats greedy,passive,...] [--no-shuffle] [--strict 0|1]\n"
              << "       [--logOut path] [--quiet]\n"
              << "   or: " << (argv0 ? argv0 : "conquest_cli")
              << " --estimate ATTACKERS DEFENDERS [--trials N | --adaptive] [--seed N]\n";
}

bool parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--seed") {
            std::string v;
            if (!requireValue(v) || !parseUInt64(v, opt.seed)) return false;
        } else if (arg.rfind("--seed=", 0) == 0) {
            if (!parseUInt64(arg.substr(7), opt.seed)) return false;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return false;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--map") {
            if (!requireValue(opt.mapPath)) return false;
        } else if (arg == "--maxRounds") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.maxRounds) || opt.maxRounds <= 0) return false;
        } else if (arg == "--strict") {
            std::string v;
            if (!requireValue(v) || !parseBool01(v, opt.strictMoves)) return false;
        } else if (arg == "--seats") {
            if (!requireValue(opt.seats)) return false;
        } else if (arg == "--no-shuffle") {
            opt.shuffleSeats = false;
        } else if (arg == "--logOut") {
            if (!requireValue(opt.logOut)) return false;
        } else if (arg == "--quiet") {
            opt.quiet = true;
        } else if (arg == "--estimate") {
            std::string a;
            std::string d;
            if (!requireValue(a) || !requireValue(d)) return false;
            if (!parseInt(a, opt.estimateAttackers) || !parseInt(d, opt.estimateDefenders)) return false;
            if (opt.estimateAttackers <= 0 || opt.estimateDefenders <= 0) return false;
        } else if (arg == "--trials") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.estimateTrials) || opt.estimateTrials <= 0) return false;
        } else if (arg == "--adaptive") {
            opt.adaptive = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}

std::vector<GameConfig::Seat> seatsFromList(const std::string& list) {
    std::vector<GameConfig::Seat> seats;
    std::stringstream ss(list);
    std::string policy;
    while (std::getline(ss, policy, ',')) {
        if (policy.empty()) continue;
        GameConfig::Seat seat;
        seat.name = "P" + std::to_string(seats.size() + 1);
        seat.policy = policy;
        seats.push_back(seat);
    }
    return seats;
}

int runEstimate(const RunOptions& opt, GameContext& ctx) {
    double pct = 0.0;
    if (opt.adaptive) {
        pct = estimateWinProbabilityAdaptive(opt.estimateAttackers,
                                             opt.estimateDefenders,
                                             ctx.gameSeed,
                                             ctx.config.combat.pilotTrials,
                                             ctx.config.combat.adaptiveSampleScale);
    } else {
        const int trials = opt.estimateTrials > 0 ? opt.estimateTrials : ctx.config.combat.estimateTrials;
        pct = estimateWinProbability(opt.estimateAttackers, opt.estimateDefenders, trials, ctx.gameSeed);
    }
    std::cout << std::fixed << std::setprecision(2)
              << opt.estimateAttackers << " attackers vs " << opt.estimateDefenders
              << " defenders: " << pct << "% attacker win\n";
    return 0;
}

bool writeLog(const std::string& path, const std::vector<std::string>& lines, std::string* errorMessage) {
    std::filesystem::path logPath(path);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(logPath.parent_path(), ec);
        if (ec) {
            if (errorMessage) *errorMessage = "Could not create " + logPath.parent_path().string() + ": " + ec.message();
            return false;
        }
    }
    std::ofstream out(logPath);
    if (!out) {
        if (errorMessage) *errorMessage = "Could not open event log: " + logPath.string();
        return false;
    }
    for (const std::string& line : lines) {
        out << line << "\n";
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return 2;
    }

    GameContext ctx(opt.seed, opt.configPath);
    if (opt.estimateAttackers > 0) {
        return runEstimate(opt, ctx);
    }

    if (!opt.mapPath.empty()) ctx.config.game.mapPath = opt.mapPath;
    if (opt.maxRounds > 0) ctx.config.game.maxRounds = opt.maxRounds;
    if (opt.strictMoves >= 0) ctx.config.game.strictMoves = (opt.strictMoves == 1);
    std::vector<GameConfig::Seat> seats = opt.seats.empty() ? ctx.config.seats : seatsFromList(opt.seats);
    if (opt.shuffleSeats) {
        std::shuffle(seats.begin(), seats.end(), ctx.gameRng);
    }

    try {
        GameEngine engine(ctx, loadMapFile(ctx.config.game.mapPath));
        engine.addSeats(seats);
        engine.setup();

        std::cout << "[Setup] seed=" << ctx.gameSeed << " config=" << ctx.configHash
                  << " map=" << ctx.config.game.mapPath << " regions=" << engine.getWorld().getRegionCount()
                  << " players=" << engine.getPlayers().size() << "\n";

        auto flush = [&]() {
            const std::vector<std::string> lines = engine.getLog().takeNew();
            if (opt.quiet) return;
            for (const std::string& line : lines) {
                std::cout << line << "\n";
            }
        };
        flush();

        while (engine.getRound() < ctx.config.game.maxRounds && engine.playRound()) {
            flush();
            std::string reason;
            if (!engine.checkInvariants(&reason)) {
                std::cerr << "[Round] invariant broken after round " << engine.getRound() << ": " << reason << "\n";
                return 1;
            }
        }
        flush();

        if (const PlayerAccount* winner = engine.getWinner()) {
            std::cout << "[Round] " << winner->getName() << " (" << winner->getPolicy().name()
                      << ") won after " << engine.getRound() << " rounds\n";
        } else {
            std::cout << "[Round] no winner after " << engine.getRound() << " rounds; "
                      << engine.getPlayers().size() << " players remain\n";
        }
        if (!engine.getRejectedMoves().empty()) {
            std::cout << "[Round] " << engine.getRejectedMoves().size() << " moves were rejected\n";
        }

        if (!opt.logOut.empty()) {
            std::string err;
            if (!writeLog(opt.logOut, engine.getLog().takeAll(), &err)) {
                std::cerr << "Error: " << err << "\n";
                return 1;
            }
        }
    } catch (const LoadError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const ConfigurationError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const InvalidMoveError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    }
    return 0;
}
