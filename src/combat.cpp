#include "combat.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <string>

#include "game_context.h"

namespace {

constexpr std::uint64_t kTrialSalt = 0xD1CEB0A7D1CEB0A7ull;

double roundTo(double v, double scale) {
    return std::round(v * scale) / scale;
}

long long countWins(int attackers, int defenders, int trials, std::uint64_t seed) {
    long long wins = 0;
    #pragma omp parallel for reduction(+:wins) schedule(static)
    for (int i = 0; i < trials; ++i) {
        std::mt19937_64 rng(GameContext::mix64(seed ^ kTrialSalt ^
                                               (static_cast<std::uint64_t>(i) * 0x9E3779B97F4A7C15ull)));
        RandomDice dice(rng);
        if (resolveBattle(attackers, defenders, dice).attackerWon()) {
            wins += 1;
        }
    }
    return wins;
}

} // namespace

RoundLosses resolveBattleRound(int attackerDice, int defenderDice, DiceSource& dice) {
    if (attackerDice < 1 || attackerDice > kMaxAttackDice || defenderDice < 1 || defenderDice > kMaxDefendDice) {
        throw std::invalid_argument("resolveBattleRound: dice counts out of range (" +
                                    std::to_string(attackerDice) + " vs " + std::to_string(defenderDice) + ")");
    }
    std::array<int, kMaxAttackDice> atk{};
    std::array<int, kMaxDefendDice> def{};
    for (int i = 0; i < attackerDice; ++i) {
        atk[i] = dice.roll();
    }
    for (int i = 0; i < defenderDice; ++i) {
        def[i] = dice.roll();
    }
    std::sort(atk.begin(), atk.begin() + attackerDice, std::greater<int>());
    std::sort(def.begin(), def.begin() + defenderDice, std::greater<int>());

    RoundLosses losses;
    const int pairs = std::min(attackerDice, defenderDice);
    for (int i = 0; i < pairs; ++i) {
        if (atk[i] > def[i]) {
            ++losses.defender;
        } else {
            ++losses.attacker;
        }
    }
    return losses;
}

BattleResult resolveBattle(int attackers, int defenders, DiceSource& dice) {
    if (attackers <= 0 || defenders <= 0) {
        throw std::invalid_argument("resolveBattle: troop counts must be positive (" +
                                    std::to_string(attackers) + " vs " + std::to_string(defenders) + ")");
    }
    BattleResult result;
    result.attackers = attackers;
    result.defenders = defenders;
    while (result.attackers > 0 && result.defenders > 0) {
        const RoundLosses losses = resolveBattleRound(std::min(kMaxAttackDice, result.attackers),
                                                      std::min(kMaxDefendDice, result.defenders),
                                                      dice);
        result.attackers -= losses.attacker;
        result.defenders -= losses.defender;
        ++result.rounds;
    }
    return result;
}

double estimateWinProbability(int attackers, int defenders, int trials, std::uint64_t seed) {
    if (trials <= 0) {
        throw std::invalid_argument("estimateWinProbability: trials must be positive");
    }
    if (attackers <= 0 || defenders <= 0) {
        throw std::invalid_argument("estimateWinProbability: troop counts must be positive");
    }
    const long long wins = countWins(attackers, defenders, trials, seed);
    return roundTo(100.0 * static_cast<double>(wins) / static_cast<double>(trials), 100.0);
}

double estimateWinProbabilityAdaptive(int attackers,
                                      int defenders,
                                      std::uint64_t seed,
                                      int pilotTrials,
                                      double sampleScale) {
    double p0 = estimateWinProbability(attackers, defenders, pilotTrials, seed) / 100.0;
    if (p0 < 0.48) {
        p0 += 0.02;
    } else if (p0 > 0.52) {
        p0 -= 0.02;
    } else {
        p0 = 0.5;
    }
    const int trials = std::max(1, static_cast<int>(sampleScale * p0 * (1.0 - p0)));
    return estimateWinProbability(attackers, defenders, trials, GameContext::mix64(seed + 1));
}
