#pragma once

#include <cstdint>
#include <random>

// Source of six-sided die rolls. Battles draw every die through this so tests can
// force exact sequences.
class DiceSource {
public:
    virtual ~DiceSource() = default;
    virtual int roll() = 0; // 1..6
};

class RandomDice : public DiceSource {
public:
    explicit RandomDice(std::mt19937_64& rng) : m_rng(rng), m_die(1, 6) {}
    int roll() override { return m_die(m_rng); }

private:
    std::mt19937_64& m_rng;
    std::uniform_int_distribution<int> m_die;
};

struct RoundLosses {
    int attacker = 0;
    int defender = 0;
};

struct BattleResult {
    int attackers = 0; // survivors
    int defenders = 0;
    int rounds = 0;

    bool attackerWon() const { return defenders == 0; }
};

constexpr int kMaxAttackDice = 3;
constexpr int kMaxDefendDice = 2;

// One exchange: both sides roll, the highest dice are paired, ties go to the defender.
RoundLosses resolveBattleRound(int attackerDice, int defenderDice, DiceSource& dice);

// Fights until one side is gone. Both counts must be positive (std::invalid_argument otherwise).
// Attackers roll min(3, attackers): the committed troops exclude the one left at home.
BattleResult resolveBattle(int attackers, int defenders, DiceSource& dice);

// Percentage (0..100, two decimals) of `trials` battles the attacker wins. Trial i draws
// from its own generator seeded from (seed, i), so the estimate does not depend on
// how trials are scheduled across threads.
double estimateWinProbability(int attackers, int defenders, int trials, std::uint64_t seed);

// Pilot run sizes the main run for roughly half a percent of error:
// n = sampleScale * p0 * (1 - p0), with p0 pulled 2 points toward 0.5.
double estimateWinProbabilityAdaptive(int attackers,
                                      int defenders,
                                      std::uint64_t seed,
                                      int pilotTrials = 400,
                                      double sampleScale = 154000.0);
