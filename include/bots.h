#pragma once

#include <cstdint>
#include <random>

#include "decision_policy.h"

// Non-lookahead aggressor. Stacks every reinforcement on its strongest front,
// attacks from that front the weakest neighbor it clearly outnumbers, and pulls idle
// interior troops toward the strongest front. Any owned region with an enemy
// neighbor counts as a front, whatever its garrison.
class GreedyPolicy : public DecisionPolicy {
public:
    std::string name() const override { return "greedy"; }
    DraftMove draft(const GameView& view) override;
    std::optional<AttackMove> attack(const GameView& view) override;
    std::optional<FortifyMove> fortify(const GameView& view) override;
    int captureMove(const GameView& view, int from, int to, int minTroops, int maxTroops) override;
    std::optional<CardSet> trade(const GameView& view, bool forced) override;
};

// Places troops one at a time on random owned regions. Never attacks or fortifies,
// and trades only when it has to.
class PassivePolicy : public DecisionPolicy {
public:
    explicit PassivePolicy(std::uint64_t seed) : m_rng(seed) {}

    std::string name() const override { return "passive"; }
    DraftMove draft(const GameView& view) override;
    std::optional<AttackMove> attack(const GameView& view) override;
    std::optional<FortifyMove> fortify(const GameView& view) override;
    int captureMove(const GameView& view, int from, int to, int minTroops, int maxTroops) override;
    std::optional<CardSet> trade(const GameView& view, bool forced) override;

private:
    std::mt19937_64 m_rng;
};
