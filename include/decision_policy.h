#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cards.h"

class PlayerAccount;
class WorldMap;

struct DraftMove {
    int region = -1;
    int amount = 0;
};

struct AttackMove {
    int from = -1;
    int to = -1;
    int troops = 0;
};

struct FortifyMove {
    int from = -1;
    int to = -1;
    int amount = 0;
};

// Read-only window a policy decides from: the live map and the acting player's account.
class GameView {
public:
    GameView(const WorldMap& world, const PlayerAccount& self) : m_world(world), m_self(self) {}

    const WorldMap& world() const { return m_world; }
    const PlayerAccount& self() const { return m_self; }
    int playerId() const;
    int allowance() const;
    const std::vector<Card>& hand() const;

    std::vector<int> ownedRegions() const;
    bool owns(int regionId) const;
    // Owned, at least 2 troops, and at least one enemy neighbor.
    bool canAttackFrom(int regionId) const;

private:
    const WorldMap& m_world;
    const PlayerAccount& m_self;
};

// Everything the turn engine asks a player. Implementations only propose; the engine
// validates every answer before touching the map.
class DecisionPolicy {
public:
    virtual ~DecisionPolicy() = default;

    virtual std::string name() const = 0;

    // Owned region and 1..allowance troops.
    virtual DraftMove draft(const GameView& view) = 0;
    // Called again after every resolved battle; nullopt ends the attack phase.
    virtual std::optional<AttackMove> attack(const GameView& view) = 0;
    // Voluntary regroup, once per turn; nullopt skips.
    virtual std::optional<FortifyMove> fortify(const GameView& view) = 0;
    // Troops to move into a just-captured region, within [minTroops, maxTroops].
    virtual int captureMove(const GameView& view, int from, int to, int minTroops, int maxTroops) = 0;
    // A set to trade, or nullopt. Returning nullopt while `forced` is a rejected move.
    virtual std::optional<CardSet> trade(const GameView& view, bool forced) = 0;
};

// "greedy" or "passive"; anything else throws ConfigurationError.
std::unique_ptr<DecisionPolicy> makePolicy(const std::string& kind, std::uint64_t seed);
