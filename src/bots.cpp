#include "bots.h"

#include <algorithm>

#include "player.h"
#include "world_map.h"

namespace {

// Owned regions, strongest first; equal garrisons keep region id order.
std::vector<int> ownedByStrength(const GameView& view) {
    std::vector<int> owned = view.ownedRegions();
    const WorldMap& world = view.world();
    std::stable_sort(owned.begin(), owned.end(), [&world](int a, int b) {
        return world.getGarrison(a) > world.getGarrison(b);
    });
    return owned;
}

} // namespace

// ---------------------------------------------------------------- GreedyPolicy

DraftMove GreedyPolicy::draft(const GameView& view) {
    const WorldMap& world = view.world();
    const std::vector<int> owned = ownedByStrength(view);
    DraftMove move;
    move.amount = view.allowance();
    for (int regionId : owned) {
        if (world.hasEnemyNeighbor(regionId)) {
            move.region = regionId;
            return move;
        }
    }
    if (!owned.empty()) {
        move.region = owned.front();
    }
    return move;
}

std::optional<AttackMove> GreedyPolicy::attack(const GameView& view) {
    const WorldMap& world = view.world();
    // Only the strongest region bordering an enemy may attack.
    for (int from : ownedByStrength(view)) {
        const int strength = world.getGarrison(from);
        if (strength <= 2) {
            break;
        }
        if (!world.hasEnemyNeighbor(from)) {
            continue;
        }
        int target = kNoRegion;
        for (int candidate : world.enemyNeighbors(from)) {
            const int defenders = world.getGarrison(candidate);
            if (defenders >= strength - 1) {
                continue;
            }
            if (target == kNoRegion || defenders < world.getGarrison(target)) {
                target = candidate;
            }
        }
        if (target == kNoRegion) {
            return std::nullopt;
        }
        return AttackMove{from, target, strength - 1};
    }
    return std::nullopt;
}

std::optional<FortifyMove> GreedyPolicy::fortify(const GameView& view) {
    const WorldMap& world = view.world();
    const std::vector<int> owned = ownedByStrength(view);

    int interior = kNoRegion;
    for (int regionId : owned) {
        if (!world.hasEnemyNeighbor(regionId)) {
            interior = regionId;
            break;
        }
    }
    if (interior == kNoRegion || world.getGarrison(interior) <= 1) {
        return std::nullopt;
    }

    // Strongest front the interior stack can actually walk to.
    for (int front : owned) {
        if (front == interior || !world.hasEnemyNeighbor(front)) {
            continue;
        }
        if (world.connectedThroughOwner(interior, front, view.playerId())) {
            return FortifyMove{interior, front, world.getGarrison(interior) - 1};
        }
    }
    return std::nullopt;
}

int GreedyPolicy::captureMove(const GameView&, int, int, int, int maxTroops) {
    return maxTroops;
}

std::optional<CardSet> GreedyPolicy::trade(const GameView& view, bool) {
    return findBestTradeableSet(view.hand());
}

// --------------------------------------------------------------- PassivePolicy

DraftMove PassivePolicy::draft(const GameView& view) {
    const std::vector<int> owned = view.ownedRegions();
    DraftMove move;
    if (owned.empty()) {
        return move;
    }
    std::uniform_int_distribution<size_t> pick(0, owned.size() - 1);
    move.region = owned[pick(m_rng)];
    move.amount = 1;
    return move;
}

std::optional<AttackMove> PassivePolicy::attack(const GameView&) {
    return std::nullopt;
}

std::optional<FortifyMove> PassivePolicy::fortify(const GameView&) {
    return std::nullopt;
}

int PassivePolicy::captureMove(const GameView&, int, int, int minTroops, int) {
    return minTroops;
}

std::optional<CardSet> PassivePolicy::trade(const GameView& view, bool forced) {
    if (!forced) {
        return std::nullopt;
    }
    return findBestTradeableSet(view.hand());
}
