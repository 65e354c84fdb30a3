#include "decision_policy.h"

#include "bots.h"
#include "game_errors.h"
#include "player.h"
#include "world_map.h"

int GameView::playerId() const {
    return m_self.getId();
}

int GameView::allowance() const {
    return m_self.getAllowance();
}

const std::vector<Card>& GameView::hand() const {
    return m_self.getHand();
}

std::vector<int> GameView::ownedRegions() const {
    return m_world.regionsOwnedBy(m_self.getId());
}

bool GameView::owns(int regionId) const {
    return m_world.isValidRegion(regionId) && m_world.getOwner(regionId) == m_self.getId();
}

bool GameView::canAttackFrom(int regionId) const {
    return owns(regionId) && m_world.getGarrison(regionId) >= 2 && m_world.hasEnemyNeighbor(regionId);
}

std::unique_ptr<DecisionPolicy> makePolicy(const std::string& kind, std::uint64_t seed) {
    if (kind == "greedy") {
        return std::make_unique<GreedyPolicy>();
    }
    if (kind == "passive") {
        return std::make_unique<PassivePolicy>(seed);
    }
    throw ConfigurationError("Unknown policy '" + kind + "' (expected greedy or passive)");
}
