#include "player.h"

#include <algorithm>
#include <sstream>

#include "decision_policy.h"
#include "world_map.h"

int reinforcementAllowance(const WorldMap& world, int playerId) {
    const int owned = world.countOwnedBy(playerId);
    return std::max(kMinReinforcements, owned / 3) + world.groupBonusFor(playerId);
}

PlayerAccount::PlayerAccount(int id, const std::string& name, std::unique_ptr<DecisionPolicy> policy)
    : m_id(id), m_name(name), m_policy(std::move(policy)) {}

PlayerAccount::~PlayerAccount() = default;
PlayerAccount::PlayerAccount(PlayerAccount&&) noexcept = default;
PlayerAccount& PlayerAccount::operator=(PlayerAccount&&) noexcept = default;

void PlayerAccount::transferHandTo(PlayerAccount& other) {
    other.m_hand.insert(other.m_hand.end(), m_hand.begin(), m_hand.end());
    m_hand.clear();
}

int PlayerAccount::updateAllowance(const WorldMap& world) {
    m_allowance = reinforcementAllowance(world, m_id);
    return m_allowance;
}

int PlayerAccount::updateTroopCount(const WorldMap& world) {
    m_totalTroops = world.totalGarrison(m_id);
    return m_totalTroops;
}

std::string PlayerAccount::summary(const WorldMap& world) const {
    std::ostringstream oss;
    oss << m_name << " has " << m_totalTroops << " troops, " << world.countOwnedBy(m_id)
        << " regions, and " << m_hand.size() << " cards.";
    return oss.str();
}
