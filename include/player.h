// player.h

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "cards.h"

class DecisionPolicy;
class WorldMap;

constexpr int kMinReinforcements = 3;

// max(3, owned / 3) + bonus of every group the player holds outright.
// Group owners must be current (WorldMap::recomputeGroupOwners).
int reinforcementAllowance(const WorldMap& world, int playerId);

class PlayerAccount {
public:
    PlayerAccount(int id, const std::string& name, std::unique_ptr<DecisionPolicy> policy);
    ~PlayerAccount();
    PlayerAccount(PlayerAccount&&) noexcept;
    PlayerAccount& operator=(PlayerAccount&&) noexcept;

    int getId() const { return m_id; }
    const std::string& getName() const { return m_name; }
    DecisionPolicy& getPolicy() { return *m_policy; }
    const DecisionPolicy& getPolicy() const { return *m_policy; }

    const std::vector<Card>& getHand() const { return m_hand; }
    std::vector<Card>& getHandMutable() { return m_hand; }
    void addCard(const Card& card) { m_hand.push_back(card); }
    // Moves the whole hand to `other`, leaving this one empty.
    void transferHandTo(PlayerAccount& other);

    int getAllowance() const { return m_allowance; }
    void setAllowance(int troops) { m_allowance = troops; }
    void addAllowance(int troops) { m_allowance += troops; }
    int updateAllowance(const WorldMap& world);

    // Cached; always recomputed from the map, never adjusted in place.
    int getTotalTroops() const { return m_totalTroops; }
    int updateTroopCount(const WorldMap& world);

    std::string summary(const WorldMap& world) const;

private:
    int m_id;
    std::string m_name;
    std::unique_ptr<DecisionPolicy> m_policy;
    std::vector<Card> m_hand;
    int m_allowance = 0;
    int m_totalTroops = 0;
};
