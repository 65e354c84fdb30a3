#include "world_map.h"

#include <algorithm>
#include <queue>
#include <stdexcept>

int WorldMap::addGroup(const std::string& name, int bonus) {
    RegionGroup group;
    group.id = static_cast<int>(m_groups.size());
    group.name = name;
    group.bonus = bonus;
    m_groupIndex[name] = group.id;
    m_groups.push_back(group);
    return group.id;
}

int WorldMap::addRegion(const std::string& name, int groupId) {
    if (groupId < 0 || groupId >= getGroupCount()) {
        throw std::out_of_range("WorldMap::addRegion: unknown group id " + std::to_string(groupId));
    }
    Region region;
    region.id = static_cast<int>(m_regions.size());
    region.name = name;
    region.groupId = groupId;
    m_regionIndex[name] = region.id;
    m_regions.push_back(region);
    m_owners.push_back(kNoPlayer);
    m_groups[groupId].regions.push_back(region.id);
    return region.id;
}

void WorldMap::connect(int a, int b) {
    if (!isValidRegion(a) || !isValidRegion(b) || a == b) {
        throw std::out_of_range("WorldMap::connect: bad region pair");
    }
    if (areAdjacent(a, b)) {
        return;
    }
    m_regions[a].neighbors.push_back(b);
    m_regions[b].neighbors.push_back(a);
}

const Region& WorldMap::getRegion(int regionId) const {
    return m_regions.at(static_cast<size_t>(regionId));
}

const RegionGroup& WorldMap::getGroup(int groupId) const {
    return m_groups.at(static_cast<size_t>(groupId));
}

int WorldMap::findRegion(const std::string& name) const {
    auto it = m_regionIndex.find(name);
    return it == m_regionIndex.end() ? kNoRegion : it->second;
}

int WorldMap::findGroup(const std::string& name) const {
    auto it = m_groupIndex.find(name);
    return it == m_groupIndex.end() ? -1 : it->second;
}

bool WorldMap::isValidRegion(int regionId) const {
    return regionId >= 0 && regionId < getRegionCount();
}

bool WorldMap::areAdjacent(int a, int b) const {
    if (!isValidRegion(a) || !isValidRegion(b)) {
        return false;
    }
    const auto& n = m_regions[a].neighbors;
    return std::find(n.begin(), n.end(), b) != n.end();
}

int WorldMap::getOwner(int regionId) const {
    return m_owners.at(static_cast<size_t>(regionId));
}

void WorldMap::setOwner(int regionId, int playerId) {
    m_owners.at(static_cast<size_t>(regionId)) = playerId;
}

int WorldMap::getGarrison(int regionId) const {
    return getRegion(regionId).garrison;
}

void WorldMap::setGarrison(int regionId, int troops) {
    m_regions.at(static_cast<size_t>(regionId)).garrison = troops;
}

void WorldMap::addGarrison(int regionId, int delta) {
    m_regions.at(static_cast<size_t>(regionId)).garrison += delta;
}

std::vector<int> WorldMap::regionsOwnedBy(int playerId) const {
    std::vector<int> out;
    for (int i = 0; i < getRegionCount(); ++i) {
        if (m_owners[i] == playerId) {
            out.push_back(i);
        }
    }
    return out;
}

int WorldMap::countOwnedBy(int playerId) const {
    return static_cast<int>(std::count(m_owners.begin(), m_owners.end(), playerId));
}

int WorldMap::totalGarrison(int playerId) const {
    int total = 0;
    for (int i = 0; i < getRegionCount(); ++i) {
        if (m_owners[i] == playerId) {
            total += m_regions[i].garrison;
        }
    }
    return total;
}

std::vector<int> WorldMap::enemyNeighbors(int regionId) const {
    std::vector<int> out;
    const int owner = getOwner(regionId);
    for (int n : getRegion(regionId).neighbors) {
        if (m_owners[n] != owner) {
            out.push_back(n);
        }
    }
    return out;
}

bool WorldMap::hasEnemyNeighbor(int regionId) const {
    const int owner = getOwner(regionId);
    for (int n : getRegion(regionId).neighbors) {
        if (m_owners[n] != owner) {
            return true;
        }
    }
    return false;
}

bool WorldMap::connectedThroughOwner(int a, int b, int playerId) const {
    if (!isValidRegion(a) || !isValidRegion(b)) {
        return false;
    }
    if (m_owners[a] != playerId || m_owners[b] != playerId) {
        return false;
    }
    std::vector<bool> seen(m_regions.size(), false);
    std::queue<int> frontier;
    frontier.push(a);
    seen[a] = true;
    while (!frontier.empty()) {
        const int cur = frontier.front();
        frontier.pop();
        if (cur == b) {
            return true;
        }
        for (int n : m_regions[cur].neighbors) {
            if (!seen[n] && m_owners[n] == playerId) {
                seen[n] = true;
                frontier.push(n);
            }
        }
    }
    return false;
}

void WorldMap::recomputeGroupOwners() {
    for (RegionGroup& group : m_groups) {
        group.owner = kNoPlayer;
        if (group.regions.empty()) {
            continue;
        }
        const int candidate = m_owners[group.regions.front()];
        bool whole = candidate != kNoPlayer;
        for (int r : group.regions) {
            if (m_owners[r] != candidate) {
                whole = false;
                break;
            }
        }
        if (whole) {
            group.owner = candidate;
        }
    }
}

int WorldMap::getGroupOwner(int groupId) const {
    return getGroup(groupId).owner;
}

int WorldMap::groupBonusFor(int playerId) const {
    int bonus = 0;
    for (const RegionGroup& group : m_groups) {
        if (group.owner == playerId && playerId != kNoPlayer) {
            bonus += group.bonus;
        }
    }
    return bonus;
}
