// world_map.h
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

constexpr int kNoPlayer = -1;
constexpr int kNoRegion = -1;

struct Region {
    int id = kNoRegion;
    std::string name;
    int groupId = -1;
    std::vector<int> neighbors;
    int garrison = 0;
};

struct RegionGroup {
    int id = -1;
    std::string name;
    int bonus = 0;
    std::vector<int> regions;
    int owner = kNoPlayer; // derived, see WorldMap::recomputeGroupOwners
};

// Regions, continents and the owner-by-region table. The owner table is the only
// place ownership lives; per-player region lists are derived from it on demand.
class WorldMap {
public:
    int addGroup(const std::string& name, int bonus);
    int addRegion(const std::string& name, int groupId);
    // Symmetric; connecting an already adjacent pair is a no-op.
    void connect(int a, int b);

    int getRegionCount() const { return static_cast<int>(m_regions.size()); }
    int getGroupCount() const { return static_cast<int>(m_groups.size()); }
    const Region& getRegion(int regionId) const;
    const RegionGroup& getGroup(int groupId) const;
    const std::vector<Region>& getRegions() const { return m_regions; }
    const std::vector<RegionGroup>& getGroups() const { return m_groups; }
    int findRegion(const std::string& name) const;
    int findGroup(const std::string& name) const;
    bool isValidRegion(int regionId) const;
    bool areAdjacent(int a, int b) const;

    int getOwner(int regionId) const;
    void setOwner(int regionId, int playerId);
    int getGarrison(int regionId) const;
    void setGarrison(int regionId, int troops);
    void addGarrison(int regionId, int delta);

    std::vector<int> regionsOwnedBy(int playerId) const;
    int countOwnedBy(int playerId) const;
    int totalGarrison(int playerId) const;
    // Neighbors held by someone other than the region's owner.
    std::vector<int> enemyNeighbors(int regionId) const;
    bool hasEnemyNeighbor(int regionId) const;
    // True if a path of regions owned by playerId joins a and b.
    bool connectedThroughOwner(int a, int b, int playerId) const;

    // Group ownership is not maintained incrementally; call at the start of a turn.
    void recomputeGroupOwners();
    int getGroupOwner(int groupId) const;
    int groupBonusFor(int playerId) const;

private:
    std::vector<Region> m_regions;
    std::vector<RegionGroup> m_groups;
    std::vector<int> m_owners;
    std::unordered_map<std::string, int> m_regionIndex;
    std::unordered_map<std::string, int> m_groupIndex;
};
