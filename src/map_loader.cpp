#include "map_loader.h"

#include <algorithm>
#include <sstream>

#include <toml++/toml.hpp>

#include "game_errors.h"

namespace {

std::vector<std::string> readNameList(const toml::table& table,
                                      std::string_view key,
                                      const std::string& owner,
                                      const std::string& sourceName) {
    std::vector<std::string> names;
    const toml::array* arr = table[key].as_array();
    if (!arr) {
        throw LoadError(sourceName + ": '" + owner + "' is missing the '" + std::string(key) + "' list");
    }
    for (const toml::node& node : *arr) {
        const auto v = node.value<std::string>();
        if (!v) {
            throw LoadError(sourceName + ": '" + owner + "' has a non-string entry in '" + std::string(key) + "'");
        }
        names.push_back(*v);
    }
    return names;
}

WorldMap buildWorld(const toml::table& root, const std::string& sourceName) {
    const toml::table* groups = root["groups"].as_table();
    const toml::table* regions = root["regions"].as_table();
    if (!groups || !regions) {
        throw LoadError(sourceName + ": map needs both [groups] and [regions] tables");
    }

    WorldMap world;

    for (auto&& [key, node] : *groups) {
        const std::string name(key.str());
        const toml::table* groupTable = node.as_table();
        if (!groupTable) {
            throw LoadError(sourceName + ": group '" + name + "' is not a table");
        }
        const auto bonus = (*groupTable)["bonus"].value<std::int64_t>();
        if (!bonus) {
            throw LoadError(sourceName + ": group '" + name + "' has no integer bonus");
        }
        world.addGroup(name, static_cast<int>(*bonus));
    }

    // Neighbor lists are resolved in a second pass once every region exists.
    std::vector<std::vector<std::string>> pendingNeighbors;
    for (auto&& [key, node] : *regions) {
        const std::string name(key.str());
        const toml::table* regionTable = node.as_table();
        if (!regionTable) {
            throw LoadError(sourceName + ": region '" + name + "' is not a table");
        }
        const auto groupName = (*regionTable)["group"].value<std::string>();
        if (!groupName) {
            throw LoadError(sourceName + ": region '" + name + "' has no group");
        }
        const int groupId = world.findGroup(*groupName);
        if (groupId < 0) {
            throw LoadError(sourceName + ": region '" + name + "' refers to unknown group '" + *groupName + "'");
        }
        world.addRegion(name, groupId);
        pendingNeighbors.push_back(readNameList(*regionTable, "neighbors", name, sourceName));
    }

    for (int regionId = 0; regionId < world.getRegionCount(); ++regionId) {
        for (const std::string& neighborName : pendingNeighbors[regionId]) {
            const int neighborId = world.findRegion(neighborName);
            if (neighborId == kNoRegion) {
                throw LoadError(sourceName + ": region '" + world.getRegion(regionId).name +
                                "' lists unknown neighbor '" + neighborName + "'");
            }
            if (neighborId == regionId) {
                throw LoadError(sourceName + ": region '" + neighborName + "' lists itself as a neighbor");
            }
            world.connect(regionId, neighborId);
        }
    }

    for (auto&& [key, node] : *groups) {
        const std::string name(key.str());
        const int groupId = world.findGroup(name);
        const std::vector<std::string> members = readNameList(*node.as_table(), "regions", name, sourceName);
        std::vector<int> seen;
        for (const std::string& member : members) {
            const int regionId = world.findRegion(member);
            if (regionId == kNoRegion) {
                throw LoadError(sourceName + ": group '" + name + "' lists unknown region '" + member + "'");
            }
            if (std::find(seen.begin(), seen.end(), regionId) != seen.end()) {
                throw LoadError(sourceName + ": group '" + name + "' lists region '" + member + "' twice");
            }
            seen.push_back(regionId);
            if (world.getRegion(regionId).groupId != groupId) {
                throw LoadError(sourceName + ": region '" + member + "' is listed in group '" + name +
                                "' but declares group '" +
                                world.getGroup(world.getRegion(regionId).groupId).name + "'");
            }
        }
        const auto& declared = world.getGroup(groupId).regions;
        if (declared.size() != members.size()) {
            std::ostringstream oss;
            oss << sourceName << ": group '" << name << "' lists " << members.size()
                << " regions but " << declared.size() << " regions declare it";
            throw LoadError(oss.str());
        }
    }

    if (world.getRegionCount() == 0) {
        throw LoadError(sourceName + ": map has no regions");
    }
    return world;
}

} // namespace

WorldMap loadMapFile(const std::string& path) {
    try {
        toml::table root = toml::parse_file(path);
        return buildWorld(root, path);
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse map '" << path << "': " << err.description();
        throw LoadError(oss.str());
    }
}

WorldMap loadMapFromString(std::string_view document, const std::string& sourceName) {
    try {
        toml::table root = toml::parse(document, sourceName);
        return buildWorld(root, sourceName);
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse map '" << sourceName << "': " << err.description();
        throw LoadError(oss.str());
    }
}
