#pragma once

#include <string>
#include <string_view>

#include "world_map.h"

// Map description format (TOML):
//
//   [regions.Alaska]
//   group = "North America"
//   neighbors = ["Alberta", "Kamchatka"]
//
//   [groups."North America"]
//   bonus = 5
//   regions = ["Alaska", "Alberta"]
//
// Every name must resolve; a dangling reference throws LoadError. Adjacency is
// made symmetric even when only one side lists the other.
WorldMap loadMapFile(const std::string& path);
WorldMap loadMapFromString(std::string_view document, const std::string& sourceName = "<memory>");
