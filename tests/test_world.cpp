// ═════════════════════════════════════════════════════════════
// Category 3: WORLD - map loading, ownership queries, allowance
// ═════════════════════════════════════════════════════════════

static const char *kTinyMap = R"(
[groups.North]
bonus = 3
regions = ["A", "B"]

[groups.South]
bonus = 1
regions = ["C"]

[regions.A]
group = "North"
neighbors = ["B"]

[regions.B]
group = "North"
neighbors = ["C"]

[regions.C]
group = "South"
neighbors = []
)";

TEST_CASE("World: loader resolves names into a symmetric graph") {
  WorldMap world = loadMapFromString(kTinyMap);
  REQUIRE(world.getRegionCount() == 3);
  REQUIRE(world.getGroupCount() == 2);
  const int a = world.findRegion("A");
  const int b = world.findRegion("B");
  const int c = world.findRegion("C");
  CHECK(world.areAdjacent(a, b));
  CHECK(world.areAdjacent(b, a));
  // C lists no neighbors but B lists C.
  CHECK(world.areAdjacent(c, b));
  CHECK_FALSE(world.areAdjacent(a, c));
  CHECK(world.getGroup(world.findGroup("North")).bonus == 3);
  CHECK(world.getGroup(world.getRegion(c).groupId).name == "South");
  CHECK(world.getOwner(a) == kNoPlayer);
}

TEST_CASE("World: dangling references are load errors") {
  SUBCASE("unknown neighbor") {
    CHECK_THROWS_AS(loadMapFromString(R"(
[groups.G]
bonus = 1
regions = ["A"]
[regions.A]
group = "G"
neighbors = ["Nowhere"]
)"),
                    LoadError);
  }
  SUBCASE("unknown group") {
    CHECK_THROWS_AS(loadMapFromString(R"(
[groups.G]
bonus = 1
regions = ["A"]
[regions.A]
group = "H"
neighbors = []
)"),
                    LoadError);
  }
  SUBCASE("group lists a missing region") {
    CHECK_THROWS_AS(loadMapFromString(R"(
[groups.G]
bonus = 1
regions = ["A", "Z"]
[regions.A]
group = "G"
neighbors = []
)"),
                    LoadError);
  }
  SUBCASE("region missing from its group's list") {
    CHECK_THROWS_AS(loadMapFromString(R"(
[groups.G]
bonus = 1
regions = ["A"]
[regions.A]
group = "G"
neighbors = ["B"]
[regions.B]
group = "G"
neighbors = []
)"),
                    LoadError);
  }
  SUBCASE("missing tables and bad syntax") {
    CHECK_THROWS_AS(loadMapFromString("[groups.G]\nbonus = 1\nregions = []\n"), LoadError);
    CHECK_THROWS_AS(loadMapFromString("[regions.A\n"), LoadError);
    CHECK_THROWS_AS(loadMapFile("does/not/exist.toml"), LoadError);
  }
}

TEST_CASE("World: classic map file") {
  WorldMap world = loadMapFile(std::string(CONQUEST_DATA_DIR) + "/classic_map.toml");
  CHECK(world.getRegionCount() == 42);
  CHECK(world.getGroupCount() == 6);
  CHECK(world.areAdjacent(world.findRegion("Alaska"), world.findRegion("Kamchatka")));
  CHECK(world.areAdjacent(world.findRegion("Brazil"), world.findRegion("North Africa")));
  CHECK(world.getGroup(world.findGroup("Asia")).bonus == 7);
  CHECK(world.getGroup(world.findGroup("Asia")).regions.size() == 12);
  for (const Region &r : world.getRegions()) {
    CHECK_FALSE(r.neighbors.empty());
    for (int n : r.neighbors)
      CHECK(world.areAdjacent(n, r.id));
  }
}

TEST_CASE("World: ownership queries derive from the owner table") {
  WorldMap world = make_line_world(5);
  for (int r = 0; r < 5; ++r) {
    world.setOwner(r, r < 3 ? 0 : 1);
    world.setGarrison(r, r + 1);
  }
  CHECK(world.countOwnedBy(0) == 3);
  CHECK(world.regionsOwnedBy(1) == std::vector<int>{3, 4});
  CHECK(world.totalGarrison(0) == 6);
  CHECK(world.totalGarrison(1) == 9);
  CHECK(world.hasEnemyNeighbor(2));
  CHECK_FALSE(world.hasEnemyNeighbor(1));
  CHECK(world.enemyNeighbors(3) == std::vector<int>{2});

  world.setOwner(2, 1);
  CHECK(world.countOwnedBy(0) == 2);
  CHECK(world.countOwnedBy(1) == 3);
}

TEST_CASE("World: connectivity through owned regions") {
  WorldMap world = make_line_world(4);
  world.setOwner(0, 0);
  world.setOwner(1, 0);
  world.setOwner(2, 1);
  world.setOwner(3, 0);
  CHECK(world.connectedThroughOwner(0, 1, 0));
  CHECK_FALSE(world.connectedThroughOwner(0, 3, 0));
  CHECK_FALSE(world.connectedThroughOwner(0, 2, 0));
  world.setOwner(2, 0);
  CHECK(world.connectedThroughOwner(0, 3, 0));
}

TEST_CASE("World: group owners and reinforcement allowance") {
  WorldMap world;
  const int small = world.addGroup("Small", 2);
  const int large = world.addGroup("Large", 5);
  for (int i = 0; i < 3; ++i)
    world.addRegion("S" + std::to_string(i), small);
  for (int i = 0; i < 9; ++i)
    world.addRegion("L" + std::to_string(i), large);

  for (int r = 0; r < 12; ++r)
    world.setOwner(r, r < 9 ? 0 : 1);

  // Not recomputed yet: no group owner, no bonus.
  CHECK(world.getGroupOwner(small) == kNoPlayer);
  CHECK(reinforcementAllowance(world, 0) == 3);

  world.recomputeGroupOwners();
  CHECK(world.getGroupOwner(small) == 0);
  CHECK(world.getGroupOwner(large) == kNoPlayer);
  CHECK(reinforcementAllowance(world, 0) == 3 + 2);
  CHECK(reinforcementAllowance(world, 1) == 3);

  for (int r = 0; r < 12; ++r)
    world.setOwner(r, 0);
  world.recomputeGroupOwners();
  CHECK(reinforcementAllowance(world, 0) == 4 + 2 + 5);
  CHECK(reinforcementAllowance(world, 1) == 3);
}

TEST_CASE("World: runtime config file") {
  GameContext ctx(1, "");
  CHECK(ctx.configHash == "defaults");
  CHECK(ctx.config.seats.size() == 4);

  std::string err;
  REQUIRE(ctx.loadConfig(std::string(CONQUEST_DATA_DIR) + "/conquest_config.toml", &err));
  CHECK(ctx.configHash != "defaults");
  CHECK(ctx.config.game.maxRounds == 500);
  CHECK(ctx.config.setup.startingArmies == std::vector<int>{40, 35, 30, 25, 20});
  REQUIRE(ctx.config.seats.size() == 4);
  CHECK(ctx.config.seats[3].policy == "passive");

  SUBCASE("missing file keeps defaults") {
    CHECK_FALSE(ctx.loadConfig(std::string(CONQUEST_DATA_DIR) + "/no_such_config.toml", &err));
    CHECK_FALSE(err.empty());
    CHECK(ctx.config.combat.estimateTrials == 10000);
    CHECK(ctx.configHash == "defaults");
  }
}

TEST_CASE("World: salted generators are reproducible") {
  GameContext a(5, "");
  GameContext b(5, "");
  std::mt19937_64 ra = a.makeRng(11);
  std::mt19937_64 rb = b.makeRng(11);
  CHECK(ra() == rb());
  CHECK(a.seedForPlayer(0) == b.seedForPlayer(0));
  CHECK(a.seedForPlayer(0) != a.seedForPlayer(1));
  for (int i = 0; i < 100; ++i) {
    const int v = a.randInt(2, 4);
    CHECK(v >= 2);
    CHECK(v <= 4);
  }
}
