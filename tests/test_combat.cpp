// ═════════════════════════════════════════════════════════════
// Category 1: COMBAT - dice duels and win-probability estimates
// ═════════════════════════════════════════════════════════════

TEST_CASE("Combat: three attacker dice against one defender die") {
  ForcedDice dice({6, 5, 4, 1});
  RoundLosses losses = resolveBattleRound(3, 1, dice);
  CHECK(losses.defender == 1);
  CHECK(losses.attacker == 0);
  CHECK(dice.remaining() == 0);
}

TEST_CASE("Combat: ties go to the defender") {
  SUBCASE("single pair") {
    ForcedDice dice({4, 4});
    RoundLosses losses = resolveBattleRound(1, 1, dice);
    CHECK(losses.attacker == 1);
    CHECK(losses.defender == 0);
  }
  SUBCASE("both pairs tied") {
    ForcedDice dice({6, 3, 1, 6, 3});
    RoundLosses losses = resolveBattleRound(3, 2, dice);
    CHECK(losses.attacker == 2);
    CHECK(losses.defender == 0);
  }
}

TEST_CASE("Combat: dice are compared highest to highest") {
  // Attacker 1,6,1 sorts to 6,1,1; defender 5,5.
  ForcedDice dice({1, 6, 1, 5, 5});
  RoundLosses losses = resolveBattleRound(3, 2, dice);
  CHECK(losses.defender == 1);
  CHECK(losses.attacker == 1);
}

TEST_CASE("Combat: only min(attacker, defender) dice are paired") {
  ForcedDice dice({1, 1, 6});
  RoundLosses losses = resolveBattleRound(2, 1, dice);
  // Sorted attacker 1,1 against defender 6: one comparison only.
  CHECK(losses.attacker == 1);
  CHECK(losses.defender == 0);
}

TEST_CASE("Combat: battle runs until one side is empty") {
  SUBCASE("lone attacker loses") {
    ForcedDice dice({3, 5});
    BattleResult r = resolveBattle(1, 1, dice);
    CHECK(r.attackers == 0);
    CHECK(r.defenders == 1);
    CHECK(r.rounds == 1);
    CHECK_FALSE(r.attackerWon());
  }
  SUBCASE("two rounds, dice count shrinks with the troops") {
    // Round 1: attacker rolls 2 dice, defender 1 -> tie, attacker loses one.
    // Round 2: 1 vs 1, attacker wins.
    ForcedDice dice({2, 2, 2, 5, 3});
    BattleResult r = resolveBattle(2, 1, dice);
    CHECK(r.attackers == 1);
    CHECK(r.defenders == 0);
    CHECK(r.rounds == 2);
    CHECK(r.attackerWon());
    CHECK(dice.remaining() == 0);
  }
  SUBCASE("defender rolls two dice while it has two troops") {
    ForcedDice dice({6, 6, 6, 1, 1});
    BattleResult r = resolveBattle(3, 2, dice);
    CHECK(r.attackers == 3);
    CHECK(r.defenders == 0);
    CHECK(r.rounds == 1);
  }
}

TEST_CASE("Combat: non-positive troop counts are rejected") {
  ForcedDice dice(std::vector<int>{});
  CHECK_THROWS_AS(resolveBattle(0, 3, dice), std::invalid_argument);
  CHECK_THROWS_AS(resolveBattle(3, 0, dice), std::invalid_argument);
  CHECK_THROWS_AS(resolveBattle(-2, 1, dice), std::invalid_argument);
  CHECK_THROWS_AS(resolveBattleRound(4, 1, dice), std::invalid_argument);
  CHECK_THROWS_AS(resolveBattleRound(1, 3, dice), std::invalid_argument);
  CHECK(dice.used() == 0);
}

TEST_CASE("Combat: exactly one side is wiped out") {
  std::mt19937_64 rng(2024);
  RandomDice dice(rng);
  for (int a = 1; a <= 12; ++a) {
    for (int d = 1; d <= 12; ++d) {
      BattleResult r = resolveBattle(a, d, dice);
      CHECK(((r.attackers == 0) != (r.defenders == 0)));
      CHECK(r.attackers >= 0);
      CHECK(r.attackers <= a);
      CHECK(r.defenders >= 0);
      CHECK(r.defenders <= d);
      CHECK(r.rounds >= 1);
    }
  }
}

TEST_CASE("Combat: win probability estimate") {
  SUBCASE("same seed gives the same estimate") {
    CHECK(estimateWinProbability(5, 4, 3000, 99) ==
          estimateWinProbability(5, 4, 3000, 99));
  }
  SUBCASE("one die against one die is 15/36") {
    double p = estimateWinProbability(1, 1, 20000, 7);
    CHECK(p == doctest::Approx(41.67).epsilon(0.05));
  }
  SUBCASE("lopsided battles") {
    CHECK(estimateWinProbability(30, 1, 2000, 3) > 99.0);
    CHECK(estimateWinProbability(1, 10, 2000, 3) < 1.0);
  }
  SUBCASE("result is a percentage with two decimals") {
    double p = estimateWinProbability(4, 3, 777, 5);
    CHECK(p >= 0.0);
    CHECK(p <= 100.0);
    CHECK(std::round(p * 100.0) == doctest::Approx(p * 100.0));
  }
  SUBCASE("bad arguments") {
    CHECK_THROWS_AS(estimateWinProbability(3, 3, 0, 1), std::invalid_argument);
    CHECK_THROWS_AS(estimateWinProbability(0, 3, 10, 1), std::invalid_argument);
  }
}

TEST_CASE("Combat: adaptive estimate sizes its own sample") {
  double p = estimateWinProbabilityAdaptive(1, 1, 11);
  CHECK(p > 39.0);
  CHECK(p < 44.5);
  CHECK(estimateWinProbabilityAdaptive(25, 1, 11) > 99.0);
}
