// ═════════════════════════════════════════════════════════════
// CONQUEST: TEST UNITY BUILD
// ═════════════════════════════════════════════════════════════
// Headless test binary linked against conquest_core.
// Run: ctest, or build/conquest_tests directly.
// ═════════════════════════════════════════════════════════════

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// ── Engine code ─────────────────────────────────────────────
#include "bots.h"
#include "cards.h"
#include "combat.h"
#include "decision_policy.h"
#include "game_context.h"
#include "game_engine.h"
#include "game_errors.h"
#include "map_loader.h"
#include "player.h"
#include "world_map.h"

// ── Test Infrastructure ─────────────────────────────────────
#include "test_harness.h"

// ── Test Suites (domain-based) ──────────────────────────────
#include "test_combat.cpp"
#include "test_cards.cpp"
#include "test_world.cpp"
#include "test_bots.cpp"
#include "test_engine.cpp"
