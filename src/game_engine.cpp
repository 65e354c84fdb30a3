#include "game_engine.h"

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <sstream>
#include <stdexcept>

#include "game_errors.h"

namespace {

// Card types and draws come from their own stream so dice rolls do not shift the deck.
constexpr std::uint64_t kDeckSalt = 0xDEC4C0A2D5EED001ull;

std::string describeSet(const std::vector<Card>& hand, const CardSet& set) {
    std::ostringstream oss;
    for (size_t i = 0; i < set.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << cardTypeName(hand[set[i]].type);
    }
    return oss.str();
}

} // namespace

const char* turnPhaseName(TurnPhase phase) {
    switch (phase) {
    case TurnPhase::Setup:
        return "SETUP";
    case TurnPhase::Draft:
        return "DRAFT";
    case TurnPhase::Attack:
        return "ATTACK";
    case TurnPhase::Fortify:
        return "FORTIFY";
    case TurnPhase::End:
        return "END";
    }
    return "?";
}

GameEngine::GameEngine(GameContext& ctx, WorldMap world)
    : m_ctx(ctx),
      m_world(std::move(world)),
      m_deckRng(ctx.makeRng(kDeckSalt)),
      m_randomDice(ctx.gameRng),
      m_dice(&m_randomDice) {
    m_log.setEcho(ctx.config.game.echoLog);
}

int GameEngine::addPlayer(const std::string& name, std::unique_ptr<DecisionPolicy> policy) {
    if (m_started) {
        throw ConfigurationError("Cannot add player '" + name + "' after the game has started");
    }
    if (!policy) {
        throw ConfigurationError("Player '" + name + "' has no decision policy");
    }
    const int id = m_nextPlayerId++;
    m_players.push_back(std::make_unique<PlayerAccount>(id, name, std::move(policy)));
    return id;
}

void GameEngine::addSeats(const std::vector<GameConfig::Seat>& seats) {
    for (const GameConfig::Seat& seat : seats) {
        addPlayer(seat.name, makePolicy(seat.policy, m_ctx.seedForPlayer(m_nextPlayerId)));
    }
}

void GameEngine::setDiceSource(DiceSource* dice) {
    m_dice = dice ? dice : &m_randomDice;
}

// ------------------------------------------------------------------ setup

void GameEngine::validateRoster() const {
    const int n = static_cast<int>(m_players.size());
    if (n < kMinPlayers || n > kMaxPlayers) {
        std::ostringstream oss;
        oss << "Unsupported player count " << n << " (need " << kMinPlayers << ".." << kMaxPlayers << ")";
        throw ConfigurationError(oss.str());
    }
    if (n > m_world.getRegionCount()) {
        std::ostringstream oss;
        oss << n << " players cannot share " << m_world.getRegionCount() << " regions";
        throw ConfigurationError(oss.str());
    }
    if (static_cast<int>(m_ctx.config.setup.startingArmies.size()) != kMaxPlayers - kMinPlayers + 1) {
        throw ConfigurationError("Starting army table must have one entry per supported player count");
    }
}

void GameEngine::setup() {
    if (m_started) {
        throw ConfigurationError("Game has already been set up");
    }
    validateRoster();
    m_phase = TurnPhase::Setup;
    m_log.addEvent("Game started.");
    assignStartingRegions();
    assignStartingArmies();
    startFromCurrentPosition();
}

void GameEngine::startFromCurrentPosition() {
    if (m_started) {
        throw ConfigurationError("Game has already been started");
    }
    validateRoster();
    std::vector<int> regionIds(m_world.getRegionCount());
    std::iota(regionIds.begin(), regionIds.end(), 0);
    m_deck.buildForRegions(regionIds, m_deckRng);
    for (auto& player : m_players) {
        player->updateTroopCount(m_world);
    }
    m_started = true;
}

void GameEngine::assignStartingRegions() {
    std::vector<int> order(m_world.getRegionCount());
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), m_ctx.gameRng);

    const int numPlayers = static_cast<int>(m_players.size());
    const int perPlayer = static_cast<int>(order.size()) / numPlayers;
    const int remainder = static_cast<int>(order.size()) % numPlayers;

    size_t idx = 0;
    for (int p = 0; p < numPlayers; ++p) {
        PlayerAccount& player = *m_players[p];
        const int count = perPlayer + (p < remainder ? 1 : 0);
        for (int i = 0; i < count; ++i) {
            const int regionId = order[idx++];
            m_world.setOwner(regionId, player.getId());
            m_world.setGarrison(regionId, 1);
            m_log.addEvent(player.getName() + " received " + m_world.getRegion(regionId).name + ".");
        }
    }
}

void GameEngine::assignStartingArmies() {
    const int numPlayers = static_cast<int>(m_players.size());
    const int startArmies = m_ctx.config.setup.startingArmies[numPlayers - kMinPlayers];
    for (auto& player : m_players) {
        const std::vector<int> owned = m_world.regionsOwnedBy(player->getId());
        const int extra = startArmies - m_world.totalGarrison(player->getId());
        for (int i = 0; i < extra; ++i) {
            const int pick = m_ctx.randInt(0, static_cast<int>(owned.size()) - 1);
            m_world.addGarrison(owned[pick], 1);
        }
        player->updateTroopCount(m_world);
        m_log.addEvent(player->summary(m_world));
    }
}

// ------------------------------------------------------------------ rounds

bool GameEngine::playRound() {
    if (!m_started) {
        throw std::logic_error("GameEngine::playRound called before setup()");
    }
    if (m_gameOver) {
        return false;
    }
    ++m_round;
    // Index walk over the live roster; eliminatePlayer() shifts m_activeIndex when
    // it removes someone seated before the active player.
    for (m_activeIndex = 0; m_activeIndex < static_cast<int>(m_players.size()) && !m_gameOver; ++m_activeIndex) {
        playTurn(m_activeIndex);
    }
    return !m_gameOver;
}

int GameEngine::run(int maxRounds) {
    while (m_round < maxRounds && playRound()) {
    }
    return m_round;
}

void GameEngine::playTurn(int rosterIndex) {
    PlayerAccount& player = *m_players.at(static_cast<size_t>(rosterIndex));
    beginTurn(player);
    draftPhase(player);
    attackPhase(player);
    if (m_gameOver) {
        player.updateTroopCount(m_world);
        return;
    }
    fortifyPhase(player);
    endTurn(player);
}

void GameEngine::beginTurn(PlayerAccount& player) {
    m_phase = TurnPhase::Draft;
    m_cardEarned = false;
    m_log.addEvent("--- Round " + std::to_string(m_round) + ": " + player.getName() + "'s turn ---");

    m_world.recomputeGroupOwners();
    const int allowance = player.updateAllowance(m_world);
    std::ostringstream oss;
    oss << "[DRAFT] " << player.getName() << " receives " << allowance << " troops ("
        << m_world.countOwnedBy(player.getId()) << " regions)";
    m_log.addEvent(oss.str());

    forceTrades(player);
    if (hasAnyValidSet(player.getHand())) {
        offerTrade(player, false);
    }
}

void GameEngine::draftPhase(PlayerAccount& player) {
    m_phase = TurnPhase::Draft;
    placeReinforcements(player);
}

void GameEngine::placeReinforcements(PlayerAccount& player) {
    while (player.getAllowance() > 0) {
        const GameView view(m_world, player);
        const DraftMove move = player.getPolicy().draft(view);
        std::string reason;
        if (!validateDraft(player, move, &reason)) {
            rejectMove(player, reason);
            m_log.addEvent(player.getName() + " forfeits " + std::to_string(player.getAllowance()) + " troops.");
            player.setAllowance(0);
            return;
        }
        m_world.addGarrison(move.region, move.amount);
        player.addAllowance(-move.amount);
        m_log.addEvent("Placed " + std::to_string(move.amount) + " troops in " + regionLabel(move.region) + ".");
    }
}

void GameEngine::attackPhase(PlayerAccount& player) {
    m_phase = TurnPhase::Attack;
    while (!m_gameOver) {
        const GameView view(m_world, player);
        const std::optional<AttackMove> move = player.getPolicy().attack(view);
        if (!move) {
            break;
        }
        std::string reason;
        if (!validateAttack(player, *move, &reason)) {
            rejectMove(player, reason);
            break;
        }
        resolveAttack(player, *move);
    }
}

void GameEngine::fortifyPhase(PlayerAccount& player) {
    m_phase = TurnPhase::Fortify;
    const GameView view(m_world, player);
    const std::optional<FortifyMove> move = player.getPolicy().fortify(view);
    if (!move) {
        return;
    }
    std::string reason;
    if (!validateFortify(player, *move, &reason)) {
        rejectMove(player, reason);
        return;
    }
    moveTroops(move->from, move->to, move->amount);
    m_log.addEvent("[FORTIFY] " + player.getName() + " moves " + std::to_string(move->amount) + " troops from " +
                   regionLabel(move->from) + " to " + regionLabel(move->to) + ".");
}

void GameEngine::endTurn(PlayerAccount& player) {
    m_phase = TurnPhase::End;
    player.setAllowance(0);
    if (m_cardEarned) {
        const Card card = m_deck.draw(m_deckRng);
        player.addCard(card);
        std::string text = player.getName() + " draws a " + cardTypeName(card.type) + " card";
        if (m_world.isValidRegion(card.regionId)) {
            text += " (" + m_world.getRegion(card.regionId).name + ")";
        }
        m_log.addEvent(text + ".");
        m_cardEarned = false;
    }
    m_log.addEvent(player.getName() + " ends with " + std::to_string(player.updateTroopCount(m_world)) + " troops.");
}

// ------------------------------------------------------------------ cards

bool GameEngine::offerTrade(PlayerAccount& player, bool forced) {
    const GameView view(m_world, player);
    std::optional<CardSet> choice = player.getPolicy().trade(view, forced);
    std::string reason;
    if (!validateTrade(player, choice, forced, &reason)) {
        rejectMove(player, reason);
        if (!forced) {
            return false;
        }
        // Five or more cards always hold a set; the engine makes the trade itself.
        choice = findBestTradeableSet(player.getHand());
        if (!choice) {
            return false;
        }
        m_log.addEvent(player.getName() + " is made to trade its best set.");
    }
    if (!choice) {
        return false;
    }
    applyTrade(player, *choice);
    return true;
}

void GameEngine::forceTrades(PlayerAccount& player) {
    while (static_cast<int>(player.getHand().size()) >= kForcedTradeHandSize) {
        if (!offerTrade(player, true)) {
            break;
        }
    }
}

void GameEngine::applyTrade(PlayerAccount& player, const CardSet& set) {
    const std::string cards = describeSet(player.getHand(), set);
    const TradeResult result = applyTradeIn(player, set, m_world, m_deck);
    std::string text = player.getName() + " trades " + cards + " for " + std::to_string(result.bonus) + " troops";
    if (result.bonusRegion >= 0) {
        text += " (+" + std::to_string(kTradeRegionBonus) + " in " + m_world.getRegion(result.bonusRegion).name + ")";
    }
    m_log.addEvent(text + ".");
}

// ------------------------------------------------------------------ combat

void GameEngine::resolveAttack(PlayerAccount& player, const AttackMove& move) {
    const int defenderId = m_world.getOwner(move.to);
    const int defenders = m_world.getGarrison(move.to);
    const BattleResult result = resolveBattle(move.troops, defenders, *m_dice);
    const int attackerLosses = move.troops - result.attackers;
    const int defenderLosses = defenders - result.defenders;
    m_world.addGarrison(move.from, -attackerLosses);
    m_world.setGarrison(move.to, result.defenders);

    std::ostringstream oss;
    oss << "[ATTACK] " << player.getName() << " attacks " << m_world.getRegion(move.to).name << " from "
        << m_world.getRegion(move.from).name << " with " << move.troops << " troops: attacker lost "
        << attackerLosses << ", defender lost " << defenderLosses << ".";
    m_log.addEvent(oss.str());

    if (result.defenders == 0) {
        captureRegion(player, move.from, move.to, defenderId);
    }
}

void GameEngine::captureRegion(PlayerAccount& player, int from, int to, int previousOwner) {
    m_world.setOwner(to, player.getId());
    m_world.setGarrison(to, 0);
    m_cardEarned = true;
    m_log.addEvent(player.getName() + " captured " + m_world.getRegion(to).name + ".");

    if (m_world.countOwnedBy(previousOwner) == 0) {
        eliminatePlayer(previousOwner, player);
    }

    if (m_players.size() == 1) {
        m_gameOver = true;
        m_log.addEvent(player.getName() + " controls the world and wins in round " + std::to_string(m_round) + "!");
        moveTroops(from, to, minCaptureMove(m_world.getGarrison(from)));
        return;
    }

    // Cards taken from an eliminated player can push the hand over the limit.
    const int allowanceBefore = player.getAllowance();
    try {
        forceTrades(player);
        if (player.getAllowance() > allowanceBefore) {
            placeReinforcements(player);
        }
    } catch (const InvalidMoveError&) {
        // Strict mode: the captured region must not be left empty when the error escapes.
        const int amount = minCaptureMove(m_world.getGarrison(from));
        moveTroops(from, to, amount);
        m_log.addEvent("Moved " + std::to_string(amount) + " troops into " + regionLabel(to) + ".");
        throw;
    }

    resolveCaptureMove(player, from, to);
}

void GameEngine::resolveCaptureMove(PlayerAccount& player, int from, int to) {
    const int garrison = m_world.getGarrison(from);
    const int minMove = minCaptureMove(garrison);
    const int maxMove = maxCaptureMove(garrison);
    int amount = maxMove;
    if (minMove < maxMove) {
        const GameView view(m_world, player);
        amount = player.getPolicy().captureMove(view, from, to, minMove, maxMove);
        if (amount < minMove || amount > maxMove) {
            const int clamped = std::clamp(amount, minMove, maxMove);
            std::ostringstream oss;
            oss << player.getName() << " asked to move " << amount << " troops into "
                << m_world.getRegion(to).name << "; moving " << clamped << ".";
            m_log.addEvent(oss.str());
            amount = clamped;
        }
    }
    moveTroops(from, to, amount);
    m_log.addEvent("Moved " + std::to_string(amount) + " troops into " + regionLabel(to) + ".");
}

void GameEngine::eliminatePlayer(int playerId, PlayerAccount& eliminator) {
    auto it = std::find_if(m_players.begin(), m_players.end(),
                           [playerId](const std::unique_ptr<PlayerAccount>& p) { return p->getId() == playerId; });
    if (it == m_players.end()) {
        return;
    }
    const int index = static_cast<int>(it - m_players.begin());
    PlayerAccount& loser = **it;
    const size_t cards = loser.getHand().size();
    loser.transferHandTo(eliminator);
    loser.setAllowance(0);
    loser.updateTroopCount(m_world);
    m_log.addEvent(loser.getName() + " was eliminated by " + eliminator.getName() + ", who takes " +
                   std::to_string(cards) + " cards.");

    m_eliminated.push_back(std::move(*it));
    m_players.erase(it);
    if (index < m_activeIndex) {
        --m_activeIndex;
    }
}

int GameEngine::minCaptureMove(int garrison) {
    const int available = garrison - 1;
    return available <= 3 ? std::max(0, available) : 3;
}

int GameEngine::maxCaptureMove(int garrison) {
    return std::max(0, garrison - 1);
}

void GameEngine::moveTroops(int from, int to, int amount) {
    m_world.addGarrison(from, -amount);
    m_world.addGarrison(to, amount);
}

// ------------------------------------------------------------------ validation

bool GameEngine::validateDraft(const PlayerAccount& player, const DraftMove& move, std::string* reason) const {
    auto fail = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };
    if (!m_world.isValidRegion(move.region)) {
        return fail("draft names no region");
    }
    if (m_world.getOwner(move.region) != player.getId()) {
        return fail("cannot draft into " + m_world.getRegion(move.region).name + ", it is not owned");
    }
    if (move.amount < 1 || move.amount > player.getAllowance()) {
        return fail("draft of " + std::to_string(move.amount) + " troops outside 1.." +
                    std::to_string(player.getAllowance()));
    }
    return true;
}

bool GameEngine::validateAttack(const PlayerAccount& player, const AttackMove& move, std::string* reason) const {
    auto fail = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };
    if (!m_world.isValidRegion(move.from) || !m_world.isValidRegion(move.to)) {
        return fail("attack names an unknown region");
    }
    const Region& from = m_world.getRegion(move.from);
    const Region& to = m_world.getRegion(move.to);
    if (m_world.getOwner(move.from) != player.getId()) {
        return fail("cannot attack from " + from.name + ", it is not owned");
    }
    if (m_world.getOwner(move.to) == player.getId()) {
        return fail("cannot attack own region " + to.name);
    }
    if (!m_world.areAdjacent(move.from, move.to)) {
        return fail(from.name + " does not border " + to.name);
    }
    if (from.garrison < 2) {
        return fail(from.name + " has too few troops to attack");
    }
    if (move.troops < 1 || move.troops > from.garrison - 1) {
        return fail("attack with " + std::to_string(move.troops) + " troops outside 1.." +
                    std::to_string(from.garrison - 1));
    }
    return true;
}

bool GameEngine::validateFortify(const PlayerAccount& player, const FortifyMove& move, std::string* reason) const {
    auto fail = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };
    if (!m_world.isValidRegion(move.from) || !m_world.isValidRegion(move.to)) {
        return fail("fortify names an unknown region");
    }
    if (move.from == move.to) {
        return fail("fortify source and destination are the same region");
    }
    const Region& from = m_world.getRegion(move.from);
    const Region& to = m_world.getRegion(move.to);
    if (m_world.getOwner(move.from) != player.getId() || m_world.getOwner(move.to) != player.getId()) {
        return fail("fortify between " + from.name + " and " + to.name + " needs both regions owned");
    }
    if (!m_world.connectedThroughOwner(move.from, move.to, player.getId())) {
        return fail(from.name + " and " + to.name + " are not joined by owned regions");
    }
    if (move.amount < 1 || move.amount > from.garrison - 1) {
        return fail("fortify of " + std::to_string(move.amount) + " troops outside 1.." +
                    std::to_string(from.garrison - 1));
    }
    return true;
}

bool GameEngine::validateTrade(const PlayerAccount& player,
                               const std::optional<CardSet>& set,
                               bool forced,
                               std::string* reason) const {
    if (!set) {
        if (forced) {
            if (reason) *reason = "must trade while holding " + std::to_string(player.getHand().size()) + " cards";
            return false;
        }
        return true;
    }
    if (!isValidCardSet(player.getHand(), *set)) {
        if (reason) *reason = "selected cards are not a tradeable set";
        return false;
    }
    return true;
}

void GameEngine::rejectMove(const PlayerAccount& player, const std::string& reason) {
    RejectedMove rejected;
    rejected.round = m_round;
    rejected.playerId = player.getId();
    rejected.phase = m_phase;
    rejected.reason = reason;
    m_rejected.push_back(rejected);

    const std::string text = std::string("[Invalid] ") + turnPhaseName(m_phase) + " " + player.getName() + ": " + reason;
    m_log.addEvent(text);
    if (m_ctx.config.game.strictMoves) {
        throw InvalidMoveError(text);
    }
}

// ------------------------------------------------------------------ queries

bool GameEngine::checkInvariants(std::string* reason) const {
    auto fail = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };
    int owned = 0;
    for (const auto& player : m_players) {
        owned += m_world.countOwnedBy(player->getId());
        if (m_world.countOwnedBy(player->getId()) == 0) {
            return fail(player->getName() + " is on the roster without any region");
        }
    }
    for (const Region& region : m_world.getRegions()) {
        const int owner = m_world.getOwner(region.id);
        if (owner == kNoPlayer) {
            return fail(region.name + " has no owner");
        }
        if (region.garrison < 1) {
            return fail(region.name + " has garrison " + std::to_string(region.garrison));
        }
    }
    if (owned != m_world.getRegionCount()) {
        return fail("live players own " + std::to_string(owned) + " of " +
                    std::to_string(m_world.getRegionCount()) + " regions");
    }
    return true;
}

PlayerAccount* GameEngine::findPlayer(int playerId) {
    for (auto& player : m_players) {
        if (player->getId() == playerId) return player.get();
    }
    for (auto& player : m_eliminated) {
        if (player->getId() == playerId) return player.get();
    }
    return nullptr;
}

const PlayerAccount* GameEngine::getWinner() const {
    if (!m_gameOver || m_players.size() != 1) {
        return nullptr;
    }
    return m_players.front().get();
}

std::string GameEngine::regionLabel(int regionId) const {
    const Region& region = m_world.getRegion(regionId);
    return region.name + " (" + std::to_string(region.garrison) + ")";
}
