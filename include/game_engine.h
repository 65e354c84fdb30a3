#pragma once

#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "cards.h"
#include "combat.h"
#include "decision_policy.h"
#include "event_log.h"
#include "game_context.h"
#include "player.h"
#include "world_map.h"

enum class TurnPhase {
    Setup,
    Draft,
    Attack,
    Fortify,
    End
};

const char* turnPhaseName(TurnPhase phase);

struct RejectedMove {
    int round = 0;
    int playerId = kNoPlayer;
    TurnPhase phase = TurnPhase::Setup;
    std::string reason;
};

constexpr int kMinPlayers = 2;
constexpr int kMaxPlayers = 6;

// Owns the roster, the map and the deck, and runs rounds of
// Draft -> Attack -> Fortify -> End for every live player in roster order.
// It is the only writer: policies see a GameView and propose moves, which are
// validated in full before anything is mutated.
class GameEngine {
public:
    GameEngine(GameContext& ctx, WorldMap world);
    GameEngine(const GameEngine&) = delete;
    GameEngine& operator=(const GameEngine&) = delete;

    // Roster order is insertion order. Returns the new player's id.
    int addPlayer(const std::string& name, std::unique_ptr<DecisionPolicy> policy);
    void addSeats(const std::vector<GameConfig::Seat>& seats);
    // Replaces the ctx-backed dice; the source must outlive the engine.
    void setDiceSource(DiceSource* dice);

    // Even random split of regions, random starting armies, fresh deck.
    // Throws ConfigurationError for a roster outside 2..6 players.
    void setup();
    // Same checks as setup() but keeps whatever ownership and garrisons the map
    // already has. For hosts that lay out a position themselves.
    void startFromCurrentPosition();

    // Plays one full round. Returns false once the game is over.
    bool playRound();
    // Plays rounds until someone wins or maxRounds have been played.
    int run(int maxRounds);
    void playTurn(int rosterIndex);

    void beginTurn(PlayerAccount& player);
    void draftPhase(PlayerAccount& player);
    void attackPhase(PlayerAccount& player);
    void fortifyPhase(PlayerAccount& player);
    void endTurn(PlayerAccount& player);

    bool validateDraft(const PlayerAccount& player, const DraftMove& move, std::string* reason) const;
    bool validateAttack(const PlayerAccount& player, const AttackMove& move, std::string* reason) const;
    bool validateFortify(const PlayerAccount& player, const FortifyMove& move, std::string* reason) const;
    bool validateTrade(const PlayerAccount& player,
                       const std::optional<CardSet>& set,
                       bool forced,
                       std::string* reason) const;

    // Bounds on the troops that follow a capture out of a region holding `garrison`.
    // Up to three available troops all move; otherwise at least three must.
    static int minCaptureMove(int garrison);
    static int maxCaptureMove(int garrison);

    // Unchecked primitive: subtract from `from`, add to `to`.
    void moveTroops(int from, int to, int amount);

    // Ownership/garrison/roster consistency between turns.
    bool checkInvariants(std::string* reason) const;

    const WorldMap& getWorld() const { return m_world; }
    WorldMap& getWorldMutable() { return m_world; }
    const std::vector<std::unique_ptr<PlayerAccount>>& getPlayers() const { return m_players; }
    const std::vector<std::unique_ptr<PlayerAccount>>& getEliminated() const { return m_eliminated; }
    PlayerAccount* findPlayer(int playerId);
    EventLog& getLog() { return m_log; }
    const EventLog& getLog() const { return m_log; }
    const Deck& getDeck() const { return m_deck; }
    Deck& getDeckMutable() { return m_deck; }
    const std::vector<RejectedMove>& getRejectedMoves() const { return m_rejected; }
    int getRound() const { return m_round; }
    int getActiveIndex() const { return m_activeIndex; }
    bool isStarted() const { return m_started; }
    bool isGameOver() const { return m_gameOver; }
    const PlayerAccount* getWinner() const;

private:
    void validateRoster() const;
    void assignStartingRegions();
    void assignStartingArmies();

    void placeReinforcements(PlayerAccount& player);
    bool offerTrade(PlayerAccount& player, bool forced);
    void forceTrades(PlayerAccount& player);
    void applyTrade(PlayerAccount& player, const CardSet& set);

    void resolveAttack(PlayerAccount& player, const AttackMove& move);
    void captureRegion(PlayerAccount& player, int from, int to, int previousOwner);
    void resolveCaptureMove(PlayerAccount& player, int from, int to);
    void eliminatePlayer(int playerId, PlayerAccount& eliminator);

    void rejectMove(const PlayerAccount& player, const std::string& reason);
    std::string regionLabel(int regionId) const;

    GameContext& m_ctx;
    WorldMap m_world;
    std::vector<std::unique_ptr<PlayerAccount>> m_players;
    std::vector<std::unique_ptr<PlayerAccount>> m_eliminated;
    Deck m_deck;
    EventLog m_log;
    std::mt19937_64 m_deckRng;
    RandomDice m_randomDice;
    DiceSource* m_dice;
    std::vector<RejectedMove> m_rejected;
    TurnPhase m_phase = TurnPhase::Setup;
    int m_nextPlayerId = 0;
    int m_round = 0;
    int m_activeIndex = 0;
    bool m_started = false;
    bool m_gameOver = false;
    bool m_cardEarned = false;
};
