#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <random>
#include <vector>

class PlayerAccount;
class WorldMap;

enum class CardType {
    Infantry,
    Cavalry,
    Artillery,
    Wild
};

const char* cardTypeName(CardType type);

struct Card {
    CardType type = CardType::Infantry;
    int regionId = -1; // -1 for wild cards
};

// Indices into a hand, in the order the cards were selected.
using CardSet = std::array<int, 3>;

constexpr int kForcedTradeHandSize = 5;
constexpr int kTradeRegionBonus = 2;
constexpr int kWildCardsPerReshuffle = 2;

// Bonus troops for three cards: 4/6/8 for three Infantry/Cavalry/Artillery,
// 10 for one of each. Wilds take whichever role pays most. 0 if the cards are no set.
int cardSetValue(CardType a, CardType b, CardType c);
int cardSetValue(const std::vector<Card>& hand, const CardSet& set);
bool isValidCardSet(const std::vector<Card>& hand, const CardSet& set);

// Highest-paying set in the hand. Subsets are enumerated in lexicographic index
// order and a later subset replaces the current best only when it pays strictly more.
std::optional<CardSet> findBestTradeableSet(const std::vector<Card>& hand);
bool hasAnyValidSet(const std::vector<Card>& hand);

class Deck {
public:
    // One card per region, type uniform over the three regular types, then shuffled.
    void buildForRegions(const std::vector<int>& regionIds, std::mt19937_64& rng);
    // Reshuffles first when the deck is empty.
    Card draw(std::mt19937_64& rng);
    void discard(const Card& card);
    // Discard pile plus two wilds go back into the deck; the discard pile is emptied.
    void reshuffle(std::mt19937_64& rng);

    std::size_t size() const { return m_cards.size(); }
    bool empty() const { return m_cards.empty(); }
    const std::vector<Card>& getCards() const { return m_cards; }
    const std::vector<Card>& getDiscardPile() const { return m_discard; }

private:
    std::vector<Card> m_cards;
    std::vector<Card> m_discard;
};

struct TradeResult {
    int bonus = 0;
    int bonusRegion = -1; // region that received the +2, or -1
};

// Removes the set from the player's hand into the discard pile, adds the table bonus
// to the player's allowance and puts +2 troops on the first selected card's region
// that the player owns. Throws CardSetError if the cards are not a set.
TradeResult applyTradeIn(PlayerAccount& player, const CardSet& set, WorldMap& world, Deck& deck);
