#include "cards.h"

#include <algorithm>
#include <functional>
#include <sstream>

#include "game_errors.h"
#include "player.h"
#include "world_map.h"

namespace {

int threeOfAKindValue(CardType type) {
    switch (type) {
    case CardType::Infantry:
        return 4;
    case CardType::Cavalry:
        return 6;
    case CardType::Artillery:
        return 8;
    case CardType::Wild:
        break;
    }
    return 0;
}

constexpr int kOneOfEachValue = 10;

bool setIndicesInRange(const std::vector<Card>& hand, const CardSet& set) {
    const int n = static_cast<int>(hand.size());
    for (int idx : set) {
        if (idx < 0 || idx >= n) {
            return false;
        }
    }
    return set[0] != set[1] && set[0] != set[2] && set[1] != set[2];
}

} // namespace

const char* cardTypeName(CardType type) {
    switch (type) {
    case CardType::Infantry:
        return "Infantry";
    case CardType::Cavalry:
        return "Cavalry";
    case CardType::Artillery:
        return "Artillery";
    case CardType::Wild:
        return "Wild";
    }
    return "?";
}

int cardSetValue(CardType a, CardType b, CardType c) {
    const std::array<CardType, 3> types{{a, b, c}};
    std::array<int, 3> counts{{0, 0, 0}};
    int wilds = 0;
    for (CardType t : types) {
        if (t == CardType::Wild) {
            ++wilds;
        } else {
            ++counts[static_cast<int>(t)];
        }
    }

    int best = 0;
    // One of each: no regular type may repeat.
    if (counts[0] <= 1 && counts[1] <= 1 && counts[2] <= 1) {
        best = kOneOfEachValue;
    }
    // Three of a kind: every regular card shares one type.
    for (int t = 0; t < 3; ++t) {
        if (counts[t] + wilds == 3) {
            best = std::max(best, threeOfAKindValue(static_cast<CardType>(t)));
        }
    }
    return best;
}

int cardSetValue(const std::vector<Card>& hand, const CardSet& set) {
    if (!setIndicesInRange(hand, set)) {
        return 0;
    }
    return cardSetValue(hand[set[0]].type, hand[set[1]].type, hand[set[2]].type);
}

bool isValidCardSet(const std::vector<Card>& hand, const CardSet& set) {
    return cardSetValue(hand, set) > 0;
}

std::optional<CardSet> findBestTradeableSet(const std::vector<Card>& hand) {
    std::optional<CardSet> best;
    int bestValue = 0;
    const int n = static_cast<int>(hand.size());
    for (int i = 0; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            for (int k = j + 1; k < n; ++k) {
                const int value = cardSetValue(hand[i].type, hand[j].type, hand[k].type);
                if (value > bestValue) {
                    bestValue = value;
                    best = CardSet{{i, j, k}};
                }
            }
        }
    }
    return best;
}

bool hasAnyValidSet(const std::vector<Card>& hand) {
    if (static_cast<int>(hand.size()) >= kForcedTradeHandSize) {
        return true;
    }
    return findBestTradeableSet(hand).has_value();
}

void Deck::buildForRegions(const std::vector<int>& regionIds, std::mt19937_64& rng) {
    m_cards.clear();
    m_discard.clear();
    std::uniform_int_distribution<int> typeDist(0, 2);
    for (int regionId : regionIds) {
        m_cards.push_back(Card{static_cast<CardType>(typeDist(rng)), regionId});
    }
    std::shuffle(m_cards.begin(), m_cards.end(), rng);
}

Card Deck::draw(std::mt19937_64& rng) {
    if (m_cards.empty()) {
        reshuffle(rng);
    }
    Card card = m_cards.back();
    m_cards.pop_back();
    return card;
}

void Deck::discard(const Card& card) {
    m_discard.push_back(card);
}

void Deck::reshuffle(std::mt19937_64& rng) {
    m_cards.insert(m_cards.end(), m_discard.begin(), m_discard.end());
    m_discard.clear();
    for (int i = 0; i < kWildCardsPerReshuffle; ++i) {
        m_cards.push_back(Card{CardType::Wild, -1});
    }
    std::shuffle(m_cards.begin(), m_cards.end(), rng);
}

TradeResult applyTradeIn(PlayerAccount& player, const CardSet& set, WorldMap& world, Deck& deck) {
    std::vector<Card>& hand = player.getHandMutable();
    const int value = cardSetValue(hand, set);
    if (value <= 0) {
        std::ostringstream oss;
        oss << "applyTradeIn: cards [" << set[0] << ", " << set[1] << ", " << set[2]
            << "] from " << player.getName() << "'s hand of " << hand.size() << " are not a tradeable set";
        throw CardSetError(oss.str());
    }

    TradeResult result;
    result.bonus = value;
    for (int idx : set) {
        const int regionId = hand[idx].regionId;
        if (world.isValidRegion(regionId) && world.getOwner(regionId) == player.getId()) {
            result.bonusRegion = regionId;
            break;
        }
    }

    std::array<int, 3> order = set;
    std::sort(order.begin(), order.end(), std::greater<int>());
    for (int idx : order) {
        deck.discard(hand[idx]);
        hand.erase(hand.begin() + idx);
    }

    if (result.bonusRegion >= 0) {
        world.addGarrison(result.bonusRegion, kTradeRegionBonus);
    }
    player.addAllowance(result.bonus);
    return result;
}
