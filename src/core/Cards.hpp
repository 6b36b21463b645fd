#ifndef KLONDIKE_CARDS_HPP
#define KLONDIKE_CARDS_HPP

#include <algorithm>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "Types.hpp"

namespace klondike::core
{
    auto to_string(Suit s) -> std::string_view;
    auto to_string(Rank r) -> std::string_view;
    auto to_string(Card const& c) -> std::string;

    // 52 cards, suit-major (Hearts, Spades, Diamonds, Clubs), Ace..King within a suit.
    auto OrderedDeck() -> std::vector<Card>;

    template <std::uniform_random_bit_generator G>
    auto ShuffledDeck(G& rng) -> std::vector<Card>
    {
        std::vector<Card> deck = OrderedDeck();
        std::ranges::shuffle(deck, rng);
        return deck;
    }
}

template <>
struct fmt::formatter<klondike::core::Card> : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(klondike::core::Card const& c, FormatContext& ctx) const
    {
        std::string const s = klondike::core::to_string(c);
        return fmt::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //KLONDIKE_CARDS_HPP
