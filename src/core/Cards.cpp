#include "Cards.hpp"

#include <array>

namespace klondike::core
{
    auto to_string(Suit const s) -> std::string_view
    {
        switch (s)
        {
        case Suit::Hearts:   return "♥";
        case Suit::Spades:   return "♠";
        case Suit::Diamonds: return "♦";
        case Suit::Clubs:    return "♣";
        }
        return "?";
    }

    auto to_string(Rank const r) -> std::string_view
    {
        static constexpr std::array<std::string_view, constants::RanksPerSuit> map{
            "A","2","3","4","5","6","7","8","9","10","J","Q","K"
        };
        return map[static_cast<size_t>(std::to_underlying(r)) - 1];
    }

    auto to_string(Card const& c) -> std::string
    {
        return fmt::format("{}{}", to_string(c.rank), to_string(c.suit));
    }

    auto OrderedDeck() -> std::vector<Card>
    {
        std::vector<Card> deck;
        deck.reserve(constants::DeckSize);
        for (Suit const suit : AllSuits)
        {
            for (size_t r{1}; r <= constants::RanksPerSuit; ++r)
            {
                deck.push_back(Card{suit, static_cast<Rank>(r)});
            }
        }
        return deck;
    }
}
