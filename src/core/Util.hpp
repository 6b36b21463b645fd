#ifndef KLONDIKE_UTIL_HPP
#define KLONDIKE_UTIL_HPP

#include <cstdint>
#include <utility>
#include "Types.hpp"

namespace klondike::core::util
{
    // 0..51, suit-major like OrderedDeck().
    inline auto CardToUID(Card const& c) -> uint64_t
    {
        return static_cast<uint64_t>(std::to_underlying(c.suit)) * constants::RanksPerSuit
             + static_cast<uint64_t>(std::to_underlying(c.rank)) - 1;
    }
    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(0), count_(0), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            uint64_t const card = uint64_t{1} << CardToUID(c);
            contains_dup_ |= static_cast<bool>(cards_ & card);
            cards_ |= card;
            ++count_;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
        [[nodiscard]]
        auto Count() const -> size_t
        {
            return count_;
        }
        // Every one of the 52 cards seen exactly once.
        [[nodiscard]]
        auto IsFullDeck() const -> bool
        {
            return !contains_dup_ && count_ == constants::DeckSize
                && cards_ == (uint64_t{1} << constants::DeckSize) - 1;
        }
    private:
        uint64_t cards_;
        size_t count_;
        bool contains_dup_;
    };
}

#endif //KLONDIKE_UTIL_HPP
