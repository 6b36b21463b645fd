#ifndef KLONDIKE_RANDOMAI_HPP
#define KLONDIKE_RANDOMAI_HPP

#include <random>

#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace klondike::core
{
    // Presses keys at random, leaning towards the ones that move cards.
    class RandomAI final : public klondike::core::Player
    {
    public:
        explicit RandomAI(uint64_t rng_seed);

        auto NextInput(std::shared_ptr<GameSnapshot const> snapshot) -> Input override;

    private:
        auto pick(std::discrete_distribution<size_t>& dist) -> size_t { return dist(rng_); }

        auto NavigateInput() -> Input;

    private:
        std::mt19937 rng_;
    };
}

#endif //KLONDIKE_RANDOMAI_HPP
