#ifndef KLONDIKE_PLAYER_HPP
#define KLONDIKE_PLAYER_HPP

#include <memory>

#include "Actions.hpp"
#include "State.hpp"

namespace klondike::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called once per turn by whatever drives the game (AI, replay, terminal adapter).
        virtual auto NextInput(std::shared_ptr<GameSnapshot const> snapshot) -> Input = 0;
    };
}
#endif //KLONDIKE_PLAYER_HPP
