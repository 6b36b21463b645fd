#ifndef KLONDIKE_RECORDINGPLAYER_HPP
#define KLONDIKE_RECORDINGPLAYER_HPP

#include <memory>
#include <utility>

#include "../core/Player.hpp"

namespace klondike::core::debug
{
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto NextInput(std::shared_ptr<GameSnapshot const> s) -> Input override
        {
            last_input_ = inner_->NextInput(std::move(s));
            has_last_ = true;
            ++count_;
            return last_input_;
        }

        auto HasLast() const -> bool
        {
            return has_last_;
        }

        auto Last() const -> Input const&
        {
            return last_input_;
        }

        auto Count() const -> size_t
        {
            return count_;
        }

    private:
        std::unique_ptr<Player> inner_;
        Input last_input_{ClearSelectionInput{}}; // harmless default
        bool has_last_{false};
        size_t count_{};
    };

    inline auto WrapRecording(std::unique_ptr<Player> player) -> std::unique_ptr<Player>
    {
        return std::make_unique<RecordingPlayer>(std::move(player));
    }

    // Only valid for players built by WrapRecording
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }
} // namespace klondike::core::debug

#endif //KLONDIKE_RECORDINGPLAYER_HPP
