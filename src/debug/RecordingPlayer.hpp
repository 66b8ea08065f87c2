#ifndef TRESSETTE_RECORDINGPLAYER_HPP
#define TRESSETTE_RECORDINGPLAYER_HPP

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "../core/Player.hpp"

namespace tressette::core::debug
{
    // Remembers every card the wrapped player chose, accepted or not.
    class RecordingPlayer final : public Player
    {
    public:
        explicit RecordingPlayer(std::unique_ptr<Player> inner)
            : inner_{std::move(inner)}
        {
        }

        auto Play(std::shared_ptr<const SeatSnapshot> s) -> Card override
        {
            Card const c = inner_->Play(std::move(s));
            choices_.push_back(c);
            return c;
        }

        auto HasLast() const -> bool
        {
            return !choices_.empty();
        }

        auto Last() const -> std::optional<Card>
        {
            if (choices_.empty()) return std::nullopt;
            return choices_.back();
        }

        auto Choices() const -> std::vector<Card> const&
        {
            return choices_;
        }

    private:
        std::unique_ptr<Player> inner_;
        std::vector<Card> choices_;
    };

    // Helper to wrap a vector<unique_ptr<Player>>
    inline auto WrapRecording(std::vector<std::unique_ptr<Player>>& players)
        -> std::vector<std::unique_ptr<Player>>
    {
        std::vector<std::unique_ptr<Player>> out;
        out.reserve(players.size());

        for (auto& p : players)
        {
            out.emplace_back(std::make_unique<RecordingPlayer>(std::move(p)));
        }

        return out;
    }

    // Downcast helper (only safe if you used WrapRecording at construction)
    inline auto AsRecording(Player* p) -> RecordingPlayer*
    {
        return dynamic_cast<RecordingPlayer*>(p);
    }
} // namespace tressette::core::debug

#endif //TRESSETTE_RECORDINGPLAYER_HPP
