//
// BattleStateMachine.hpp
//

#ifndef CARDARENA_BATTLESTATEMACHINE_HPP
#define CARDARENA_BATTLESTATEMACHINE_HPP

#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "BattleResolver.hpp"
#include "Exception.hpp"
#include "Executor.hpp"
#include "Messages.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace arena::core::debug
{
    struct Inspector;
}

namespace arena::core
{
    using error::CommandResult;

    // Outbound effects. All of them are invoked on the owner's sequential context.
    struct BattleHooks
    {
        std::function<void(Message const&)> send;
        // start the binary transfer of the local card's art
        std::function<void(CardInfo const&)> send_image;
        std::function<void()> changed;
        std::function<void(BattlePhase, BattlePhase)> phase_changed;
        // selections were discarded (rematch, disconnect, stop)
        std::function<void()> session_reset;
    };

    // One battle session. Not thread-safe; see BattleManager.
    class BattleStateMachine
    {
    public:
        BattleStateMachine(Executor& exec, SessionConfig const& cfg, BattleHooks hooks);
        ~BattleStateMachine();

        BattleStateMachine(BattleStateMachine const&) = delete;
        auto operator=(BattleStateMachine const&) -> BattleStateMachine& = delete;

        // --- link lifecycle ---

        auto OnDiscoveryStarted() -> CommandResult;
        auto OnConnected(bool authoritative) -> CommandResult;
        auto OnConnectionLost() -> void;
        // stopAll: cancels everything, keeps nothing
        auto Stop() -> void;

        // --- user commands ---

        auto SelectCard(CardInfo const& card) -> CommandResult;
        auto SetReady() -> CommandResult;
        auto SkipAnimation() -> CommandResult;
        auto Rematch() -> CommandResult;

        // --- peer input ---

        auto OnMessage(Message const& msg) -> void;
        auto OnOpponentImageReady(CardId card, std::filesystem::path path) -> void;

        auto AddActivity(std::string text) -> void;

        // --- state ---

        [[nodiscard]] auto Phase() const noexcept -> BattlePhase { return phase_; }
        [[nodiscard]] auto Generation() const noexcept -> std::uint64_t { return generation_; }
        [[nodiscard]] auto SessionId() const noexcept -> std::string const& { return session_id_; }
        [[nodiscard]] auto IsAuthoritative() const noexcept -> bool { return authoritative_; }
        [[nodiscard]] auto LocalReady() const noexcept -> bool { return local_ready_; }
        [[nodiscard]] auto OpponentReady() const noexcept -> bool { return opponent_ready_; }
        [[nodiscard]] auto Result() const noexcept -> std::optional<BattleResult> const& { return result_; }

        // Copies the battle half of the observable state.
        auto Fill(SessionSnapshot& snap) const -> void;

    private:
        friend struct debug::Inspector;

        enum class RevealStep : std::uint8_t
        {
            Trigger,
            Disclose,
            Hold,
            Resolve
        };

        using Error = error::StateViolation;
        using Code = error::StateViolationCode;

        auto SetPhase(BattlePhase next) -> void;
        auto Changed() -> void;
        auto Violation(Code c) const -> std::unexpected<Error>;

        // Discards the session. Bumps the generation so stale timers see it.
        auto ResetSession(BattlePhase next) -> void;
        auto CancelTimers() -> void;

        auto ScheduleReveal(RevealStep step, std::chrono::milliseconds delay) -> void;
        auto RunRevealStep(RevealStep step) -> void;
        auto CheckBothReady() -> void;

        auto EnterResolving() -> void;
        auto TryAdoptRemoteStory() -> void;
        auto StartPlayback() -> void;
        auto ScheduleStoryStep() -> void;
        auto Complete() -> void;

        auto HandlePreview(CardPreviewMsg const& m) -> void;
        auto HandleStats(CardStatsMsg const& m) -> void;
        auto HandleReady() -> void;
        auto HandleSegment(StorySegmentMsg const& m) -> void;
        auto HandleOutcome(BattleOutcomeMsg const& m) -> void;
        auto HandleRematch() -> void;

        [[nodiscard]] auto Connected() const noexcept -> bool;

        static auto NewSessionId() -> std::string;

        Executor& exec_;
        SessionConfig cfg_;
        BattleHooks hooks_;

        BattlePhase phase_{BattlePhase::Idle};
        std::uint64_t generation_{};
        std::string session_id_;
        bool authoritative_{false};

        std::optional<BattleCard> local_card_{};
        std::optional<BattleCard> opponent_card_{};
        bool opponent_stats_known_{false};
        std::unordered_map<CardId, std::filesystem::path> opponent_images_;

        bool local_ready_{false};
        bool opponent_ready_{false};
        bool reveal_triggered_{false};
        bool stats_revealed_{false};

        std::vector<StorySegment> story_;
        std::size_t story_index_{};
        // known but not displayed until playback ends or is skipped
        std::optional<BattleResult> computed_result_{};
        std::optional<BattleResult> result_{};

        // non-authoritative side: replicated story, sender's sides already flipped
        std::map<std::uint32_t, StorySegment> remote_story_;
        std::optional<std::uint32_t> remote_total_{};
        std::optional<BattleResult> remote_result_{};

        std::optional<TimerId> reveal_timer_{};
        std::optional<TimerId> story_timer_{};

        std::deque<std::string> activity_;
    };
}

#endif //CARDARENA_BATTLESTATEMACHINE_HPP
