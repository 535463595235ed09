//
// BattleStateMachine.cpp
//

#include "BattleStateMachine.hpp"

#include <format>
#include <random>
#include <type_traits>
#include <utility>
#include <variant>

namespace arena::core
{
    BattleStateMachine::BattleStateMachine(Executor& exec, SessionConfig const& cfg, BattleHooks hooks)
        : exec_{exec}
          , cfg_{cfg}
          , hooks_{std::move(hooks)}
          , session_id_{NewSessionId()}
    {
    }

    BattleStateMachine::~BattleStateMachine()
    {
        CancelTimers();
    }

    auto BattleStateMachine::NewSessionId() -> std::string
    {
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        return std::format("{:016x}", rng());
    }

    auto BattleStateMachine::Connected() const noexcept -> bool
    {
        switch (phase_)
        {
        case BattlePhase::CardSelection:
        case BattlePhase::AwaitingBothReady:
        case BattlePhase::RevealSequence:
        case BattlePhase::Resolving:
        case BattlePhase::Complete:
            return true;
        case BattlePhase::Idle:
        case BattlePhase::WaitingForOpponent:
        case BattlePhase::Disconnected:
            return false;
        }
        return false;
    }

    auto BattleStateMachine::Changed() -> void
    {
        if (hooks_.changed)
        {
            hooks_.changed();
        }
    }

    auto BattleStateMachine::SetPhase(BattlePhase next) -> void
    {
        if (next == phase_)
        {
            return;
        }
        BattlePhase const prev = phase_;
        phase_ = next;
        ARN_LOG_DEBUG("Battle", "{} -> {}", ToString(prev), ToString(next));
        if (hooks_.phase_changed)
        {
            hooks_.phase_changed(prev, next);
        }
        Changed();
    }

    auto BattleStateMachine::Violation(Code c) const -> std::unexpected<Error>
    {
        return std::unexpected(Error{c}.with_phase(phase_));
    }

    auto BattleStateMachine::AddActivity(std::string text) -> void
    {
        activity_.push_front(std::move(text));
        while (activity_.size() > constants::MaxActivityMessages)
        {
            activity_.pop_back();
        }
        Changed();
    }

    auto BattleStateMachine::CancelTimers() -> void
    {
        if (reveal_timer_)
        {
            exec_.Cancel(*reveal_timer_);
            reveal_timer_.reset();
        }
        if (story_timer_)
        {
            exec_.Cancel(*story_timer_);
            story_timer_.reset();
        }
    }

    auto BattleStateMachine::ResetSession(BattlePhase next) -> void
    {
        CancelTimers();
        ++generation_;
        session_id_ = NewSessionId();

        local_card_.reset();
        opponent_card_.reset();
        opponent_stats_known_ = false;
        opponent_images_.clear();

        local_ready_ = false;
        opponent_ready_ = false;
        reveal_triggered_ = false;
        stats_revealed_ = false;

        story_.clear();
        story_index_ = 0;
        computed_result_.reset();
        result_.reset();

        remote_story_.clear();
        remote_total_.reset();
        remote_result_.reset();

        if (hooks_.session_reset)
        {
            hooks_.session_reset();
        }
        SetPhase(next);
        Changed();
    }

    // ---------- link lifecycle ----------

    auto BattleStateMachine::OnDiscoveryStarted() -> CommandResult
    {
        if (Connected())
        {
            return Violation(Code::WrongPhase);
        }
        authoritative_ = false;
        ResetSession(BattlePhase::WaitingForOpponent);
        AddActivity("Searching for opponents...");
        return {};
    }

    auto BattleStateMachine::OnConnected(bool authoritative) -> CommandResult
    {
        if (phase_ != BattlePhase::WaitingForOpponent)
        {
            return Violation(Code::WrongPhase);
        }
        authoritative_ = authoritative;
        SetPhase(BattlePhase::CardSelection);
        AddActivity("Connected! Choose your card.");
        return {};
    }

    auto BattleStateMachine::OnConnectionLost() -> void
    {
        if (phase_ == BattlePhase::Idle || phase_ == BattlePhase::Disconnected)
        {
            return;
        }
        authoritative_ = false;
        ResetSession(BattlePhase::Disconnected);
        AddActivity("Opponent disconnected");
    }

    auto BattleStateMachine::Stop() -> void
    {
        bool const settled = phase_ == BattlePhase::Idle || phase_ == BattlePhase::Disconnected;
        if (settled && !reveal_timer_ && !story_timer_)
        {
            return;
        }
        BattlePhase const next = Connected() ? BattlePhase::Disconnected : BattlePhase::Idle;
        authoritative_ = false;
        ResetSession(next);
    }

    // ---------- user commands ----------

    auto BattleStateMachine::SelectCard(CardInfo const& card) -> CommandResult
    {
        if (phase_ != BattlePhase::CardSelection)
        {
            return Violation(Code::WrongPhase);
        }
        if (local_ready_)
        {
            return Violation(Code::AlreadyReady);
        }

        local_card_ = BattleCard::FromCard(card, Side::Local);

        hooks_.send(CardPreviewMsg{card.id, card.name, card.rarity, card.image_path.has_value()});
        if (card.image_path && hooks_.send_image)
        {
            hooks_.send_image(card);
        }

        AddActivity(std::format("Selected {}", card.name));
        Changed();
        return {};
    }

    auto BattleStateMachine::SetReady() -> CommandResult
    {
        if (phase_ != BattlePhase::CardSelection)
        {
            return Violation(Code::WrongPhase);
        }
        if (!local_card_)
        {
            return Violation(Code::NoLocalCard);
        }
        if (local_ready_)
        {
            return Violation(Code::AlreadyReady);
        }

        local_ready_ = true;

        CardInfo const& c = local_card_->card;
        hooks_.send(CardStatsMsg{
            c.id, c.name, c.rarity, c.attack, c.health,
            local_card_->effective_attack, local_card_->effective_health
        });
        hooks_.send(ReadyMsg{});

        AddActivity("You are ready!");
        CheckBothReady();
        Changed();
        return {};
    }

    auto BattleStateMachine::SkipAnimation() -> CommandResult
    {
        if (phase_ != BattlePhase::Resolving)
        {
            return Violation(Code::WrongPhase);
        }
        if (!computed_result_ || story_.empty())
        {
            return Violation(Code::ResultUnknown);
        }

        if (story_timer_)
        {
            exec_.Cancel(*story_timer_);
            story_timer_.reset();
        }
        story_index_ = story_.size() - 1;
        Complete();
        return {};
    }

    auto BattleStateMachine::Rematch() -> CommandResult
    {
        if (phase_ != BattlePhase::Complete)
        {
            return Violation(Code::WrongPhase);
        }
        hooks_.send(RematchMsg{});
        ResetSession(BattlePhase::CardSelection);
        AddActivity("Rematch! Choose your card.");
        return {};
    }

    // ---------- reveal sequence ----------

    auto BattleStateMachine::CheckBothReady() -> void
    {
        if (!local_ready_ || !opponent_ready_)
        {
            return;
        }

        if (phase_ == BattlePhase::CardSelection)
        {
            SetPhase(BattlePhase::AwaitingBothReady);
        }

        // the reveal needs the opponent's stats; they precede Ready on the wire
        if (phase_ == BattlePhase::AwaitingBothReady && opponent_stats_known_ && !reveal_timer_)
        {
            SetPhase(BattlePhase::RevealSequence);
            AddActivity("Both players ready! Revealing cards...");
            ScheduleReveal(RevealStep::Trigger, cfg_.reveal_pause);
        }
    }

    auto BattleStateMachine::ScheduleReveal(RevealStep step, std::chrono::milliseconds delay) -> void
    {
        std::uint64_t const gen = generation_;
        reveal_timer_ = exec_.PostAfter(delay, [this, gen, step]
        {
            // checked at every step, not only when the chain starts
            if (gen != generation_ || phase_ != BattlePhase::RevealSequence)
            {
                ARN_LOG_DEBUG("Battle", "dropping stale reveal step (gen {} vs {})", gen, generation_);
                return;
            }
            reveal_timer_.reset();
            RunRevealStep(step);
        });
    }

    auto BattleStateMachine::RunRevealStep(RevealStep step) -> void
    {
        switch (step)
        {
        case RevealStep::Trigger:
            reveal_triggered_ = true;
            Changed();
            ScheduleReveal(RevealStep::Disclose, cfg_.blur_duration);
            return;
        case RevealStep::Disclose:
            stats_revealed_ = true;
            Changed();
            ScheduleReveal(RevealStep::Hold, cfg_.stat_hold);
            return;
        case RevealStep::Hold:
            ScheduleReveal(RevealStep::Resolve, cfg_.pre_battle_pause);
            return;
        case RevealStep::Resolve:
            EnterResolving();
            return;
        }
    }

    // ---------- resolution ----------

    auto BattleStateMachine::EnterResolving() -> void
    {
        SetPhase(BattlePhase::Resolving);

        if (!authoritative_)
        {
            AddActivity("Battle in progress...");
            TryAdoptRemoteStory();
            return;
        }

        ARN_ASSERT(local_card_.has_value() && opponent_card_.has_value(), "resolving without both cards");

        Resolution res = BattleResolver::Resolve(*local_card_, *opponent_card_);

        auto const total = static_cast<std::uint32_t>(res.segments.size());
        for (std::uint32_t i = 0; i < total; ++i)
        {
            StorySegment const& s = res.segments[i];
            hooks_.send(StorySegmentMsg{i, total, s.actor, s.text, s.damage});
        }
        hooks_.send(BattleOutcomeMsg{
            res.result.winner, res.result.local_final_health, res.result.opponent_final_health, res.result.rounds
        });

        story_ = std::move(res.segments);
        computed_result_ = std::move(res.result);
        AddActivity("Battle in progress...");
        StartPlayback();
    }

    auto BattleStateMachine::TryAdoptRemoteStory() -> void
    {
        if (phase_ != BattlePhase::Resolving || authoritative_ || computed_result_)
        {
            return;
        }
        if (!remote_total_ || !remote_result_ || remote_story_.size() < *remote_total_)
        {
            return;
        }

        story_.clear();
        story_.reserve(remote_story_.size());
        for (auto& [idx, seg] : remote_story_)
        {
            story_.push_back(seg);
        }
        computed_result_ = *remote_result_;
        remote_story_.clear();
        StartPlayback();
    }

    auto BattleStateMachine::StartPlayback() -> void
    {
        story_index_ = 0;
        Changed();
        if (story_.size() <= 1)
        {
            Complete();
            return;
        }
        ScheduleStoryStep();
    }

    auto BattleStateMachine::ScheduleStoryStep() -> void
    {
        std::uint64_t const gen = generation_;
        story_timer_ = exec_.PostAfter(cfg_.story_step, [this, gen]
        {
            if (gen != generation_ || phase_ != BattlePhase::Resolving)
            {
                return;
            }
            story_timer_.reset();
            ++story_index_;
            Changed();
            if (story_index_ + 1 >= story_.size())
            {
                Complete();
                return;
            }
            ScheduleStoryStep();
        });
    }

    auto BattleStateMachine::Complete() -> void
    {
        result_ = computed_result_;
        SetPhase(BattlePhase::Complete);

        if (result_)
        {
            switch (result_->winner)
            {
            case Winner::Local: AddActivity("Victory! You win the opponent's card!"); break;
            case Winner::Opponent: AddActivity("Defeat! Your card was taken."); break;
            case Winner::Draw: AddActivity("Draw! Both cards were destroyed."); break;
            }
        }
    }

    // ---------- peer messages ----------

    auto BattleStateMachine::OnMessage(Message const& msg) -> void
    {
        if (!Connected())
        {
            ARN_LOG_DEBUG("Battle", "dropping {} in {}", MessageName(msg), ToString(phase_));
            return;
        }

        std::visit(
            [&]<typename T0>(T0 const& m)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, CardPreviewMsg>) HandlePreview(m);
                else if constexpr (std::is_same_v<T, CardStatsMsg>) HandleStats(m);
                else if constexpr (std::is_same_v<T, ReadyMsg>) HandleReady();
                else if constexpr (std::is_same_v<T, StorySegmentMsg>) HandleSegment(m);
                else if constexpr (std::is_same_v<T, BattleOutcomeMsg>) HandleOutcome(m);
                else if constexpr (std::is_same_v<T, RematchMsg>) HandleRematch();
                else if constexpr (std::is_same_v<T, UnknownMsg>)
                    ARN_LOG_DEBUG("Battle", "ignoring unknown message tag {}", static_cast<int>(m.type_tag));
                // ImageTransferMeta and Disconnect are consumed by the manager
            },
            msg
        );
    }

    auto BattleStateMachine::HandlePreview(CardPreviewMsg const& m) -> void
    {
        if (phase_ != BattlePhase::CardSelection || opponent_ready_)
        {
            ARN_LOG_WARN("Battle", "card preview ignored in {}", ToString(phase_));
            return;
        }

        CardInfo info{};
        info.id = m.card_id;
        info.name = m.name;
        info.rarity = m.rarity;

        BattleCard bc{};
        bc.card = std::move(info);
        bc.owner = Side::Opponent;
        if (auto it = opponent_images_.find(m.card_id); it != opponent_images_.end())
        {
            bc.image = it->second;
        }
        opponent_card_ = std::move(bc);
        opponent_stats_known_ = false;

        AddActivity(std::format("Opponent selected {}", m.name));
    }

    auto BattleStateMachine::HandleStats(CardStatsMsg const& m) -> void
    {
        if (phase_ != BattlePhase::CardSelection && phase_ != BattlePhase::AwaitingBothReady)
        {
            ARN_LOG_WARN("Battle", "card stats ignored in {}", ToString(phase_));
            return;
        }

        auto const in_range = [](std::int32_t v) { return v >= 0 && v <= constants::MaxCardStat; };
        if (!in_range(m.attack) || !in_range(m.health) || !in_range(m.effective_attack)
            || !in_range(m.effective_health))
        {
            ARN_LOG_WARN("Battle", "card stats for {} out of range (atk {} hp {} eff {}/{}); dropped",
                         m.card_id, m.attack, m.health, m.effective_attack, m.effective_health);
            return;
        }

        if (!opponent_card_ || opponent_card_->card.id != m.card_id)
        {
            opponent_card_ = BattleCard{};
            opponent_card_->owner = Side::Opponent;
            if (auto it = opponent_images_.find(m.card_id); it != opponent_images_.end())
            {
                opponent_card_->image = it->second;
            }
        }

        BattleCard& bc = *opponent_card_;
        bc.card.id = m.card_id;
        bc.card.name = m.name;
        bc.card.rarity = m.rarity;
        bc.card.attack = m.attack;
        bc.card.health = m.health;
        bc.effective_attack = m.effective_attack;
        bc.effective_health = m.effective_health;
        bc.current_health = m.effective_health;
        opponent_stats_known_ = true;

        Changed();
        CheckBothReady();
    }

    auto BattleStateMachine::HandleReady() -> void
    {
        if (phase_ != BattlePhase::CardSelection)
        {
            ARN_LOG_WARN("Battle", "ready ignored in {}", ToString(phase_));
            return;
        }
        if (opponent_ready_)
        {
            return;
        }
        opponent_ready_ = true;
        AddActivity("Opponent is ready!");
        CheckBothReady();
    }

    auto BattleStateMachine::HandleSegment(StorySegmentMsg const& m) -> void
    {
        if (authoritative_)
        {
            ARN_LOG_WARN("Battle", "authoritative peer received a story segment; ignored");
            return;
        }
        if (computed_result_ || phase_ == BattlePhase::CardSelection || phase_ == BattlePhase::Complete)
        {
            ARN_LOG_WARN("Battle", "story segment {} ignored in {}", m.index, ToString(phase_));
            return;
        }
        if (m.total == 0 || m.index >= m.total)
        {
            ARN_LOG_WARN("Battle", "story segment {}/{} out of range", m.index, m.total);
            return;
        }

        remote_total_ = m.total;
        // sender's Local is our Opponent
        remote_story_.insert_or_assign(m.index, StorySegment{Flip(m.actor), m.text, m.damage});
        TryAdoptRemoteStory();
    }

    auto BattleStateMachine::HandleOutcome(BattleOutcomeMsg const& m) -> void
    {
        if (authoritative_ || computed_result_)
        {
            ARN_LOG_WARN("Battle", "battle outcome ignored");
            return;
        }
        if (phase_ == BattlePhase::CardSelection || phase_ == BattlePhase::Complete)
        {
            ARN_LOG_WARN("Battle", "battle outcome ignored in {}", ToString(phase_));
            return;
        }

        // rebuild in the sender's terms, then flip once
        BattleResult theirs{};
        theirs.winner = m.winner;
        theirs.is_draw = m.winner == Winner::Draw;
        theirs.rounds = m.rounds;
        theirs.local_final_health = m.local_final_health;
        theirs.opponent_final_health = m.opponent_final_health;
        theirs.transfer.local_card = opponent_card_ ? opponent_card_->card.id : CardId{};
        theirs.transfer.opponent_card = local_card_ ? local_card_->card.id : CardId{};
        switch (m.winner)
        {
        case Winner::Local: theirs.transfer.kind = TransferKind::LocalAcquires; break;
        case Winner::Opponent: theirs.transfer.kind = TransferKind::OpponentAcquires; break;
        case Winner::Draw: theirs.transfer.kind = TransferKind::BothDestroyed; break;
        }

        remote_result_ = FlipPerspective(theirs);
        TryAdoptRemoteStory();
    }

    auto BattleStateMachine::HandleRematch() -> void
    {
        if (phase_ == BattlePhase::CardSelection)
        {
            return;
        }
        ARN_LOG_INFO("Battle", "opponent requested a rematch");
        ResetSession(BattlePhase::CardSelection);
        AddActivity("Opponent wants a rematch! Choose your card.");
    }

    auto BattleStateMachine::OnOpponentImageReady(CardId card, std::filesystem::path path) -> void
    {
        if (!Connected())
        {
            return;
        }
        if (opponent_card_ && opponent_card_->card.id == card)
        {
            opponent_card_->image = path;
        }
        opponent_images_.insert_or_assign(card, std::move(path));
        Changed();
    }

    // ---------- snapshot ----------

    auto BattleStateMachine::Fill(SessionSnapshot& snap) const -> void
    {
        snap.session_id = session_id_;
        snap.phase = phase_;
        snap.local_card = local_card_;
        snap.opponent_card = opponent_card_;
        if (snap.opponent_card && !stats_revealed_)
        {
            // hidden until the reveal
            snap.opponent_card->card.attack = 0;
            snap.opponent_card->card.health = 0;
            snap.opponent_card->effective_attack = 0;
            snap.opponent_card->effective_health = 0;
            snap.opponent_card->current_health = 0;
        }
        snap.local_ready = local_ready_;
        snap.opponent_ready = opponent_ready_;
        snap.can_click_ready = phase_ == BattlePhase::CardSelection && local_card_.has_value() && !local_ready_;
        snap.waiting_for_opponent_ready = local_ready_ && !opponent_ready_;
        snap.reveal_triggered = reveal_triggered_;
        snap.stats_revealed = stats_revealed_;
        snap.story = story_;
        snap.story_index = story_index_;
        snap.result = result_;
        snap.activity.assign(activity_.begin(), activity_.end());
    }
}
