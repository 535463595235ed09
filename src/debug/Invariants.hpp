//
// Invariants.hpp
//

#ifndef CARDARENA_INVARIANTS_HPP
#define CARDARENA_INVARIANTS_HPP

#include <string>
#include <vector>

#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace arena::core::debug
{
    // Cross-field checks on a published snapshot. Returns one line per broken rule,
    // empty when the snapshot is consistent.
    inline auto CheckInvariants(SessionSnapshot const& s) -> std::vector<std::string>
    {
        std::vector<std::string> broken;
#if ARN_ENABLE_TEST_HOOKS == false
        (void)s;
#else
        auto expect = [&](bool ok, char const* what)
        {
            if (!ok)
            {
                broken.emplace_back(what);
            }
        };

        // 1) Opponent stats never leak before the reveal
        if (s.opponent_card && !s.stats_revealed)
        {
            expect(s.opponent_card->effective_attack == 0 && s.opponent_card->effective_health == 0 &&
                   s.opponent_card->card.attack == 0 && s.opponent_card->card.health == 0,
                   "opponent stats visible before reveal");
        }

        // 2) Reveal flags are ordered
        expect(!s.stats_revealed || s.reveal_triggered, "stats revealed without reveal trigger");

        // 3) A result is shown exactly in Complete
        expect(s.result.has_value() == (s.phase == BattlePhase::Complete), "result visibility does not match phase");

        // 4) Ready button
        if (s.can_click_ready)
        {
            expect(s.phase == BattlePhase::CardSelection && s.local_card.has_value() && !s.local_ready,
                   "ready offered in wrong state");
        }
        expect(s.waiting_for_opponent_ready == (s.local_ready && !s.opponent_ready), "waiting flag mismatch");

        // 5) Bounded activity feed
        expect(s.activity.size() <= constants::MaxActivityMessages, "activity feed over capacity");

        // 6) Story cursor
        expect(s.story.empty() || s.story_index < s.story.size(), "story index out of range");

        // 7) Battle phases need a link
        bool const battle_phase = s.phase == BattlePhase::CardSelection || s.phase == BattlePhase::AwaitingBothReady ||
            s.phase == BattlePhase::RevealSequence || s.phase == BattlePhase::Resolving ||
            s.phase == BattlePhase::Complete;
        if (battle_phase)
        {
            expect(s.connection_phase == ConnectionPhase::Connected && s.connection.has_value(),
                   "battle phase without connection");
        }

        // 8) Result is self-consistent
        if (s.result)
        {
            BattleResult const& r = *s.result;
            expect(r.is_draw == (r.winner == Winner::Draw), "draw flag disagrees with winner");
            expect(r.local_final_health >= 0 && r.opponent_final_health >= 0, "negative final health");
            expect(r.rounds.size() <= 2 * constants::MaxExchanges, "too many rounds");
            TransferKind const want = r.winner == Winner::Local
                ? TransferKind::LocalAcquires
                : r.winner == Winner::Opponent ? TransferKind::OpponentAcquires : TransferKind::BothDestroyed;
            expect(r.transfer.kind == want, "transfer does not follow winner");
        }
#endif // ARN_ENABLE_TEST_HOOKS == true
        return broken;
    }
}

#endif //CARDARENA_INVARIANTS_HPP
