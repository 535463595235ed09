//
// Inspector.hpp
//

#ifndef CARDARENA_INSPECTOR_HPP
#define CARDARENA_INSPECTOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../core/BattleManager.hpp"
#include "../core/BattleStateMachine.hpp"
#include "../core/Types.hpp"

namespace arena::core::debug
{
    // Read-only access to private state for tests and invariant checks.
    struct Inspector
    {
        struct BattleInternals
        {
            BattlePhase phase{};
            std::uint64_t generation{};
            bool authoritative{false};
            bool opponent_stats_known{false};
            std::optional<BattleCard> local_card;
            std::optional<BattleCard> opponent_card;
            std::size_t story_size{};
            std::size_t story_index{};
            bool has_computed_result{false};
            bool has_result{false};
            std::size_t remote_segments{};
            std::optional<std::uint32_t> remote_total;
            bool reveal_timer_armed{false};
            bool story_timer_armed{false};
            std::size_t activity_size{};
            std::size_t opponent_images{};
        };

        static inline auto Gather(BattleStateMachine const& b) -> BattleInternals
        {
            BattleInternals ret{};
            ret.phase = b.phase_;
            ret.generation = b.generation_;
            ret.authoritative = b.authoritative_;
            ret.opponent_stats_known = b.opponent_stats_known_;
            ret.local_card = b.local_card_;
            ret.opponent_card = b.opponent_card_;
            ret.story_size = b.story_.size();
            ret.story_index = b.story_index_;
            ret.has_computed_result = b.computed_result_.has_value();
            ret.has_result = b.result_.has_value();
            ret.remote_segments = b.remote_story_.size();
            ret.remote_total = b.remote_total_;
            ret.reveal_timer_armed = b.reveal_timer_.has_value();
            ret.story_timer_armed = b.story_timer_.has_value();
            ret.activity_size = b.activity_.size();
            ret.opponent_images = b.opponent_images_.size();
            return ret;
        }

        struct ManagerInternals
        {
            BattleInternals battle;
            ConnectionPhase connection_phase{};
            std::size_t connection_count{};
            std::size_t history_size{};
            std::size_t pending_payloads{};
            std::uint64_t next_msg_id{};
            std::uint64_t last_inbound_id{};
            std::optional<std::string> transport_error;
        };

        // Only call while the manager's executor is idle.
        static inline auto Gather(BattleManager const& m) -> ManagerInternals
        {
            ManagerInternals ret{};
            ret.battle = Gather(m.battle_);
            ret.connection_phase = m.coordinator_.Phase();
            ret.connection_count = m.coordinator_.ConnectionCount();
            ret.history_size = m.coordinator_.History().size();
            ret.pending_payloads = m.payloads_.PendingCount();
            ret.next_msg_id = m.next_msg_id_;
            ret.last_inbound_id = m.last_inbound_id_;
            ret.transport_error = m.transport_error_;
            return ret;
        }
    };
}

#endif //CARDARENA_INSPECTOR_HPP
