//
// State.hpp
//

#ifndef CARDARENA_STATE_HPP
#define CARDARENA_STATE_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Types.hpp"

namespace arena::core
{
    enum class BattlePhase : std::uint8_t
    {
        Idle,
        WaitingForOpponent,
        CardSelection,
        AwaitingBothReady,
        RevealSequence,
        Resolving,
        Complete,
        Disconnected
    };

    enum class ConnectionPhase : std::uint8_t
    {
        Idle,
        AutoDiscovering,
        Connecting,
        Connected,
        Disconnected
    };

    enum class LinkStatus : std::uint8_t
    {
        Connecting,
        Connected,
        Disconnected
    };

    struct PeerEndpoint
    {
        EndpointId id;
        std::string name;
        std::chrono::system_clock::time_point discovered_at{};

        auto operator==(PeerEndpoint const&) const -> bool = default;
    };

    struct Connection
    {
        EndpointId peer_id;
        std::string peer_name;
        std::chrono::system_clock::time_point established_at{};
        LinkStatus status{LinkStatus::Connecting};
        // true when this device accepted the incoming request; fixed for the connection
        bool authoritative{false};
        std::uint32_t number{1};
        std::optional<EndpointId> previous_peer_id{};

        [[nodiscard]]
        auto IsReconnection() const -> bool
        {
            return previous_peer_id.has_value() && *previous_peer_id != peer_id;
        }
    };

    // Immutable view handed to observers (UI, CLI, tests).
    struct SessionSnapshot
    {
        std::string session_id;
        std::uint64_t version{};

        ConnectionPhase connection_phase{ConnectionPhase::Idle};
        std::vector<PeerEndpoint> endpoints;
        std::optional<Connection> connection{};
        // last transport refusal or link loss, for display
        std::optional<std::string> transport_error{};

        BattlePhase phase{BattlePhase::Idle};
        std::optional<BattleCard> local_card{};
        // stats stay zero until stats_revealed
        std::optional<BattleCard> opponent_card{};
        bool local_ready{false};
        bool opponent_ready{false};
        bool can_click_ready{false};
        bool waiting_for_opponent_ready{false};

        bool reveal_triggered{false};
        bool stats_revealed{false};

        std::vector<StorySegment> story;
        std::size_t story_index{};
        std::optional<BattleResult> result{};

        // newest first
        std::vector<std::string> activity;
    };

    inline auto ToString(BattlePhase p) -> std::string_view
    {
        switch (p)
        {
        case BattlePhase::Idle: return "Idle";
        case BattlePhase::WaitingForOpponent: return "WaitingForOpponent";
        case BattlePhase::CardSelection: return "CardSelection";
        case BattlePhase::AwaitingBothReady: return "AwaitingBothReady";
        case BattlePhase::RevealSequence: return "RevealSequence";
        case BattlePhase::Resolving: return "Resolving";
        case BattlePhase::Complete: return "Complete";
        case BattlePhase::Disconnected: return "Disconnected";
        }
        return "?";
    }

    inline auto ToString(ConnectionPhase p) -> std::string_view
    {
        switch (p)
        {
        case ConnectionPhase::Idle: return "Idle";
        case ConnectionPhase::AutoDiscovering: return "AutoDiscovering";
        case ConnectionPhase::Connecting: return "Connecting";
        case ConnectionPhase::Connected: return "Connected";
        case ConnectionPhase::Disconnected: return "Disconnected";
        }
        return "?";
    }

    inline auto ToString(Winner w) -> std::string_view
    {
        switch (w)
        {
        case Winner::Local: return "Local";
        case Winner::Opponent: return "Opponent";
        case Winner::Draw: return "Draw";
        }
        return "?";
    }

    inline auto ToString(Rarity r) -> std::string_view
    {
        switch (r)
        {
        case Rarity::Common: return "Common";
        case Rarity::Rare: return "Rare";
        case Rarity::Epic: return "Epic";
        case Rarity::Legendary: return "Legendary";
        }
        return "?";
    }
}

#endif //CARDARENA_STATE_HPP
