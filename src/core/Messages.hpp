//
// Messages.hpp
//

#ifndef CARDARENA_MESSAGES_HPP
#define CARDARENA_MESSAGES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

#include "Types.hpp"

namespace arena::core
{
    // Sides inside a message are always the sender's point of view.

    struct CardPreviewMsg
    {
        CardId card_id{};
        std::string name;
        Rarity rarity{Rarity::Common};
        bool has_image{false};

        auto operator==(CardPreviewMsg const&) const -> bool = default;
    };

    struct CardStatsMsg
    {
        CardId card_id{};
        std::string name;
        Rarity rarity{Rarity::Common};
        std::int32_t attack{};
        std::int32_t health{};
        std::int32_t effective_attack{};
        std::int32_t effective_health{};

        auto operator==(CardStatsMsg const&) const -> bool = default;
    };

    struct ReadyMsg
    {
        auto operator==(ReadyMsg const&) const -> bool = default;
    };

    struct StorySegmentMsg
    {
        std::uint32_t index{};
        std::uint32_t total{};
        Side actor{Side::Local};
        std::string text;
        std::optional<std::int32_t> damage{};

        auto operator==(StorySegmentMsg const&) const -> bool = default;
    };

    struct BattleOutcomeMsg
    {
        Winner winner{Winner::Draw};
        std::int32_t local_final_health{};
        std::int32_t opponent_final_health{};
        std::vector<RoundLog> rounds;

        auto operator==(BattleOutcomeMsg const&) const -> bool = default;
    };

    struct ImageTransferMetaMsg
    {
        PayloadId payload_id{};
        CardId card_id{};
        std::string file_name;
        std::uint64_t declared_size{};

        auto operator==(ImageTransferMetaMsg const&) const -> bool = default;
    };

    struct DisconnectMsg
    {
        std::string reason;

        auto operator==(DisconnectMsg const&) const -> bool = default;
    };

    struct RematchMsg
    {
        auto operator==(RematchMsg const&) const -> bool = default;
    };

    // A recognised envelope whose union tag this build does not know.
    struct UnknownMsg
    {
        std::uint8_t type_tag{};

        auto operator==(UnknownMsg const&) const -> bool = default;
    };

    using Message = std::variant<
        CardPreviewMsg, CardStatsMsg, ReadyMsg, StorySegmentMsg, BattleOutcomeMsg,
        ImageTransferMetaMsg, DisconnectMsg, RematchMsg, UnknownMsg>;

    inline auto MessageName(Message const& m) -> std::string_view
    {
        return std::visit(
            []<typename T0>(T0 const&) -> std::string_view
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, CardPreviewMsg>) return "CardPreview";
                else if constexpr (std::is_same_v<T, CardStatsMsg>) return "CardStats";
                else if constexpr (std::is_same_v<T, ReadyMsg>) return "Ready";
                else if constexpr (std::is_same_v<T, StorySegmentMsg>) return "StorySegment";
                else if constexpr (std::is_same_v<T, BattleOutcomeMsg>) return "BattleOutcome";
                else if constexpr (std::is_same_v<T, ImageTransferMetaMsg>) return "ImageTransferMeta";
                else if constexpr (std::is_same_v<T, DisconnectMsg>) return "Disconnect";
                else if constexpr (std::is_same_v<T, RematchMsg>) return "Rematch";
                else return "Unknown";
            },
            m
        );
    }
} // namespace arena::core

#endif //CARDARENA_MESSAGES_HPP
