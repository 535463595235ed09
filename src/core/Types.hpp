//
// Types.hpp
//

#ifndef CARDARENA_TYPES_HPP
#define CARDARENA_TYPES_HPP

#define ARN_ENABLE_TEST_HOOKS true

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "Log.hpp"

namespace arena::core::constants
{
    inline constexpr std::size_t MaxActivityMessages = 20;
    inline constexpr std::size_t MaxConnectionEvents = 100;
    inline constexpr std::uint32_t MaxExchanges = 100;
    // Upper bound for any attack or health value accepted from a peer.
    inline constexpr std::int32_t MaxCardStat = 1'000'000;
    inline constexpr std::uint16_t SchemaVersion = 1;
}

namespace arena::core
{
    using CardId = std::int64_t;
    using PayloadId = std::int64_t;
    using EndpointId = std::string;

    enum class Rarity : std::uint8_t
    {
        Common = 0,
        Rare,
        Epic,
        Legendary
    };

    // Which participant a value refers to, always relative to this device.
    enum class Side : std::uint8_t
    {
        Local = 0,
        Opponent
    };

    inline constexpr auto Flip(Side s) noexcept -> Side
    {
        return s == Side::Local ? Side::Opponent : Side::Local;
    }

    struct CardInfo
    {
        CardId id{};
        std::string name;
        std::int32_t attack{};
        std::int32_t health{};
        Rarity rarity{Rarity::Common};
        std::optional<std::filesystem::path> image_path{};

        auto operator==(CardInfo const&) const -> bool = default;
    };

    struct BattleCard
    {
        CardInfo card;
        Side owner{Side::Local};
        std::int32_t effective_attack{};
        std::int32_t effective_health{};
        std::int32_t current_health{};
        // set once the card art is available on this device
        std::optional<std::filesystem::path> image{};

        [[nodiscard]]
        auto IsAlive() const noexcept -> bool { return current_health > 0; }

        // Applies the rarity bonus (attack %, flat health).
        static auto FromCard(CardInfo const& card, Side owner) -> BattleCard;

        auto operator==(BattleCard const&) const -> bool = default;
    };

    struct StorySegment
    {
        Side actor{Side::Local};
        std::string text;
        std::optional<std::int32_t> damage{};

        auto operator==(StorySegment const&) const -> bool = default;
    };

    enum class Winner : std::uint8_t
    {
        Local = 0,
        Opponent,
        Draw
    };

    struct RoundLog
    {
        std::uint32_t exchange{};
        Side attacker{Side::Local};
        std::int32_t damage{};
        std::int32_t local_health{};
        std::int32_t opponent_health{};

        auto operator==(RoundLog const&) const -> bool = default;
    };

    enum class TransferKind : std::uint8_t
    {
        LocalAcquires,     // local player takes the opponent's card
        OpponentAcquires,  // opponent takes the local card
        BothDestroyed
    };

    struct CardTransfer
    {
        TransferKind kind{TransferKind::BothDestroyed};
        CardId local_card{};
        CardId opponent_card{};

        auto operator==(CardTransfer const&) const -> bool = default;
    };

    struct BattleResult
    {
        Winner winner{Winner::Draw};
        bool is_draw{true};
        std::vector<RoundLog> rounds;
        CardTransfer transfer{};
        std::int32_t local_final_health{};
        std::int32_t opponent_final_health{};

        auto operator==(BattleResult const&) const -> bool = default;
    };

    struct SessionConfig
    {
        std::string local_name{};

        std::chrono::milliseconds reveal_pause{500};
        std::chrono::milliseconds blur_duration{800};
        std::chrono::milliseconds stat_hold{1000};
        std::chrono::milliseconds pre_battle_pause{1500};
        std::chrono::milliseconds story_step{2000};

        std::filesystem::path image_dir{"arena_images"};
        // Process-wide; applied when a BattleManager is built from this config.
        log::Level log_level{log::Level::Info};
        std::optional<std::filesystem::path> audit_path{};
    };
}

#endif //CARDARENA_TYPES_HPP
