//
// BattleResolver.hpp
//

#ifndef CARDARENA_BATTLERESOLVER_HPP
#define CARDARENA_BATTLERESOLVER_HPP

#include <cstdint>
#include <vector>

#include "Types.hpp"

namespace arena::core
{
    struct Resolution
    {
        std::vector<StorySegment> segments;
        BattleResult result;

        auto operator==(Resolution const&) const -> bool = default;
    };

    // Pure combat calculation. No randomness, no clock, no I/O.
    //
    // The card with the higher effective attack strikes first; on equal attack the
    // local card opens. Each exchange is a strike followed by the counter-blow of the
    // other card, which always lands, so both cards may fall in the same exchange.
    // After constants::MaxExchanges the card with more health left wins.
    class BattleResolver
    {
    public:
        [[nodiscard]]
        static auto Resolve(BattleCard const& local, BattleCard const& opponent) -> Resolution;

        [[nodiscard]]
        static auto FirstAttacker(BattleCard const& local, BattleCard const& opponent) noexcept -> Side;
    };

    // Re-expresses a result computed on the other device in this device's terms.
    [[nodiscard]]
    auto FlipPerspective(BattleResult const& r) -> BattleResult;

    [[nodiscard]]
    auto FlipPerspective(StorySegment const& s) -> StorySegment;

    [[nodiscard]]
    auto Flip(Winner w) noexcept -> Winner;

    // (attack percent, flat health) granted by a rarity.
    struct RarityBonus
    {
        std::int32_t attack_pct{};
        std::int32_t health{};
    };

    [[nodiscard]]
    auto BonusFor(Rarity r) noexcept -> RarityBonus;
}

#endif //CARDARENA_BATTLERESOLVER_HPP
