//
// BattleResolver.cpp
//

#include "BattleResolver.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

namespace arena::core
{
    static constexpr std::array<std::string_view, 10> AttackVerbs{
        "strike", "blow", "assault", "barrage", "onslaught",
        "slam", "blast", "surge", "rampage", "combo"
    };

    // Deterministic pick: the n-th strike of the battle always uses the same verb.
    static auto VerbFor(std::size_t strike_no) -> std::string_view
    {
        return AttackVerbs[strike_no % AttackVerbs.size()];
    }

    static auto ClampStat(std::int64_t v) noexcept -> std::int32_t
    {
        return static_cast<std::int32_t>(std::clamp<std::int64_t>(v, std::numeric_limits<std::int32_t>::min(),
                                                                   std::numeric_limits<std::int32_t>::max()));
    }

    // Health can go below zero inside the loop; reported health never does.
    static auto Reported(std::int64_t hp) noexcept -> std::int32_t
    {
        return ClampStat(std::max<std::int64_t>(0, hp));
    }

    auto BonusFor(Rarity r) noexcept -> RarityBonus
    {
        switch (r)
        {
        case Rarity::Legendary: return {20, 20};
        case Rarity::Epic: return {10, 10};
        case Rarity::Rare: return {5, 5};
        case Rarity::Common: return {0, 0};
        }
        return {0, 0};
    }

    auto BattleCard::FromCard(CardInfo const& card, Side owner) -> BattleCard
    {
        RarityBonus const bonus = BonusFor(card.rarity);

        BattleCard bc{};
        bc.card = card;
        bc.owner = owner;
        bc.effective_attack = ClampStat(std::int64_t{card.attack} * (100 + bonus.attack_pct) / 100);
        bc.effective_health = ClampStat(std::int64_t{card.health} + bonus.health);
        bc.current_health = bc.effective_health;
        bc.image = card.image_path;
        return bc;
    }

    auto BattleResolver::FirstAttacker(BattleCard const& local, BattleCard const& opponent) noexcept -> Side
    {
        return opponent.effective_attack > local.effective_attack ? Side::Opponent : Side::Local;
    }

    auto BattleResolver::Resolve(BattleCard const& local, BattleCard const& opponent) -> Resolution
    {
        Resolution out{};
        std::vector<StorySegment>& story = out.segments;
        BattleResult& result = out.result;

        // 64-bit so that MaxExchanges strikes of any int32 damage cannot overflow
        std::int64_t local_hp = local.current_health;
        std::int64_t opponent_hp = opponent.current_health;

        story.push_back(StorySegment{
            Side::Local,
            std::format("The arena crackles with energy as {} faces {}!", local.card.name, opponent.card.name),
            std::nullopt
        });

        Side const first = FirstAttacker(local, opponent);
        std::size_t strike_no{};

        auto strike = [&](std::uint32_t exchange, Side attacker)
        {
            bool const is_local = attacker == Side::Local;
            BattleCard const& atk = is_local ? local : opponent;
            BattleCard const& def = is_local ? opponent : local;
            std::int32_t const dmg = std::max(0, atk.effective_attack);
            std::int64_t& target_hp = is_local ? opponent_hp : local_hp;
            target_hp -= dmg;

            bool const opener = attacker == first;
            std::string text = opener
                ? std::format("{} unleashes a devastating {}! {} takes {} damage!",
                              atk.card.name, VerbFor(strike_no), def.card.name, dmg)
                : std::format("{} retaliates with a fierce {}! {} suffers {} damage!",
                              atk.card.name, VerbFor(strike_no), def.card.name, dmg);
            ++strike_no;

            story.push_back(StorySegment{attacker, std::move(text), dmg});
            result.rounds.push_back(RoundLog{exchange, attacker, dmg, Reported(local_hp), Reported(opponent_hp)});
        };

        for (std::uint32_t exchange = 1; exchange <= constants::MaxExchanges; ++exchange)
        {
            strike(exchange, first);
            strike(exchange, Flip(first));

            if (local_hp <= 0 || opponent_hp <= 0)
            {
                break;
            }
        }

        bool const local_down = local_hp <= 0;
        bool const opponent_down = opponent_hp <= 0;

        if (local_down && opponent_down)
        {
            result.winner = Winner::Draw;
        }
        else if (opponent_down)
        {
            result.winner = Winner::Local;
        }
        else if (local_down)
        {
            result.winner = Winner::Opponent;
        }
        else if (local_hp != opponent_hp)
        {
            // exchange cap reached with both standing
            result.winner = local_hp > opponent_hp ? Winner::Local : Winner::Opponent;
        }
        else
        {
            result.winner = Winner::Draw;
        }

        result.is_draw = result.winner == Winner::Draw;
        result.local_final_health = Reported(local_hp);
        result.opponent_final_health = Reported(opponent_hp);
        result.transfer.local_card = local.card.id;
        result.transfer.opponent_card = opponent.card.id;

        switch (result.winner)
        {
        case Winner::Local:
            result.transfer.kind = TransferKind::LocalAcquires;
            story.push_back(StorySegment{
                Side::Local,
                std::format("{} stands victorious! {} has been defeated!", local.card.name, opponent.card.name),
                std::nullopt
            });
            break;
        case Winner::Opponent:
            result.transfer.kind = TransferKind::OpponentAcquires;
            story.push_back(StorySegment{
                Side::Opponent,
                std::format("{} emerges triumphant! {} falls in battle!", opponent.card.name, local.card.name),
                std::nullopt
            });
            break;
        case Winner::Draw:
            result.transfer.kind = TransferKind::BothDestroyed;
            story.push_back(StorySegment{
                first,
                std::string{"Both warriors fall simultaneously! A legendary draw that will be remembered!"},
                std::nullopt
            });
            break;
        }

        return out;
    }

    auto Flip(Winner w) noexcept -> Winner
    {
        switch (w)
        {
        case Winner::Local: return Winner::Opponent;
        case Winner::Opponent: return Winner::Local;
        case Winner::Draw: return Winner::Draw;
        }
        return Winner::Draw;
    }

    auto FlipPerspective(StorySegment const& s) -> StorySegment
    {
        return StorySegment{Flip(s.actor), s.text, s.damage};
    }

    auto FlipPerspective(BattleResult const& r) -> BattleResult
    {
        BattleResult out{};
        out.winner = Flip(r.winner);
        out.is_draw = r.is_draw;
        out.local_final_health = r.opponent_final_health;
        out.opponent_final_health = r.local_final_health;

        out.rounds.reserve(r.rounds.size());
        for (RoundLog const& rl : r.rounds)
        {
            out.rounds.push_back(RoundLog{rl.exchange, Flip(rl.attacker), rl.damage, rl.opponent_health, rl.local_health});
        }

        out.transfer.local_card = r.transfer.opponent_card;
        out.transfer.opponent_card = r.transfer.local_card;
        switch (r.transfer.kind)
        {
        case TransferKind::LocalAcquires: out.transfer.kind = TransferKind::OpponentAcquires; break;
        case TransferKind::OpponentAcquires: out.transfer.kind = TransferKind::LocalAcquires; break;
        case TransferKind::BothDestroyed: out.transfer.kind = TransferKind::BothDestroyed; break;
        }
        return out;
    }
}
