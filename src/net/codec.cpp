//
// codec.cpp
//
#include "codec.hpp"

#include <cstring>
#include <format>
#include <type_traits>
#include <utility>
#include <variant>

namespace arena::core::net
{
    namespace fb = arena::gen::net;

    auto ToFbRarity(arena::core::Rarity r) noexcept -> fb::Rarity
    {
        switch (r)
        {
        case arena::core::Rarity::Common: return fb::Rarity::Common;
        case arena::core::Rarity::Rare: return fb::Rarity::Rare;
        case arena::core::Rarity::Epic: return fb::Rarity::Epic;
        case arena::core::Rarity::Legendary: return fb::Rarity::Legendary;
        }
        return fb::Rarity::Common;
    }

    auto FromFbRarity(fb::Rarity r) noexcept -> arena::core::Rarity
    {
        switch (r)
        {
        case fb::Rarity::Common: return arena::core::Rarity::Common;
        case fb::Rarity::Rare: return arena::core::Rarity::Rare;
        case fb::Rarity::Epic: return arena::core::Rarity::Epic;
        case fb::Rarity::Legendary: return arena::core::Rarity::Legendary;
        }
        return arena::core::Rarity::Common;
    }

    auto ToFbSide(arena::core::Side s) noexcept -> fb::Side
    {
        switch (s)
        {
        case arena::core::Side::Local: return fb::Side::Local;
        case arena::core::Side::Opponent: return fb::Side::Opponent;
        }
        return fb::Side::Local;
    }

    auto FromFbSide(fb::Side s) noexcept -> arena::core::Side
    {
        switch (s)
        {
        case fb::Side::Local: return arena::core::Side::Local;
        case fb::Side::Opponent: return arena::core::Side::Opponent;
        }
        return arena::core::Side::Local;
    }

    auto ToFbWinner(arena::core::Winner w) noexcept -> fb::Winner
    {
        switch (w)
        {
        case arena::core::Winner::Local: return fb::Winner::Local;
        case arena::core::Winner::Opponent: return fb::Winner::Opponent;
        case arena::core::Winner::Draw: return fb::Winner::Draw;
        }
        return fb::Winner::Draw;
    }

    auto FromFbWinner(fb::Winner w) noexcept -> arena::core::Winner
    {
        switch (w)
        {
        case fb::Winner::Local: return arena::core::Winner::Local;
        case fb::Winner::Opponent: return arena::core::Winner::Opponent;
        case fb::Winner::Draw: return arena::core::Winner::Draw;
        }
        return arena::core::Winner::Draw;
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)arena::core::Rarity::Legendary == (int)arena::gen::net::Rarity::Legendary);
    static_assert((int)arena::core::Side::Opponent == (int)arena::gen::net::Side::Opponent);
    static_assert((int)arena::core::Winner::Draw == (int)arena::gen::net::Winner::Draw);

    // A known tag with no table passes the verifier; treat it as malformed.
    auto missing_body(arena::gen::net::Message tag) -> std::unexpected<arena::core::error::ParseError>
    {
        return std::unexpected(arena::core::error::ParseError{
            std::format("envelope tag {} without body", arena::gen::net::EnumNameMessage(tag))
        });
    }

    inline auto str_or_empty(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }
} // anonymous

namespace arena::core::net
{
    using arena::core::Message;

    // Union payload + its tag for one message alternative.
    struct BuiltPayload
    {
        fb::Message type{fb::Message::NONE};
        flatbuffers::Offset<void> offset{};
    };

    static auto BuildPayload(flatbuffers::FlatBufferBuilder& fbb, Message const& msg) -> BuiltPayload
    {
        return std::visit(
            [&]<typename T0>(T0 const& m) -> BuiltPayload
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, CardPreviewMsg>)
                {
                    auto const off = fb::CreateCardPreviewDirect(
                        fbb, m.card_id, m.name.c_str(), ToFbRarity(m.rarity), m.has_image);
                    return {fb::Message::CardPreview, off.Union()};
                }
                else if constexpr (std::is_same_v<T, CardStatsMsg>)
                {
                    auto const off = fb::CreateCardStatsDirect(
                        fbb, m.card_id, m.name.c_str(), ToFbRarity(m.rarity),
                        m.attack, m.health, m.effective_attack, m.effective_health);
                    return {fb::Message::CardStats, off.Union()};
                }
                else if constexpr (std::is_same_v<T, ReadyMsg>)
                {
                    auto const off = fb::CreateReady(fbb, true);
                    return {fb::Message::Ready, off.Union()};
                }
                else if constexpr (std::is_same_v<T, StorySegmentMsg>)
                {
                    auto const off = fb::CreateStorySegmentDirect(
                        fbb, m.index, m.total, ToFbSide(m.actor), m.text.c_str(),
                        m.damage.has_value(), m.damage.value_or(0));
                    return {fb::Message::StorySegment, off.Union()};
                }
                else if constexpr (std::is_same_v<T, BattleOutcomeMsg>)
                {
                    std::vector<flatbuffers::Offset<fb::RoundEntry>> rounds;
                    rounds.reserve(m.rounds.size());
                    for (arena::core::RoundLog const& rl : m.rounds)
                    {
                        rounds.push_back(fb::CreateRoundEntry(
                            fbb, rl.exchange, ToFbSide(rl.attacker), rl.damage, rl.local_health, rl.opponent_health));
                    }
                    auto const off = fb::CreateBattleOutcome(
                        fbb, ToFbWinner(m.winner), m.local_final_health, m.opponent_final_health,
                        fbb.CreateVector(rounds));
                    return {fb::Message::BattleOutcome, off.Union()};
                }
                else if constexpr (std::is_same_v<T, ImageTransferMetaMsg>)
                {
                    auto const off = fb::CreateImageTransferMetaDirect(
                        fbb, m.payload_id, m.card_id, m.file_name.c_str(), m.declared_size);
                    return {fb::Message::ImageTransferMeta, off.Union()};
                }
                else if constexpr (std::is_same_v<T, DisconnectMsg>)
                {
                    auto const off = fb::CreateDisconnectDirect(fbb, m.reason.c_str());
                    return {fb::Message::Disconnect, off.Union()};
                }
                else if constexpr (std::is_same_v<T, RematchMsg>)
                {
                    auto const off = fb::CreateRematch(fbb);
                    return {fb::Message::Rematch, off.Union()};
                }
                else
                {
                    ARN_THROW(arena::core::error::Code::Serialization,
                              std::format("cannot encode unknown message tag {}", static_cast<int>(m.type_tag)));
                }
            },
            msg
        );
    }

    auto Encode(Message const& msg,
                std::uint64_t msg_id,
                std::span<Extra const> extras)
        -> std::vector<std::uint8_t>
    {
        flatbuffers::FlatBufferBuilder fbb;

        BuiltPayload const payload = BuildPayload(fbb, msg);

        flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<fb::Extra>>> extras_off{};
        if (!extras.empty())
        {
            std::vector<flatbuffers::Offset<fb::Extra>> ev;
            ev.reserve(extras.size());
            for (Extra const& e : extras)
            {
                ev.push_back(fb::CreateExtraDirect(fbb, e.key.c_str(), e.value.c_str()));
            }
            extras_off = fbb.CreateVector(ev);
        }

        auto const env = fb::CreateEnvelope(
            fbb, arena::core::constants::SchemaVersion, msg_id, payload.type, payload.offset, extras_off);

        fbb.Finish(env);

        std::vector<std::uint8_t> out(fbb.GetSize());
        std::memcpy(out.data(), fbb.GetBufferPointer(), fbb.GetSize());
        return out;
    }

    // ---------- Decode (inbound wire) ----------

    auto Decode(std::span<std::byte const> bytes)
        -> std::expected<DecodedMessage, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());

        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        auto const* env = fb::GetEnvelope(data);
        if (!env)
            return std::unexpected(ParseError{"bad root"});

        DecodedMessage out{};
        out.msg_id = env->msg_id();
        out.schema_version = env->schema_version();

        if (auto const* ev = env->extras())
        {
            out.extras.reserve(ev->size());
            for (auto const* e : *ev)
            {
                out.extras.push_back(Extra{str_or_empty(e->key()), str_or_empty(e->value())});
            }
        }

        switch (env->message_type())
        {
        case fb::Message::CardPreview:
        {
            auto const* p = env->message_as_CardPreview();
            if (!p)
                return missing_body(env->message_type());
            out.message = CardPreviewMsg{p->card_id(), str_or_empty(p->name()), FromFbRarity(p->rarity()), p->has_image()};
            return out;
        }

        case fb::Message::CardStats:
        {
            auto const* s = env->message_as_CardStats();
            if (!s)
                return missing_body(env->message_type());
            out.message = CardStatsMsg{
                s->card_id(), str_or_empty(s->name()), FromFbRarity(s->rarity()),
                s->attack(), s->health(), s->effective_attack(), s->effective_health()
            };
            return out;
        }

        case fb::Message::Ready:
            out.message = ReadyMsg{};
            return out;

        case fb::Message::StorySegment:
        {
            auto const* s = env->message_as_StorySegment();
            if (!s)
                return missing_body(env->message_type());
            StorySegmentMsg seg{};
            seg.index = s->index();
            seg.total = s->total();
            seg.actor = FromFbSide(s->actor());
            seg.text = str_or_empty(s->text());
            if (s->has_damage())
            {
                seg.damage = s->damage();
            }
            out.message = std::move(seg);
            return out;
        }

        case fb::Message::BattleOutcome:
        {
            auto const* o = env->message_as_BattleOutcome();
            if (!o)
                return missing_body(env->message_type());
            BattleOutcomeMsg res{};
            res.winner = FromFbWinner(o->winner());
            res.local_final_health = o->local_final_health();
            res.opponent_final_health = o->opponent_final_health();
            if (auto const* v = o->rounds())
            {
                res.rounds.reserve(v->size());
                for (auto const* r : *v)
                {
                    res.rounds.push_back(arena::core::RoundLog{
                        r->exchange(), FromFbSide(r->attacker()), r->damage(), r->local_health(), r->opponent_health()
                    });
                }
            }
            out.message = std::move(res);
            return out;
        }

        case fb::Message::ImageTransferMeta:
        {
            auto const* m = env->message_as_ImageTransferMeta();
            if (!m)
                return missing_body(env->message_type());
            out.message = ImageTransferMetaMsg{m->payload_id(), m->card_id(), str_or_empty(m->file_name()), m->declared_size()};
            return out;
        }

        case fb::Message::Disconnect:
        {
            auto const* d = env->message_as_Disconnect();
            if (!d)
                return missing_body(env->message_type());
            out.message = DisconnectMsg{str_or_empty(d->reason())};
            return out;
        }

        case fb::Message::Rematch:
            out.message = RematchMsg{};
            return out;

        default:
            // newer peer, newer message kind
            out.message = UnknownMsg{static_cast<std::uint8_t>(env->message_type())};
            return out;
        }
    }
} // namespace arena::core::net
