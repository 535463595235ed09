#include "AuditLogger.hpp"

#include <format>
#include <type_traits>
#include <variant>

using namespace arena::core;

namespace
{

auto s_side(Side const s) -> std::string_view
{
    return s == Side::Local ? "L" : "O";
}

auto s_rounds(std::vector<RoundLog> const& rounds) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < rounds.size(); ++i)
    {
        RoundLog const& r = rounds[i];
        body += (i ? "," : "");
        body += std::format("{}{}:{}({}/{})", r.exchange, s_side(r.attacker), r.damage, r.local_health, r.opponent_health);
    }
    return body;
}

} // anonymous namespace

namespace arena::core::debug
{

auto Describe(Message const& m) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& msg) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, CardPreviewMsg>)
            {
                return std::format("CardPreview(id={} name={} rarity={} image={})",
                                   msg.card_id, msg.name, ToString(msg.rarity), msg.has_image);
            }
            else if constexpr (std::is_same_v<T, CardStatsMsg>)
            {
                return std::format("CardStats(id={} atk={} hp={} eff={}/{})",
                                   msg.card_id, msg.attack, msg.health, msg.effective_attack, msg.effective_health);
            }
            else if constexpr (std::is_same_v<T, ReadyMsg>)
            {
                return "Ready";
            }
            else if constexpr (std::is_same_v<T, StorySegmentMsg>)
            {
                return std::format("Story[{}/{}] {} dmg={} \"{}\"",
                                   msg.index, msg.total, s_side(msg.actor),
                                   msg.damage ? std::to_string(*msg.damage) : std::string("-"), msg.text);
            }
            else if constexpr (std::is_same_v<T, BattleOutcomeMsg>)
            {
                return std::format("Outcome(winner={} hp={}/{} rounds=[{}])",
                                   ToString(msg.winner), msg.local_final_health, msg.opponent_final_health,
                                   s_rounds(msg.rounds));
            }
            else if constexpr (std::is_same_v<T, ImageTransferMetaMsg>)
            {
                return std::format("ImageMeta(payload={} card={} file={} size={})",
                                   msg.payload_id, msg.card_id, msg.file_name, msg.declared_size);
            }
            else if constexpr (std::is_same_v<T, DisconnectMsg>)
            {
                return std::format("Disconnect({})", msg.reason);
            }
            else if constexpr (std::is_same_v<T, RematchMsg>)
            {
                return "Rematch";
            }
            else
            {
                return std::format("Unknown(tag={})", static_cast<int>(msg.type_tag));
            }
        },
        m
    );
}

AuditLogger::AuditLogger(std::filesystem::path path)
    : out_(path, std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(std::string_view session_id, std::string_view local_name, Connection const& link) -> void
{
    out_ << std::format("Session={}\n", session_id);
    out_ << std::format("Local={}\n", local_name);
    out_ << std::format("Peer={} ({})\n", link.peer_id, link.peer_name);
    out_ << std::format("Role={}\n", link.authoritative ? "authoritative" : "follower");
    out_ << std::format("Connection={}{}\n", link.number, link.IsReconnection() ? " reconnection" : "");
    out_.flush();
}

auto AuditLogger::phase(BattlePhase from, BattlePhase to) -> void
{
    out_ << std::format("Phase: {} -> {}\n", ToString(from), ToString(to));
}

auto AuditLogger::sent(std::uint64_t msg_id, Message const& m) -> void
{
    out_ << std::format(">> #{} {}\n", msg_id, Describe(m));
}

auto AuditLogger::received(std::uint64_t msg_id, Message const& m) -> void
{
    out_ << std::format("<< #{} {}\n", msg_id, Describe(m));
}

auto AuditLogger::dropped(std::string_view what) -> void
{
    out_ << std::format("Dropped: {}\n", what);
}

auto AuditLogger::result(BattleResult const& r) -> void
{
    out_ << std::format("Result: winner={} draw={} hp={}/{} rounds={}\n",
                        ToString(r.winner), r.is_draw, r.local_final_health, r.opponent_final_health,
                        r.rounds.size());
    out_.flush();
}

auto AuditLogger::end(std::string_view reason) -> void
{
    out_ << std::format("End: {}\n", reason);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace arena::core::debug
