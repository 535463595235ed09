#ifndef CARDARENA_CODEC_HPP
#define CARDARENA_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Messages.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/arena_net_generated.h"

namespace arena::core::net
{
    using ParseError = arena::core::error::ParseError;

    // Key/value pairs carried beside the typed message. Receivers ignore unknown keys.
    struct Extra
    {
        std::string key;
        std::string value;

        auto operator==(Extra const&) const -> bool = default;
    };

    struct DecodedMessage
    {
        std::uint64_t msg_id{};
        std::uint16_t schema_version{};
        arena::core::Message message{};
        std::vector<Extra> extras;
    };

    auto ToFbRarity(arena::core::Rarity r) noexcept -> arena::gen::net::Rarity;
    auto ToFbSide(arena::core::Side s) noexcept -> arena::gen::net::Side;
    auto ToFbWinner(arena::core::Winner w) noexcept -> arena::gen::net::Winner;

    auto FromFbRarity(arena::gen::net::Rarity r) noexcept -> arena::core::Rarity;
    auto FromFbSide(arena::gen::net::Side s) noexcept -> arena::core::Side;
    auto FromFbWinner(arena::gen::net::Winner w) noexcept -> arena::core::Winner;

    // --- Outbound ---

    // Throws SerializationError for UnknownMsg, which is receive-only.
    auto Encode(arena::core::Message const& msg,
                std::uint64_t msg_id,
                std::span<Extra const> extras = {})
        -> std::vector<std::uint8_t>;

    // --- Inbound ---

    // ParseError only for bytes that are not a verifiable envelope. A valid envelope
    // whose union tag is not known here decodes to UnknownMsg.
    auto Decode(std::span<std::byte const> bytes)
        -> std::expected<DecodedMessage, ParseError>;

    inline auto Decode(std::span<std::uint8_t const> bytes)
        -> std::expected<DecodedMessage, ParseError>
    {
        return Decode(std::span<std::byte const>{
            reinterpret_cast<std::byte const*>(bytes.data()), bytes.size()
        });
    }
} // namespace arena::core::net


#endif //CARDARENA_CODEC_HPP
