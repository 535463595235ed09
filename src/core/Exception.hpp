//
// Exception.hpp
//

#ifndef CARDARENA_EXCEPTION_HPP
#define CARDARENA_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "State.hpp"
#include "Types.hpp"

namespace arena::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Serialization, // FlatBuffers build errors
        Assertion // internal assertion failed
    };

    inline auto to_string(Code c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "unknown";
        case Code::Serialization: return "serialization";
        case Code::Assertion: return "assertion";
        }
        return "?";
    }

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define ARN_THROW(code_enum, msg) ::arena::core::error::fail((code_enum), (msg))
#define ARN_ASSERT(cond, msg) do { if(!(cond)) ::arena::core::error::fail(::arena::core::error::Code::Assertion, (msg)); } while(0)

    // ---------- Value errors (never thrown) ----------

    enum class TransportErrorCode : std::uint16_t
    {
        RadioDisabled,
        UnknownEndpoint,
        AlreadyConnected,
        NotConnected,
        Io
    };

    // Discovery/advertising/connection failure or loss of the link.
    struct TransportError
    {
        TransportErrorCode code{};
        std::string message;
    };

    // Wholly unparseable wire bytes.
    struct ParseError
    {
        std::string message;
    };

    enum class PayloadErrorCode : std::uint16_t
    {
        SizeMismatch,
        TransferFailed,
        MissingFile,
        SinkFailed
    };

    struct PayloadError
    {
        PayloadErrorCode code{};
        PayloadId payload_id{};
        std::string message;
    };

    enum class StateViolationCode : std::uint16_t
    {
        WrongPhase,
        NoLocalCard,
        AlreadyReady,
        ResultUnknown,
        AlreadyConnected,
        UnknownEndpoint
    };

    // A command that is not valid for the current phase. Absorbed as a no-op.
    struct StateViolation
    {
        StateViolationCode code{};
        std::optional<BattlePhase> phase{};
        std::optional<ConnectionPhase> connection{};
        std::optional<std::string> detail{};

        auto with_phase(BattlePhase p) -> StateViolation&
        {
            phase = p;
            return *this;
        }

        auto with_connection(ConnectionPhase p) -> StateViolation&
        {
            connection = p;
            return *this;
        }

        auto with_detail(std::string d) -> StateViolation&
        {
            detail = std::move(d);
            return *this;
        }
    };

    inline auto to_string(TransportErrorCode c) -> std::string_view
    {
        using E = TransportErrorCode;
        switch (c)
        {
        case E::RadioDisabled: return "Transport: radio disabled";
        case E::UnknownEndpoint: return "Transport: unknown endpoint";
        case E::AlreadyConnected: return "Transport: already connected";
        case E::NotConnected: return "Transport: not connected";
        case E::Io: return "Transport: I/O failure";
        }
        return "Unknown";
    }

    inline auto to_string(PayloadErrorCode c) -> std::string_view
    {
        using E = PayloadErrorCode;
        switch (c)
        {
        case E::SizeMismatch: return "Payload: declared size does not match received bytes";
        case E::TransferFailed: return "Payload: transfer failed or was cancelled";
        case E::MissingFile: return "Payload: received file is missing";
        case E::SinkFailed: return "Payload: image sink could not store bytes";
        }
        return "Unknown";
    }

    inline auto to_string(StateViolationCode c) -> std::string_view
    {
        using E = StateViolationCode;
        switch (c)
        {
        case E::WrongPhase: return "State: command not valid in this phase";
        case E::NoLocalCard: return "State: no local card selected";
        case E::AlreadyReady: return "State: already ready";
        case E::ResultUnknown: return "State: battle result not known yet";
        case E::AlreadyConnected: return "State: a connection already exists";
        case E::UnknownEndpoint: return "State: endpoint was never discovered";
        }
        return "Unknown";
    }

    inline auto describe(TransportError const& e) -> std::string
    {
        return e.message.empty()
                   ? std::string{to_string(e.code)}
                   : std::format("{} | {}", to_string(e.code), e.message);
    }

    inline auto describe(PayloadError const& e) -> std::string
    {
        auto s = std::format("{} | payload={}", to_string(e.code), e.payload_id);
        if (!e.message.empty()) s += std::format(" | {}", e.message);
        return s;
    }

    inline auto describe(StateViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", ToString(*v.phase));
        if (v.connection) s += std::format(" | link={}", ToString(*v.connection));
        if (v.detail) s += std::format(" | {}", *v.detail);
        return s;
    }

    using CommandResult = std::expected<void, StateViolation>;
    using TransportResult = std::expected<void, TransportError>;
}

#endif //CARDARENA_EXCEPTION_HPP
