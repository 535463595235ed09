//
// ConnectionCoordinator.hpp
//

#ifndef CARDARENA_CONNECTIONCOORDINATOR_HPP
#define CARDARENA_CONNECTIONCOORDINATOR_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"
#include "net/Transport.hpp"

namespace arena::core
{
    enum class ConnectionEventKind : std::uint8_t
    {
        DiscoveryStarted,
        EndpointFound,
        EndpointLost,
        ConnectionAttempt,
        ConnectionSuccess,
        ConnectionFailed,
        Disconnected,
        ReconnectionDetected
    };

    struct ConnectionEvent
    {
        ConnectionEventKind kind{};
        EndpointId endpoint{};
        std::string detail{};
        std::chrono::system_clock::time_point at{};
    };

    auto ToString(ConnectionEventKind k) -> std::string_view;

    using ConnectError = std::variant<error::StateViolation, error::TransportError>;

    auto describe(ConnectError const& e) -> std::string;

    // Discovery, advertising and the single peer link. Not thread-safe: every call
    // must come from the owner's sequential context.
    class ConnectionCoordinator
    {
    public:
        explicit ConnectionCoordinator(arena::net::TransportAdapter& transport);

        // --- commands ---

        // Advertises and discovers at the same time. On transport refusal everything
        // is stopped again and the phase stays Idle, so the call can simply be retried.
        auto StartAutoDiscovery(std::string const& local_name) -> std::expected<void, ConnectError>;

        auto ConnectToEndpoint(EndpointId const& id) -> std::expected<void, ConnectError>;

        // Always safe; a second call does nothing.
        auto Disconnect() -> void;

        // --- transport events ---

        auto OnEndpointFound(arena::net::EndpointInfo const& ep) -> void;
        auto OnEndpointLost(EndpointId const& id) -> void;

        // Returns true when the request was accepted.
        auto OnConnectionInitiated(EndpointId const& id, std::string const& name, bool incoming) -> bool;

        // Returns the established connection on success.
        auto OnConnectionResult(EndpointId const& id, bool success) -> std::optional<Connection>;

        // Returns true when the active link was the one lost.
        auto OnDisconnected(EndpointId const& id) -> bool;

        // --- state ---

        [[nodiscard]] auto Phase() const noexcept -> ConnectionPhase { return phase_; }
        [[nodiscard]] auto Endpoints() const noexcept -> std::vector<PeerEndpoint> const& { return endpoints_; }
        [[nodiscard]] auto ActiveConnection() const noexcept -> std::optional<Connection> const& { return connection_; }
        [[nodiscard]] auto History() const noexcept -> std::vector<ConnectionEvent> const& { return history_; }
        [[nodiscard]] auto LocalName() const noexcept -> std::string const& { return local_name_; }
        [[nodiscard]] auto ConnectionCount() const noexcept -> std::uint32_t { return connection_count_; }

        [[nodiscard]]
        auto IsConnected() const noexcept -> bool
        {
            return connection_.has_value() && connection_->status == LinkStatus::Connected;
        }

        [[nodiscard]]
        auto IsAuthoritative() const noexcept -> bool
        {
            return IsConnected() && connection_->authoritative;
        }

        static auto GeneratePlaceholderName() -> std::string;

    private:
        auto Record(ConnectionEventKind kind, EndpointId id, std::string detail = {}) -> void;
        auto StopRadios() -> void;

        arena::net::TransportAdapter& transport_;

        ConnectionPhase phase_{ConnectionPhase::Idle};
        std::string local_name_;
        std::vector<PeerEndpoint> endpoints_;
        std::optional<Connection> connection_{};

        std::uint32_t connection_count_{};
        std::optional<EndpointId> last_peer_id_{};
        std::vector<ConnectionEvent> history_;
    };
}

#endif //CARDARENA_CONNECTIONCOORDINATOR_HPP
