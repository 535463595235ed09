//
// ConnectionCoordinator.cpp
//

#include "ConnectionCoordinator.hpp"

#include <algorithm>
#include <format>
#include <random>
#include <utility>

namespace arena::core
{
    auto ToString(ConnectionEventKind k) -> std::string_view
    {
        switch (k)
        {
        case ConnectionEventKind::DiscoveryStarted: return "DiscoveryStarted";
        case ConnectionEventKind::EndpointFound: return "EndpointFound";
        case ConnectionEventKind::EndpointLost: return "EndpointLost";
        case ConnectionEventKind::ConnectionAttempt: return "ConnectionAttempt";
        case ConnectionEventKind::ConnectionSuccess: return "ConnectionSuccess";
        case ConnectionEventKind::ConnectionFailed: return "ConnectionFailed";
        case ConnectionEventKind::Disconnected: return "Disconnected";
        case ConnectionEventKind::ReconnectionDetected: return "ReconnectionDetected";
        }
        return "?";
    }

    auto describe(ConnectError const& e) -> std::string
    {
        return std::visit([](auto const& err) { return error::describe(err); }, e);
    }

    ConnectionCoordinator::ConnectionCoordinator(arena::net::TransportAdapter& transport)
        : transport_{transport}
    {
    }

    auto ConnectionCoordinator::GeneratePlaceholderName() -> std::string
    {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<int> dist(1000, 9999);
        return std::format("Player-{}", dist(rng));
    }

    auto ConnectionCoordinator::Record(ConnectionEventKind kind, EndpointId id, std::string detail) -> void
    {
        history_.push_back(ConnectionEvent{kind, std::move(id), std::move(detail), std::chrono::system_clock::now()});
        // oldest first; keep the most recent window
        if (history_.size() > constants::MaxConnectionEvents)
        {
            history_.erase(history_.begin(),
                           history_.begin() + static_cast<std::ptrdiff_t>(history_.size() - constants::MaxConnectionEvents));
        }
    }

    auto ConnectionCoordinator::StopRadios() -> void
    {
        transport_.StopAdvertising();
        transport_.StopDiscovery();
    }

    auto ConnectionCoordinator::StartAutoDiscovery(std::string const& local_name) -> std::expected<void, ConnectError>
    {
        if (connection_.has_value())
        {
            return std::unexpected(ConnectError{
                error::StateViolation{error::StateViolationCode::AlreadyConnected}
                    .with_connection(phase_)
                    .with_detail(std::format("linked to {}", connection_->peer_id))
            });
        }

        local_name_ = local_name.empty() ? GeneratePlaceholderName() : local_name;

        // restart cleanly if discovery is already running
        StopRadios();
        endpoints_.clear();

        if (auto adv = transport_.StartAdvertising(local_name_); !adv)
        {
            StopRadios();
            phase_ = ConnectionPhase::Idle;
            ARN_LOG_WARN("Coordinator", "advertising refused: {}", error::describe(adv.error()));
            return std::unexpected(ConnectError{adv.error()});
        }

        if (auto disc = transport_.StartDiscovery(local_name_); !disc)
        {
            StopRadios();
            phase_ = ConnectionPhase::Idle;
            ARN_LOG_WARN("Coordinator", "discovery refused: {}", error::describe(disc.error()));
            return std::unexpected(ConnectError{disc.error()});
        }

        phase_ = ConnectionPhase::AutoDiscovering;
        Record(ConnectionEventKind::DiscoveryStarted, {}, local_name_);
        ARN_LOG_INFO("Coordinator", "auto-discovery started as '{}'", local_name_);
        return {};
    }

    auto ConnectionCoordinator::ConnectToEndpoint(EndpointId const& id) -> std::expected<void, ConnectError>
    {
        if (connection_.has_value())
        {
            return std::unexpected(ConnectError{
                error::StateViolation{error::StateViolationCode::AlreadyConnected}
                    .with_connection(phase_)
                    .with_detail(std::format("requested {}", id))
            });
        }

        auto it = std::ranges::find(endpoints_, id, &PeerEndpoint::id);
        if (it == endpoints_.end())
        {
            return std::unexpected(ConnectError{
                error::StateViolation{error::StateViolationCode::UnknownEndpoint}
                    .with_connection(phase_)
                    .with_detail(id)
            });
        }

        Connection c{};
        c.peer_id = id;
        c.peer_name = it->name;
        c.status = LinkStatus::Connecting;
        c.authoritative = false;
        connection_ = std::move(c);
        phase_ = ConnectionPhase::Connecting;
        Record(ConnectionEventKind::ConnectionAttempt, id);

        if (auto req = transport_.RequestConnection(id, local_name_); !req)
        {
            Record(ConnectionEventKind::ConnectionFailed, id, error::describe(req.error()));
            connection_.reset();
            phase_ = ConnectionPhase::AutoDiscovering;
            return std::unexpected(ConnectError{req.error()});
        }

        ARN_LOG_INFO("Coordinator", "requested connection to {} ({})", id, it->name);
        return {};
    }

    auto ConnectionCoordinator::Disconnect() -> void
    {
        if (!connection_.has_value()
            && (phase_ == ConnectionPhase::Idle || phase_ == ConnectionPhase::Disconnected))
        {
            return;
        }

        bool const had_link = connection_.has_value();
        if (had_link)
        {
            EndpointId const peer = connection_->peer_id;
            transport_.DisconnectFromEndpoint(peer);
            Record(ConnectionEventKind::Disconnected, peer, "local request");
            connection_.reset();
        }

        StopRadios();
        endpoints_.clear();
        phase_ = had_link ? ConnectionPhase::Disconnected : ConnectionPhase::Idle;
        ARN_LOG_INFO("Coordinator", "disconnected");
    }

    auto ConnectionCoordinator::OnEndpointFound(arena::net::EndpointInfo const& ep) -> void
    {
        if (phase_ != ConnectionPhase::AutoDiscovering && phase_ != ConnectionPhase::Connecting)
        {
            return;
        }

        auto it = std::ranges::find(endpoints_, ep.id, &PeerEndpoint::id);
        if (it != endpoints_.end())
        {
            it->name = ep.name;
            return;
        }

        endpoints_.push_back(PeerEndpoint{ep.id, ep.name, std::chrono::system_clock::now()});
        Record(ConnectionEventKind::EndpointFound, ep.id, ep.name);
        ARN_LOG_INFO("Coordinator", "found {} ({})", ep.id, ep.name);
    }

    auto ConnectionCoordinator::OnEndpointLost(EndpointId const& id) -> void
    {
        auto const removed = std::erase_if(endpoints_, [&](PeerEndpoint const& p) { return p.id == id; });
        if (removed > 0)
        {
            Record(ConnectionEventKind::EndpointLost, id);
            ARN_LOG_INFO("Coordinator", "lost {}", id);
        }
    }

    auto ConnectionCoordinator::OnConnectionInitiated(EndpointId const& id, std::string const& name, bool incoming) -> bool
    {
        bool const ours = connection_.has_value()
            && connection_->peer_id == id
            && connection_->status == LinkStatus::Connecting
            && !incoming;

        if (connection_.has_value() && !ours)
        {
            ARN_LOG_INFO("Coordinator", "rejecting {} ({}): already linked to {}", id, name, connection_->peer_id);
            if (auto r = transport_.RejectConnection(id); !r)
            {
                ARN_LOG_WARN("Coordinator", "reject failed: {}", error::describe(r.error()));
            }
            return false;
        }

        if (phase_ != ConnectionPhase::AutoDiscovering && phase_ != ConnectionPhase::Connecting)
        {
            ARN_LOG_INFO("Coordinator", "rejecting {} ({}): not discovering", id, name);
            if (auto r = transport_.RejectConnection(id); !r)
            {
                ARN_LOG_WARN("Coordinator", "reject failed: {}", error::describe(r.error()));
            }
            return false;
        }

        if (!ours)
        {
            Connection c{};
            c.peer_id = id;
            c.peer_name = name;
            c.status = LinkStatus::Connecting;
            // whoever accepts an incoming request resolves battles for this link
            c.authoritative = incoming;
            connection_ = std::move(c);
            Record(ConnectionEventKind::ConnectionAttempt, id, "incoming");
        }
        else if (!name.empty())
        {
            connection_->peer_name = name;
        }

        phase_ = ConnectionPhase::Connecting;

        if (auto acc = transport_.AcceptConnection(id); !acc)
        {
            Record(ConnectionEventKind::ConnectionFailed, id, error::describe(acc.error()));
            connection_.reset();
            phase_ = ConnectionPhase::AutoDiscovering;
            ARN_LOG_WARN("Coordinator", "accept failed: {}", error::describe(acc.error()));
            return false;
        }
        return true;
    }

    auto ConnectionCoordinator::OnConnectionResult(EndpointId const& id, bool success) -> std::optional<Connection>
    {
        if (!connection_.has_value() || connection_->peer_id != id || connection_->status != LinkStatus::Connecting)
        {
            ARN_LOG_DEBUG("Coordinator", "ignoring stale connection result for {}", id);
            return std::nullopt;
        }

        if (!success)
        {
            Record(ConnectionEventKind::ConnectionFailed, id, "rejected");
            connection_.reset();
            // keep trying: back to discovering, not idle
            phase_ = ConnectionPhase::AutoDiscovering;
            ARN_LOG_INFO("Coordinator", "connection to {} failed, still discovering", id);
            return std::nullopt;
        }

        connection_->status = LinkStatus::Connected;
        connection_->established_at = std::chrono::system_clock::now();
        connection_->number = ++connection_count_;
        connection_->previous_peer_id = last_peer_id_;
        last_peer_id_ = id;

        if (connection_->IsReconnection())
        {
            Record(ConnectionEventKind::ReconnectionDetected, id, *connection_->previous_peer_id);
        }
        Record(ConnectionEventKind::ConnectionSuccess, id, connection_->authoritative ? "authoritative" : "follower");

        std::erase_if(endpoints_, [&](PeerEndpoint const& p) { return p.id == id; });
        StopRadios();
        phase_ = ConnectionPhase::Connected;

        ARN_LOG_INFO("Coordinator", "connected to {} ({}) #{}{}", id, connection_->peer_name, connection_->number,
                     connection_->authoritative ? " [authoritative]" : "");
        return connection_;
    }

    auto ConnectionCoordinator::OnDisconnected(EndpointId const& id) -> bool
    {
        if (!connection_.has_value() || connection_->peer_id != id)
        {
            return false;
        }

        Record(ConnectionEventKind::Disconnected, id, "link lost");
        connection_.reset();
        endpoints_.clear();
        StopRadios();
        phase_ = ConnectionPhase::Disconnected;
        ARN_LOG_WARN("Coordinator", "link to {} lost", id);
        return true;
    }
}
