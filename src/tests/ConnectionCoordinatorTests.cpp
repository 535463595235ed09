#include <gtest/gtest.h>
#include <format>
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "../core/ConnectionCoordinator.hpp"
#include "../net/Transport.hpp"

using namespace arena::core;
using arena::net::TransportAdapter;
using arena::net::TransportListener;

namespace
{
    // Records what the coordinator asks of the radio; never calls back on its own.
    class ScriptedTransport final : public TransportAdapter
    {
    public:
        bool radio_on{true};
        bool refuse_accept{false};
        bool advertising{false};
        bool discovering{false};
        std::vector<std::string> requested;
        std::vector<std::string> accepted;
        std::vector<std::string> rejected;
        std::vector<std::string> dropped;

        auto SetListener(TransportListener*) -> void override {}

        auto StartAdvertising(std::string const&) -> error::TransportResult override
        {
            if (!radio_on)
            {
                return std::unexpected(error::TransportError{error::TransportErrorCode::RadioDisabled, "off"});
            }
            advertising = true;
            return {};
        }

        auto StartDiscovery(std::string const&) -> error::TransportResult override
        {
            if (!radio_on)
            {
                return std::unexpected(error::TransportError{error::TransportErrorCode::RadioDisabled, "off"});
            }
            discovering = true;
            return {};
        }

        auto StopAdvertising() -> void override { advertising = false; }
        auto StopDiscovery() -> void override { discovering = false; }

        auto RequestConnection(EndpointId const& id, std::string const&) -> error::TransportResult override
        {
            requested.push_back(id);
            return {};
        }

        auto AcceptConnection(EndpointId const& id) -> error::TransportResult override
        {
            if (refuse_accept)
            {
                return std::unexpected(error::TransportError{error::TransportErrorCode::Io, "radio hiccup"});
            }
            accepted.push_back(id);
            return {};
        }

        auto RejectConnection(EndpointId const& id) -> error::TransportResult override
        {
            rejected.push_back(id);
            return {};
        }

        auto SendBytes(EndpointId const&, std::span<std::uint8_t const>) -> error::TransportResult override
        {
            return {};
        }

        auto SendFile(EndpointId const&, std::filesystem::path const&)
            -> std::expected<PayloadId, error::TransportError> override
        {
            return 1;
        }

        auto DisconnectFromEndpoint(EndpointId const& id) -> void override { dropped.push_back(id); }
        auto StopAll() -> void override {}
    };

    auto CountKind(ConnectionCoordinator const& c, ConnectionEventKind k) -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count(c.History(), k, &ConnectionEvent::kind));
    }

    // discovering, sees `id`, dials it and the peer accepts
    auto LinkOutgoing(ConnectionCoordinator& c, std::string const& id) -> std::optional<Connection>
    {
        c.OnEndpointFound({id, id + "-name"});
        EXPECT_TRUE(c.ConnectToEndpoint(id).has_value());
        EXPECT_TRUE(c.OnConnectionInitiated(id, id + "-name", false));
        return c.OnConnectionResult(id, true);
    }
}

TEST(ConnectionCoordinator, RadioOffStaysIdle)
{
    ScriptedTransport t;
    t.radio_on = false;
    ConnectionCoordinator c(t);

    auto r = c.StartAutoDiscovery("Alice");
    ASSERT_FALSE(r.has_value());
    auto const* te = std::get_if<error::TransportError>(&r.error());
    ASSERT_NE(te, nullptr);
    EXPECT_EQ(te->code, error::TransportErrorCode::RadioDisabled);
    EXPECT_EQ(c.Phase(), ConnectionPhase::Idle);
    EXPECT_FALSE(t.advertising);
    EXPECT_FALSE(t.discovering);

    // retry once the radio comes back
    t.radio_on = true;
    EXPECT_TRUE(c.StartAutoDiscovery("Alice").has_value());
    EXPECT_EQ(c.Phase(), ConnectionPhase::AutoDiscovering);
    EXPECT_TRUE(t.advertising && t.discovering);
}

TEST(ConnectionCoordinator, EmptyNameGetsPlaceholder)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);
    ASSERT_TRUE(c.StartAutoDiscovery("").has_value());
    EXPECT_TRUE(c.LocalName().starts_with("Player-"));
    EXPECT_EQ(c.LocalName().size(), std::string("Player-0000").size());
}

TEST(ConnectionCoordinator, FoundAndLostEndpoints)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);

    c.OnEndpointFound({"x", "ignored while idle"});
    EXPECT_TRUE(c.Endpoints().empty());

    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());
    c.OnEndpointFound({"b", "Bob"});
    c.OnEndpointFound({"b", "Bobby"});
    c.OnEndpointFound({"c", "Carol"});
    ASSERT_EQ(c.Endpoints().size(), 2u);
    EXPECT_EQ(c.Endpoints()[0].name, "Bobby");

    c.OnEndpointLost("b");
    c.OnEndpointLost("nobody");
    ASSERT_EQ(c.Endpoints().size(), 1u);
    EXPECT_EQ(c.Endpoints()[0].id, "c");
    EXPECT_EQ(CountKind(c, ConnectionEventKind::EndpointLost), 1u);
}

TEST(ConnectionCoordinator, HistoryKeepsTheLatestEvents)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);
    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());

    for (int i = 0; i < 500; ++i)
    {
        EndpointId const id = std::format("flaky-{}", i);
        c.OnEndpointFound({id, "Flaky"});
        c.OnEndpointLost(id);
    }

    ASSERT_EQ(c.History().size(), constants::MaxConnectionEvents);
    EXPECT_EQ(c.History().back().kind, ConnectionEventKind::EndpointLost);
    EXPECT_EQ(c.History().back().endpoint, "flaky-499");
    EXPECT_EQ(CountKind(c, ConnectionEventKind::DiscoveryStarted), 0u);
    EXPECT_TRUE(c.Endpoints().empty());
}

TEST(ConnectionCoordinator, ConnectToUnknownEndpoint)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);
    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());

    auto r = c.ConnectToEndpoint("ghost");
    ASSERT_FALSE(r.has_value());
    auto const* sv = std::get_if<error::StateViolation>(&r.error());
    ASSERT_NE(sv, nullptr);
    EXPECT_EQ(sv->code, error::StateViolationCode::UnknownEndpoint);
    EXPECT_TRUE(t.requested.empty());
    EXPECT_EQ(c.Phase(), ConnectionPhase::AutoDiscovering);
}

TEST(ConnectionCoordinator, OutgoingLinkIsNotAuthoritative)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);
    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());

    auto conn = LinkOutgoing(c, "bob");
    ASSERT_TRUE(conn.has_value());
    EXPECT_EQ(conn->peer_id, "bob");
    EXPECT_EQ(conn->number, 1u);
    EXPECT_FALSE(conn->authoritative);
    EXPECT_FALSE(c.IsAuthoritative());
    EXPECT_EQ(c.Phase(), ConnectionPhase::Connected);
    // radios go quiet once linked
    EXPECT_FALSE(t.advertising || t.discovering);
    EXPECT_TRUE(c.Endpoints().empty());
}

TEST(ConnectionCoordinator, IncomingLinkIsAuthoritative)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);
    ASSERT_TRUE(c.StartAutoDiscovery("Bob").has_value());

    EXPECT_TRUE(c.OnConnectionInitiated("alice", "Alice", true));
    ASSERT_EQ(t.accepted.size(), 1u);
    EXPECT_EQ(c.Phase(), ConnectionPhase::Connecting);

    auto conn = c.OnConnectionResult("alice", true);
    ASSERT_TRUE(conn.has_value());
    EXPECT_TRUE(conn->authoritative);
    EXPECT_TRUE(c.IsAuthoritative());
    EXPECT_EQ(conn->peer_name, "Alice");
}

TEST(ConnectionCoordinator, SecondLinkIsRejected)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);
    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());
    ASSERT_TRUE(LinkOutgoing(c, "bob").has_value());

    EXPECT_FALSE(c.OnConnectionInitiated("carol", "Carol", true));
    ASSERT_EQ(t.rejected.size(), 1u);
    EXPECT_EQ(t.rejected[0], "carol");
    EXPECT_EQ(c.ActiveConnection()->peer_id, "bob");

    auto again = c.ConnectToEndpoint("carol");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(std::get<error::StateViolation>(again.error()).code, error::StateViolationCode::AlreadyConnected);
}

TEST(ConnectionCoordinator, RequestWhileIdleIsRejected)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);
    EXPECT_FALSE(c.OnConnectionInitiated("alice", "Alice", true));
    EXPECT_EQ(t.rejected.size(), 1u);
    EXPECT_FALSE(c.ActiveConnection().has_value());
}

TEST(ConnectionCoordinator, FailedResultKeepsDiscovering)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);
    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());
    c.OnEndpointFound({"bob", "Bob"});
    ASSERT_TRUE(c.ConnectToEndpoint("bob").has_value());
    EXPECT_EQ(c.Phase(), ConnectionPhase::Connecting);

    EXPECT_FALSE(c.OnConnectionResult("bob", false).has_value());
    EXPECT_EQ(c.Phase(), ConnectionPhase::AutoDiscovering);
    EXPECT_FALSE(c.ActiveConnection().has_value());
    EXPECT_EQ(CountKind(c, ConnectionEventKind::ConnectionFailed), 1u);
    EXPECT_EQ(c.ConnectionCount(), 0u);
}

TEST(ConnectionCoordinator, AcceptRefusedByTransport)
{
    ScriptedTransport t;
    t.refuse_accept = true;
    ConnectionCoordinator c(t);
    ASSERT_TRUE(c.StartAutoDiscovery("Bob").has_value());

    EXPECT_FALSE(c.OnConnectionInitiated("alice", "Alice", true));
    EXPECT_FALSE(c.ActiveConnection().has_value());
    EXPECT_EQ(c.Phase(), ConnectionPhase::AutoDiscovering);
}

TEST(ConnectionCoordinator, StaleResultIsIgnored)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);
    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());
    EXPECT_FALSE(c.OnConnectionResult("nobody", true).has_value());
    EXPECT_EQ(c.Phase(), ConnectionPhase::AutoDiscovering);
}

TEST(ConnectionCoordinator, ReconnectionIsNumberedAndDetected)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);
    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());
    ASSERT_TRUE(LinkOutgoing(c, "bob").has_value());

    EXPECT_FALSE(c.OnDisconnected("someone-else"));
    EXPECT_TRUE(c.OnDisconnected("bob"));
    EXPECT_EQ(c.Phase(), ConnectionPhase::Disconnected);
    EXPECT_FALSE(c.IsConnected());

    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());
    auto second = LinkOutgoing(c, "carol");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->number, 2u);
    ASSERT_TRUE(second->previous_peer_id.has_value());
    EXPECT_EQ(*second->previous_peer_id, "bob");
    EXPECT_TRUE(second->IsReconnection());
    EXPECT_EQ(CountKind(c, ConnectionEventKind::ReconnectionDetected), 1u);
    EXPECT_EQ(CountKind(c, ConnectionEventKind::ConnectionSuccess), 2u);

    // same peer again is numbered but not a reconnection
    ASSERT_TRUE(c.OnDisconnected("carol"));
    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());
    auto third = LinkOutgoing(c, "carol");
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(third->number, 3u);
    EXPECT_FALSE(third->IsReconnection());
}

TEST(ConnectionCoordinator, DisconnectIsIdempotent)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);

    c.Disconnect();
    EXPECT_EQ(c.Phase(), ConnectionPhase::Idle);
    EXPECT_TRUE(c.History().empty());

    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());
    ASSERT_TRUE(LinkOutgoing(c, "bob").has_value());

    c.Disconnect();
    EXPECT_EQ(c.Phase(), ConnectionPhase::Disconnected);
    ASSERT_EQ(t.dropped.size(), 1u);
    std::size_t const events = c.History().size();

    c.Disconnect();
    EXPECT_EQ(t.dropped.size(), 1u);
    EXPECT_EQ(c.History().size(), events);
    EXPECT_EQ(c.Phase(), ConnectionPhase::Disconnected);
}

TEST(ConnectionCoordinator, StartWhileLinkedIsRefused)
{
    ScriptedTransport t;
    ConnectionCoordinator c(t);
    ASSERT_TRUE(c.StartAutoDiscovery("Alice").has_value());
    ASSERT_TRUE(LinkOutgoing(c, "bob").has_value());

    auto r = c.StartAutoDiscovery("Alice");
    ASSERT_FALSE(r.has_value());
    auto const* sv = std::get_if<error::StateViolation>(&r.error());
    ASSERT_NE(sv, nullptr);
    EXPECT_EQ(sv->code, error::StateViolationCode::AlreadyConnected);
    EXPECT_EQ(c.Phase(), ConnectionPhase::Connected);
}
