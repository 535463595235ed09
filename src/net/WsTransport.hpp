//
// WsTransport.hpp: TransportAdapter over WebSocket++ (no TLS)
//

#ifndef CARDARENA_WSTRANSPORT_HPP
#define CARDARENA_WSTRANSPORT_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/server.hpp>
#include <websocketpp/client.hpp>

#include "Transport.hpp"

namespace arena::net
{
    // A peer this station may connect to. Discovery reports every roster entry.
    struct RosterEntry
    {
        EndpointId id;
        std::string name;
        std::string url;   // ws://host:port
    };

    struct WsOptions
    {
        EndpointId local_id;
        std::uint16_t port{9002};           // 0 picks a free port
        std::string bind_address;           // empty listens on every interface
        std::vector<RosterEntry> roster;
        std::filesystem::path inbox{"inbox"};
        std::size_t chunk_size{64 * 1024};
    };

    // Wire frames, first byte is the tag:
    //   HELLO      01 <id> 00 <name>
    //   ACCEPT     02
    //   REJECT     03
    //   BYTES      10 <payload>
    //   FILE_BEGIN 20 <payload id:u64le> <total:u64le>
    //   CHUNK      21 <payload id:u64le> <data>
    //   FILE_END   22 <payload id:u64le>
    //
    // At most one peer link exists at a time. All listener callbacks run on the
    // network thread.
    class WsTransport final : public TransportAdapter
    {
    public:
        explicit WsTransport(WsOptions opts);
        ~WsTransport() override;

        WsTransport(WsTransport const&) = delete;
        auto operator=(WsTransport const&) -> WsTransport& = delete;

        auto SetListener(TransportListener* listener) -> void override;

        auto StartAdvertising(std::string const& name) -> TransportResult override;
        auto StartDiscovery(std::string const& name) -> TransportResult override;
        auto StopAdvertising() -> void override;
        auto StopDiscovery() -> void override;

        auto RequestConnection(EndpointId const& id, std::string const& local_name) -> TransportResult override;
        auto AcceptConnection(EndpointId const& id) -> TransportResult override;
        auto RejectConnection(EndpointId const& id) -> TransportResult override;

        auto SendBytes(EndpointId const& id, std::span<std::uint8_t const> bytes) -> TransportResult override;
        auto SendFile(EndpointId const& id, std::filesystem::path const& path)
            -> std::expected<PayloadId, TransportError> override;

        auto DisconnectFromEndpoint(EndpointId const& id) -> void override;
        auto StopAll() -> void override;

        // Port actually bound while advertising, 0 otherwise.
        [[nodiscard]] auto ListeningPort() -> std::uint16_t;

    private:
        using WsServer = websocketpp::server<websocketpp::config::asio>;
        using WsClient = websocketpp::client<websocketpp::config::asio_client>;
        using Hdl = websocketpp::connection_hdl;

        enum class FrameTag : std::uint8_t
        {
            Hello = 0x01,
            Accept = 0x02,
            Reject = 0x03,
            Bytes = 0x10,
            FileBegin = 0x20,
            Chunk = 0x21,
            FileEnd = 0x22
        };

        struct Link
        {
            Hdl hdl;
            bool outgoing{false};
            bool open{false};
            EndpointId peer_id;
            std::string peer_name;
            bool local_accepted{false};
            bool remote_accepted{false};
            bool established{false};
        };

        struct Incoming
        {
            std::filesystem::path path;
            std::ofstream out;
            std::uint64_t total{};
            std::uint64_t received{};
        };

        auto OnOpen(Hdl hdl, bool outgoing) -> void;
        auto OnClose(Hdl hdl) -> void;
        auto OnFrame(Hdl hdl, std::string const& payload) -> void;

        auto HandleHello(Hdl hdl, std::string_view body) -> void;
        auto HandleAccept() -> void;
        auto HandleReject() -> void;
        auto HandleFileBegin(std::string_view body) -> void;
        auto HandleChunk(std::string_view body) -> void;
        auto HandleFileEnd(std::string_view body) -> void;

        auto SendFrameLocked(FrameTag tag, std::span<std::uint8_t const> body) -> TransportResult;
        auto CloseLocked(std::string const& reason) -> void;
        auto AbortIncomingLocked(EndpointId const& peer, std::vector<std::function<void()>>& events) -> void;
        auto IsLinkFor(EndpointId const& id) const -> bool;
        auto FindRoster(EndpointId const& id) const -> std::optional<RosterEntry>;

        WsOptions opts_;

        websocketpp::lib::asio::io_service io_;
        WsServer server_;
        WsClient client_;
        std::thread net_thr_;

        mutable std::mutex mx_;
        TransportListener* listener_{nullptr};
        std::string local_name_;
        bool advertising_{false};
        bool discovering_{false};
        std::optional<Link> link_;
        std::optional<RosterEntry> dialing_;
        std::map<PayloadId, Incoming> incoming_;
        PayloadId next_payload_{1};
    };
}

#endif //CARDARENA_WSTRANSPORT_HPP
