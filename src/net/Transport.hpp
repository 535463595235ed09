//
// Transport.hpp: peer-to-peer transport seam
//

#ifndef CARDARENA_TRANSPORT_HPP
#define CARDARENA_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/Exception.hpp"
#include "core/Types.hpp"

namespace arena::net
{
    using core::EndpointId;
    using core::PayloadId;
    using core::error::TransportError;
    using core::error::TransportResult;

    enum class TransferStatus : std::uint8_t
    {
        InProgress,
        Success,
        Failure,
        Canceled
    };

    inline auto ToString(TransferStatus s) -> std::string_view
    {
        switch (s)
        {
        case TransferStatus::InProgress: return "InProgress";
        case TransferStatus::Success: return "Success";
        case TransferStatus::Failure: return "Failure";
        case TransferStatus::Canceled: return "Canceled";
        }
        return "?";
    }

    struct EndpointInfo
    {
        EndpointId id;
        std::string name;
    };

    // Callbacks arrive on the transport's own thread(s), in no particular relation to the
    // consumer's thread. Implementations must never call them while holding their own locks.
    class TransportListener
    {
    public:
        virtual ~TransportListener() = default;

        virtual auto OnEndpointFound(EndpointInfo const& ep) -> void = 0;
        virtual auto OnEndpointLost(EndpointId const& id) -> void = 0;

        // incoming == the remote side asked us
        virtual auto OnConnectionInitiated(EndpointId const& id, std::string const& name, bool incoming) -> void = 0;
        virtual auto OnConnectionResult(EndpointId const& id, bool success) -> void = 0;
        virtual auto OnDisconnected(EndpointId const& id) -> void = 0;

        virtual auto OnBytesReceived(EndpointId const& id, std::vector<std::uint8_t> bytes) -> void = 0;

        // The file may still be growing; only a later Success status makes it complete.
        virtual auto OnFileReceived(EndpointId const& id, PayloadId payload, std::filesystem::path const& path) -> void = 0;

        virtual auto OnTransferProgress(EndpointId const& id,
                                        PayloadId payload,
                                        TransferStatus status,
                                        std::uint64_t bytes_transferred,
                                        std::uint64_t total_bytes) -> void = 0;
    };

    class TransportAdapter
    {
    public:
        virtual ~TransportAdapter() = default;

        // nullptr detaches
        virtual auto SetListener(TransportListener* listener) -> void = 0;

        virtual auto StartAdvertising(std::string const& name) -> TransportResult = 0;
        virtual auto StartDiscovery(std::string const& name) -> TransportResult = 0;
        virtual auto StopAdvertising() -> void = 0;
        virtual auto StopDiscovery() -> void = 0;

        virtual auto RequestConnection(EndpointId const& id, std::string const& local_name) -> TransportResult = 0;
        virtual auto AcceptConnection(EndpointId const& id) -> TransportResult = 0;
        virtual auto RejectConnection(EndpointId const& id) -> TransportResult = 0;

        virtual auto SendBytes(EndpointId const& id, std::span<std::uint8_t const> bytes) -> TransportResult = 0;
        virtual auto SendFile(EndpointId const& id, std::filesystem::path const& path)
            -> std::expected<PayloadId, TransportError> = 0;

        virtual auto DisconnectFromEndpoint(EndpointId const& id) -> void = 0;
        virtual auto StopAll() -> void = 0;
    };
}

#endif //CARDARENA_TRANSPORT_HPP
