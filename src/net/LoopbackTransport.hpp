//
// LoopbackTransport.hpp: two linked in-process transports
//

#ifndef CARDARENA_LOOPBACKTRANSPORT_HPP
#define CARDARENA_LOOPBACKTRANSPORT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "Transport.hpp"

namespace arena::net
{
    class LoopbackTransport;

    struct LoopbackPair
    {
        std::shared_ptr<LoopbackTransport> first;
        std::shared_ptr<LoopbackTransport> second;
    };

    // Creates two stations sharing one simulated radio medium. Every callback is
    // delivered synchronously on the thread that caused it, never under a lock.
    //
    // Received files land in `inbox_root/<station id>/`.
    auto CreateLoopbackPair(EndpointId first_id,
                            EndpointId second_id,
                            std::filesystem::path inbox_root) -> LoopbackPair;

    class LoopbackTransport final : public TransportAdapter
    {
        friend auto CreateLoopbackPair(EndpointId, EndpointId, std::filesystem::path) -> LoopbackPair;

    public:
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

        // --- test controls ---

        [[nodiscard]] auto Id() const -> EndpointId const&;

        // Disabled radio refuses advertising and discovery.
        auto SetRadioEnabled(bool enabled) -> void;

        // While stalled, outgoing files stop half-written after the "file received"
        // notice; the rest and the terminal Success wait for FlushFiles().
        auto SetStallFiles(bool stall) -> void;
        auto FlushFiles() -> std::size_t;

        // Fails the next outgoing file with a terminal Failure status.
        auto FailNextFile() -> void;

        // Simulates loss of the radio link: both sides see OnDisconnected.
        auto DropLink() -> void;

        [[nodiscard]] auto IsLinked() const -> bool;

    private:
        using Event = std::function<void()>;

        struct StalledFile
        {
            PayloadId payload{};
            std::filesystem::path target;
            std::vector<std::uint8_t> bytes;
        };

        struct Station
        {
            EndpointId id;
            std::string name;
            std::filesystem::path inbox;
            TransportListener* listener{nullptr};
            bool radio{true};
            bool advertising{false};
            bool discovering{false};
            bool accepted{false};
            bool stall_files{false};
            bool fail_next_file{false};
            std::vector<StalledFile> stalled;
        };

        struct Medium
        {
            std::mutex m;
            std::array<Station, 2> st;
            bool pending{false};
            bool linked{false};
            PayloadId next_payload{1};
        };

        LoopbackTransport(std::shared_ptr<Medium> medium, std::size_t index);

        auto Self() -> Station& { return medium_->st[index_]; }
        auto Peer() -> Station& { return medium_->st[1 - index_]; }

        static auto Run(std::vector<Event>& events) -> void;

        std::shared_ptr<Medium> medium_;
        std::size_t index_;
    };
}

#endif //CARDARENA_LOOPBACKTRANSPORT_HPP
