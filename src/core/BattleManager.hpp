//
// BattleManager.hpp: facade over the connection, payload and battle components
//

#ifndef CARDARENA_BATTLEMANAGER_HPP
#define CARDARENA_BATTLEMANAGER_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "BattleStateMachine.hpp"
#include "ConnectionCoordinator.hpp"
#include "Exception.hpp"
#include "Executor.hpp"
#include "Messages.hpp"
#include "PayloadTransferManager.hpp"
#include "State.hpp"
#include "Types.hpp"
#include "net/Transport.hpp"

namespace arena::core::debug
{
    class AuditLogger;
    struct Inspector;
}

namespace arena::core
{
    using SnapshotPtr = std::shared_ptr<SessionSnapshot const>;
    using Observer = std::function<void(SnapshotPtr const&)>;

    // Every transport callback and every command is posted onto `exec`; nothing here
    // runs concurrently with anything else here. Public methods are thread-safe.
    //
    // `exec` and `transport` must outlive the manager. The destructor detaches from the
    // transport and shuts `exec` down before tearing the session down.
    class BattleManager final : public arena::net::TransportListener
    {
    public:
        BattleManager(arena::net::TransportAdapter& transport,
                      Executor& exec,
                      SessionConfig cfg,
                      std::unique_ptr<ImageSink> sink = nullptr);
        ~BattleManager() override;

        BattleManager(BattleManager const&) = delete;
        auto operator=(BattleManager const&) -> BattleManager& = delete;

        // --- commands (UI) ---

        auto StartAutoDiscovery(std::string local_name = {}) -> void;
        auto ConnectToEndpoint(EndpointId id) -> void;
        auto SelectCard(CardInfo card) -> void;
        auto SetReady() -> void;
        auto SkipAnimation() -> void;
        auto Rematch() -> void;
        // Always safe, any phase, any number of times.
        auto StopAll() -> void;

        // --- observable state ---

        [[nodiscard]]
        auto Snapshot() const -> SnapshotPtr;

        // Observers run on the processing context; they must not block.
        auto Subscribe(Observer obs) -> std::uint64_t;
        auto Unsubscribe(std::uint64_t token) -> void;

        // --- TransportListener (any thread) ---

        auto OnEndpointFound(arena::net::EndpointInfo const& ep) -> void override;
        auto OnEndpointLost(EndpointId const& id) -> void override;
        auto OnConnectionInitiated(EndpointId const& id, std::string const& name, bool incoming) -> void override;
        auto OnConnectionResult(EndpointId const& id, bool success) -> void override;
        auto OnDisconnected(EndpointId const& id) -> void override;
        auto OnBytesReceived(EndpointId const& id, std::vector<std::uint8_t> bytes) -> void override;
        auto OnFileReceived(EndpointId const& id, PayloadId payload, std::filesystem::path const& path) -> void override;
        auto OnTransferProgress(EndpointId const& id,
                                PayloadId payload,
                                arena::net::TransferStatus status,
                                std::uint64_t bytes_transferred,
                                std::uint64_t total_bytes) -> void override;

    private:
        friend struct debug::Inspector;

        auto MakeHooks() -> BattleHooks;

        auto MarkDirty() -> void;
        auto Publish() -> void;

        auto Absorb(error::StateViolation const& v, std::string_view command) -> void;

        auto SendMessage(Message const& msg) -> void;
        auto SendImage(CardInfo const& card) -> void;

        auto HandleBytes(EndpointId const& from, std::vector<std::uint8_t> const& bytes) -> void;
        auto HandleTransferDone(PayloadId payload, arena::net::TransferStatus status) -> void;
        auto HandlePayloadOutcome(PayloadTransferManager::Outcome outcome) -> void;
        auto HandleLinkLost(EndpointId const& id, std::string_view reason) -> void;
        auto ResetCounters() -> void;

        auto Teardown() -> void;

        arena::net::TransportAdapter& transport_;
        Executor& exec_;
        SessionConfig cfg_;
        std::unique_ptr<ImageSink> sink_;
        std::unique_ptr<debug::AuditLogger> audit_;

        // --- owned by the processing context ---
        ConnectionCoordinator coordinator_;
        PayloadTransferManager payloads_;
        BattleStateMachine battle_;

        std::uint64_t next_msg_id_{1};
        std::uint64_t last_inbound_id_{};
        std::uint64_t version_{};
        bool flush_pending_{false};
        std::optional<std::string> transport_error_{};

        // --- shared with callers ---
        mutable std::mutex state_mx_;
        SnapshotPtr snapshot_;
        std::map<std::uint64_t, Observer> observers_;
        std::uint64_t next_observer_{1};
    };
}

#endif //CARDARENA_BATTLEMANAGER_HPP
