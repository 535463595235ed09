//
// BattleManager.cpp
//

#include "BattleManager.hpp"

#include <format>
#include <span>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

#include "debug/AuditLogger.hpp"
#include "net/codec.hpp"

namespace arena::core
{
    BattleManager::BattleManager(arena::net::TransportAdapter& transport,
                                 Executor& exec,
                                 SessionConfig cfg,
                                 std::unique_ptr<ImageSink> sink)
        : transport_{transport}
          , exec_{exec}
          , cfg_{std::move(cfg)}
          , sink_{sink ? std::move(sink) : std::make_unique<FileImageSink>(cfg_.image_dir)}
          , coordinator_{transport}
          , battle_{exec, cfg_, MakeHooks()}
    {
        log::SetLevel(cfg_.log_level);

        if (cfg_.audit_path)
        {
            audit_ = std::make_unique<debug::AuditLogger>(*cfg_.audit_path);
            if (!audit_->is_open())
            {
                ARN_LOG_WARN("Manager", "cannot open audit file {}", cfg_.audit_path->string());
                audit_.reset();
            }
        }

        auto snap = std::make_shared<SessionSnapshot>();
        battle_.Fill(*snap);
        snapshot_ = std::move(snap);

        transport_.SetListener(this);
    }

    BattleManager::~BattleManager()
    {
        transport_.SetListener(nullptr);
        exec_.Shutdown();
        Teardown();
    }

    auto BattleManager::MakeHooks() -> BattleHooks
    {
        BattleHooks h{};
        h.send = [this](Message const& m) { SendMessage(m); };
        h.send_image = [this](CardInfo const& c) { SendImage(c); };
        h.changed = [this] { MarkDirty(); };
        h.phase_changed = [this](BattlePhase from, BattlePhase to)
        {
            if (audit_)
            {
                audit_->phase(from, to);
                if (to == BattlePhase::Complete && battle_.Result())
                {
                    audit_->result(*battle_.Result());
                }
            }
        };
        h.session_reset = [this]
        {
            // a stale blob must never attach to the next session's card
            payloads_.Purge();
        };
        return h;
    }

    // ---------- snapshot publication ----------

    auto BattleManager::MarkDirty() -> void
    {
        if (flush_pending_)
        {
            return;
        }
        flush_pending_ = true;
        exec_.Post([this]
        {
            flush_pending_ = false;
            Publish();
        });
    }

    auto BattleManager::Publish() -> void
    {
        auto snap = std::make_shared<SessionSnapshot>();
        battle_.Fill(*snap);
        snap->version = ++version_;
        snap->connection_phase = coordinator_.Phase();
        snap->endpoints = coordinator_.Endpoints();
        snap->connection = coordinator_.ActiveConnection();
        snap->transport_error = transport_error_;

        SnapshotPtr const published = std::move(snap);
        std::vector<Observer> to_call;
        {
            std::lock_guard<std::mutex> lock(state_mx_);
            snapshot_ = published;
            to_call.reserve(observers_.size());
            for (auto const& [token, obs] : observers_)
            {
                to_call.push_back(obs);
            }
        }

        for (Observer const& obs : to_call)
        {
            obs(published);
        }
    }

    auto BattleManager::Snapshot() const -> SnapshotPtr
    {
        std::lock_guard<std::mutex> lock(state_mx_);
        return snapshot_;
    }

    auto BattleManager::Subscribe(Observer obs) -> std::uint64_t
    {
        std::lock_guard<std::mutex> lock(state_mx_);
        std::uint64_t const token = next_observer_++;
        observers_.emplace(token, std::move(obs));
        return token;
    }

    auto BattleManager::Unsubscribe(std::uint64_t token) -> void
    {
        std::lock_guard<std::mutex> lock(state_mx_);
        observers_.erase(token);
    }

    auto BattleManager::Absorb(error::StateViolation const& v, std::string_view command) -> void
    {
        ARN_LOG_DEBUG("Manager", "{} ignored: {}", command, error::describe(v));
        if (audit_)
        {
            audit_->dropped(std::format("{}: {}", command, error::describe(v)));
        }
    }

    // ---------- commands ----------

    auto BattleManager::StartAutoDiscovery(std::string local_name) -> void
    {
        exec_.Post([this, name = std::move(local_name)]
        {
            std::string const wanted = name.empty() ? cfg_.local_name : name;
            if (auto r = coordinator_.StartAutoDiscovery(wanted); !r)
            {
                // already linked: a stray tap, not a radio failure
                if (auto const* sv = std::get_if<error::StateViolation>(&r.error()))
                {
                    Absorb(*sv, "startAutoDiscovery");
                    return;
                }
                transport_error_ = error::describe(std::get<error::TransportError>(r.error()));
                battle_.AddActivity(std::format("Could not start discovery: {}", *transport_error_));
                MarkDirty();
                return;
            }

            transport_error_.reset();
            if (auto r = battle_.OnDiscoveryStarted(); !r)
            {
                Absorb(r.error(), "startAutoDiscovery");
            }
            MarkDirty();
        });
    }

    auto BattleManager::ConnectToEndpoint(EndpointId id) -> void
    {
        exec_.Post([this, id = std::move(id)]
        {
            if (auto r = coordinator_.ConnectToEndpoint(id); !r)
            {
                if (auto const* te = std::get_if<error::TransportError>(&r.error()))
                {
                    transport_error_ = error::describe(*te);
                    ARN_LOG_WARN("Manager", "connect to {} failed: {}", id, *transport_error_);
                }
                else
                {
                    Absorb(std::get<error::StateViolation>(r.error()), "connectToEndpoint");
                }
            }
            MarkDirty();
        });
    }

    auto BattleManager::SelectCard(CardInfo card) -> void
    {
        exec_.Post([this, card = std::move(card)]
        {
            if (auto r = battle_.SelectCard(card); !r)
            {
                Absorb(r.error(), "selectCard");
            }
        });
    }

    auto BattleManager::SetReady() -> void
    {
        exec_.Post([this]
        {
            if (auto r = battle_.SetReady(); !r)
            {
                Absorb(r.error(), "setReady");
            }
        });
    }

    auto BattleManager::SkipAnimation() -> void
    {
        exec_.Post([this]
        {
            if (auto r = battle_.SkipAnimation(); !r)
            {
                Absorb(r.error(), "skipAnimation");
            }
        });
    }

    auto BattleManager::Rematch() -> void
    {
        exec_.Post([this]
        {
            if (auto r = battle_.Rematch(); !r)
            {
                Absorb(r.error(), "rematch");
            }
        });
    }

    auto BattleManager::StopAll() -> void
    {
        exec_.Post([this]
        {
            Teardown();
            MarkDirty();
        });
    }

    auto BattleManager::Teardown() -> void
    {
        if (coordinator_.IsConnected())
        {
            SendMessage(DisconnectMsg{"peer left"});
            if (audit_)
            {
                audit_->end("local stop");
            }
        }
        coordinator_.Disconnect();
        battle_.Stop();
        payloads_.Purge();
        ResetCounters();
    }

    auto BattleManager::ResetCounters() -> void
    {
        next_msg_id_ = 1;
        last_inbound_id_ = 0;
    }

    // ---------- outbound ----------

    auto BattleManager::SendMessage(Message const& msg) -> void
    {
        auto const& link = coordinator_.ActiveConnection();
        if (!link || link->status != LinkStatus::Connected)
        {
            ARN_LOG_DEBUG("Manager", "not connected, dropping outbound {}", MessageName(msg));
            return;
        }

        std::uint64_t const id = next_msg_id_++;
        std::vector<std::uint8_t> const bytes = net::Encode(msg, id);

        if (auto r = transport_.SendBytes(link->peer_id, bytes); !r)
        {
            ARN_LOG_WARN("Manager", "send {} failed: {}", MessageName(msg), error::describe(r.error()));
            return;
        }
        ARN_LOG_TRACE("Manager", "sent #{} {}", id, MessageName(msg));
        if (audit_)
        {
            audit_->sent(id, msg);
        }
    }

    auto BattleManager::SendImage(CardInfo const& card) -> void
    {
        auto const& link = coordinator_.ActiveConnection();
        if (!link || !card.image_path)
        {
            return;
        }

        std::error_code ec;
        std::uintmax_t const size = std::filesystem::file_size(*card.image_path, ec);
        if (ec)
        {
            ARN_LOG_WARN("Manager", "card art {} unreadable: {}", card.image_path->string(), ec.message());
            return;
        }

        auto payload = transport_.SendFile(link->peer_id, *card.image_path);
        if (!payload)
        {
            ARN_LOG_WARN("Manager", "image send failed: {}", error::describe(payload.error()));
            return;
        }

        SendMessage(ImageTransferMetaMsg{
            *payload, card.id, card.image_path->filename().string(), static_cast<std::uint64_t>(size)
        });
    }

    // ---------- inbound ----------

    auto BattleManager::HandleBytes(EndpointId const& from, std::vector<std::uint8_t> const& bytes) -> void
    {
        auto const& link = coordinator_.ActiveConnection();
        if (!link || link->peer_id != from || link->status != LinkStatus::Connected)
        {
            ARN_LOG_DEBUG("Manager", "bytes from {} outside a connection", from);
            return;
        }

        auto decoded = net::Decode(std::span<std::uint8_t const>{bytes});
        if (!decoded)
        {
            ARN_LOG_WARN("Manager", "undecodable message from {}: {}", from, decoded.error().message);
            if (audit_)
            {
                audit_->dropped(std::format("parse: {}", decoded.error().message));
            }
            return;
        }

        if (decoded->msg_id <= last_inbound_id_)
        {
            ARN_LOG_DEBUG("Manager", "duplicate message #{} dropped", decoded->msg_id);
            return;
        }
        last_inbound_id_ = decoded->msg_id;

        Message const& msg = decoded->message;
        if (audit_)
        {
            audit_->received(decoded->msg_id, msg);
        }

        if (auto const* meta = std::get_if<ImageTransferMetaMsg>(&msg))
        {
            HandlePayloadOutcome(payloads_.OnMetadata(*meta));
            return;
        }
        if (auto const* bye = std::get_if<DisconnectMsg>(&msg))
        {
            HandleLinkLost(from, bye->reason);
            transport_.DisconnectFromEndpoint(from);
            return;
        }
        battle_.OnMessage(msg);
    }

    auto BattleManager::HandleTransferDone(PayloadId payload, arena::net::TransferStatus status) -> void
    {
        using arena::net::TransferStatus;

        if (status == TransferStatus::InProgress)
        {
            return;
        }

        if (status != TransferStatus::Success)
        {
            if (payloads_.TakeIncomingFile(payload))
            {
                error::PayloadError const e = payloads_.OnTransferFailed(payload);
                ARN_LOG_WARN("Manager", "{}", error::describe(e));
                if (audit_)
                {
                    audit_->dropped(error::describe(e));
                }
            }
            return;
        }

        // only a terminal Success may read the file
        std::optional<std::filesystem::path> path = payloads_.TakeIncomingFile(payload);
        if (!path)
        {
            // our own outbound transfer finishing
            ARN_LOG_TRACE("Manager", "payload {} finished", payload);
            return;
        }

        auto bytes = ReadCompletedFile(payload, *path);
        if (!bytes)
        {
            ARN_LOG_WARN("Manager", "{}", error::describe(bytes.error()));
            return;
        }
        HandlePayloadOutcome(payloads_.OnDataComplete(payload, std::move(*bytes)));
    }

    auto BattleManager::HandlePayloadOutcome(PayloadTransferManager::Outcome outcome) -> void
    {
        if (!outcome)
        {
            ARN_LOG_WARN("Manager", "image discarded: {}", error::describe(outcome.error()));
            if (audit_)
            {
                audit_->dropped(error::describe(outcome.error()));
            }
            return;
        }
        if (!outcome->has_value())
        {
            return;
        }

        FinalizedTransfer const& done = **outcome;
        auto stored = sink_->Store(done.card_id, done.file_name, done.bytes);
        if (!stored)
        {
            error::PayloadError e = stored.error();
            e.payload_id = done.payload_id;
            ARN_LOG_WARN("Manager", "image discarded: {}", error::describe(e));
            return;
        }

        ARN_LOG_DEBUG("Manager", "card {} art stored at {}", done.card_id, stored->string());

        // completion goes back through the queue before it touches the session
        std::uint64_t const gen = battle_.Generation();
        exec_.Post([this, gen, card = done.card_id, path = std::move(*stored)]() mutable
        {
            if (gen != battle_.Generation())
            {
                ARN_LOG_DEBUG("Manager", "card {} art belongs to an earlier session", card);
                return;
            }
            battle_.OnOpponentImageReady(card, std::move(path));
        });
    }

    auto BattleManager::HandleLinkLost(EndpointId const& id, std::string_view reason) -> void
    {
        if (!coordinator_.OnDisconnected(id))
        {
            return;
        }
        transport_error_ = std::format("connection lost: {}", reason);
        if (audit_)
        {
            audit_->end(reason);
        }
        battle_.OnConnectionLost();
        payloads_.Purge();
        ResetCounters();
        MarkDirty();
    }

    // ---------- TransportListener ----------

    auto BattleManager::OnEndpointFound(arena::net::EndpointInfo const& ep) -> void
    {
        exec_.Post([this, ep]
        {
            coordinator_.OnEndpointFound(ep);
            MarkDirty();
        });
    }

    auto BattleManager::OnEndpointLost(EndpointId const& id) -> void
    {
        exec_.Post([this, id]
        {
            coordinator_.OnEndpointLost(id);
            MarkDirty();
        });
    }

    auto BattleManager::OnConnectionInitiated(EndpointId const& id, std::string const& name, bool incoming) -> void
    {
        exec_.Post([this, id, name, incoming]
        {
            coordinator_.OnConnectionInitiated(id, name, incoming);
            MarkDirty();
        });
    }

    auto BattleManager::OnConnectionResult(EndpointId const& id, bool success) -> void
    {
        exec_.Post([this, id, success]
        {
            std::optional<Connection> const link = coordinator_.OnConnectionResult(id, success);
            if (!link)
            {
                if (!success)
                {
                    battle_.AddActivity("Connection failed, still searching...");
                }
                MarkDirty();
                return;
            }

            ResetCounters();
            transport_error_.reset();

            if (auto r = battle_.OnConnected(link->authoritative); !r)
            {
                // nobody is waiting for this link any more
                Absorb(r.error(), "connectionResult");
                coordinator_.Disconnect();
                MarkDirty();
                return;
            }

            if (link->IsReconnection())
            {
                battle_.AddActivity(std::format("Reconnected with a new opponent: {}", link->peer_name));
            }
            if (audit_)
            {
                audit_->start(battle_.SessionId(), coordinator_.LocalName(), *link);
            }
            MarkDirty();
        });
    }

    auto BattleManager::OnDisconnected(EndpointId const& id) -> void
    {
        exec_.Post([this, id]
        {
            HandleLinkLost(id, "transport disconnect");
        });
    }

    auto BattleManager::OnBytesReceived(EndpointId const& id, std::vector<std::uint8_t> bytes) -> void
    {
        exec_.Post([this, id, bytes = std::move(bytes)]
        {
            HandleBytes(id, bytes);
        });
    }

    auto BattleManager::OnFileReceived(EndpointId const& id, PayloadId payload, std::filesystem::path const& path) -> void
    {
        exec_.Post([this, id, payload, path]
        {
            auto const& link = coordinator_.ActiveConnection();
            if (!link || link->peer_id != id)
            {
                return;
            }
            // may still be incomplete; wait for the terminal status
            payloads_.NoteIncomingFile(payload, path);
        });
    }

    auto BattleManager::OnTransferProgress(EndpointId const& id,
                                           PayloadId payload,
                                           arena::net::TransferStatus status,
                                           std::uint64_t bytes_transferred,
                                           std::uint64_t total_bytes) -> void
    {
        ARN_LOG_TRACE("Manager", "payload {} from {}: {} {}/{}", payload, id,
                      arena::net::ToString(status), bytes_transferred, total_bytes);
        if (status == arena::net::TransferStatus::InProgress)
        {
            return;
        }
        exec_.Post([this, payload, status]
        {
            HandleTransferDone(payload, status);
        });
    }
}
