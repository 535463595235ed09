//
// WsTransport.cpp
//

#include "net/WsTransport.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include "core/Log.hpp"

namespace arena::net
{
    using core::error::TransportErrorCode;

    namespace
    {
        using Events = std::vector<std::function<void()>>;

        auto Fail(TransportErrorCode code, std::string msg = {}) -> std::unexpected<TransportError>
        {
            return std::unexpected(TransportError{code, std::move(msg)});
        }

        auto Run(Events& events) -> void
        {
            for (std::function<void()>& e : events)
            {
                e();
            }
            events.clear();
        }

        auto SameHdl(websocketpp::connection_hdl const& a, websocketpp::connection_hdl const& b) -> bool
        {
            return !a.owner_before(b) && !b.owner_before(a);
        }

        auto PutU64(std::vector<std::uint8_t>& out, std::uint64_t v) -> void
        {
            for (int i = 0; i < 8; ++i)
            {
                out.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
            }
        }

        auto GetU64(std::string_view in, std::size_t at) -> std::optional<std::uint64_t>
        {
            if (in.size() < at + 8)
            {
                return std::nullopt;
            }
            std::uint64_t v{};
            for (int i = 0; i < 8; ++i)
            {
                v |= static_cast<std::uint64_t>(static_cast<std::uint8_t>(in[at + i])) << (8 * i);
            }
            return v;
        }
    }

    WsTransport::WsTransport(WsOptions opts)
        : opts_(std::move(opts))
    {
        server_.clear_access_channels(websocketpp::log::alevel::all);
        server_.set_access_channels(websocketpp::log::alevel::connect |
            websocketpp::log::alevel::disconnect);
        server_.init_asio(&io_);
        server_.set_reuse_addr(true);

        server_.set_open_handler([this](Hdl hdl) { OnOpen(hdl, false); });
        server_.set_close_handler([this](Hdl hdl) { OnClose(hdl); });
        server_.set_fail_handler([this](Hdl hdl) { OnClose(hdl); });
        server_.set_message_handler([this](Hdl hdl, WsServer::message_ptr msg)
        {
            if (msg->get_opcode() != websocketpp::frame::opcode::binary)
            {
                ARN_LOG_DEBUG("Ws", "ignoring non-binary frame");
                return;
            }
            OnFrame(hdl, msg->get_payload());
        });

        client_.clear_access_channels(websocketpp::log::alevel::all);
        client_.init_asio(&io_);
        client_.set_open_handler([this](Hdl hdl) { OnOpen(hdl, true); });
        client_.set_close_handler([this](Hdl hdl) { OnClose(hdl); });
        client_.set_fail_handler([this](Hdl hdl) { OnClose(hdl); });
        client_.set_message_handler([this](Hdl hdl, WsClient::message_ptr msg)
        {
            if (msg->get_opcode() != websocketpp::frame::opcode::binary)
            {
                ARN_LOG_DEBUG("Ws", "ignoring non-binary frame");
                return;
            }
            OnFrame(hdl, msg->get_payload());
        });

        // keeps io_ alive while nothing is listening or dialing
        client_.start_perpetual();

        net_thr_ = std::thread([this]()
        {
            try
            {
                io_.run();
            }
            catch (std::exception const& e)
            {
                ARN_LOG_ERROR("Ws", "network loop stopped: {}", e.what());
            }
        });
    }

    WsTransport::~WsTransport()
    {
        SetListener(nullptr);
        StopAll();
        client_.stop_perpetual();
        io_.stop();
        if (net_thr_.joinable())
        {
            net_thr_.join();
        }
    }

    auto WsTransport::SetListener(TransportListener* listener) -> void
    {
        std::lock_guard<std::mutex> lock(mx_);
        listener_ = listener;
    }

    auto WsTransport::FindRoster(EndpointId const& id) const -> std::optional<RosterEntry>
    {
        for (RosterEntry const& r : opts_.roster)
        {
            if (r.id == id)
            {
                return r;
            }
        }
        return std::nullopt;
    }

    auto WsTransport::IsLinkFor(EndpointId const& id) const -> bool
    {
        return link_.has_value() && link_->peer_id == id;
    }

    // --- discovery ---

    auto WsTransport::StartAdvertising(std::string const& name) -> TransportResult
    {
        std::lock_guard<std::mutex> lock(mx_);
        local_name_ = name;
        if (advertising_)
        {
            return {};
        }

        websocketpp::lib::error_code ec;
        if (opts_.bind_address.empty())
        {
            server_.listen(opts_.port, ec);
        }
        else
        {
            server_.listen(opts_.bind_address, std::to_string(opts_.port), ec);
        }
        if (ec)
        {
            return Fail(TransportErrorCode::Io, std::format("listen on {}: {}", opts_.port, ec.message()));
        }
        server_.start_accept(ec);
        if (ec)
        {
            websocketpp::lib::error_code ignored;
            server_.stop_listening(ignored);
            return Fail(TransportErrorCode::Io, std::format("accept: {}", ec.message()));
        }

        advertising_ = true;
        ARN_LOG_INFO("Ws", "advertising as '{}' on port {}", name, opts_.port);
        return {};
    }

    auto WsTransport::ListeningPort() -> std::uint16_t
    {
        std::lock_guard<std::mutex> lock(mx_);
        if (!advertising_)
        {
            return 0;
        }
        websocketpp::lib::asio::error_code ec;
        auto const ep = server_.get_local_endpoint(ec);
        if (ec)
        {
            ARN_LOG_WARN("Ws", "local endpoint: {}", ec.message());
            return 0;
        }
        return ep.port();
    }

    auto WsTransport::StartDiscovery(std::string const& name) -> TransportResult
    {
        Events events;
        {
            std::lock_guard<std::mutex> lock(mx_);
            if (local_name_.empty())
            {
                local_name_ = name;
            }
            discovering_ = true;
            if (listener_ != nullptr && !(link_ && link_->established))
            {
                for (RosterEntry const& r : opts_.roster)
                {
                    events.emplace_back([l = listener_, ep = EndpointInfo{r.id, r.name}] { l->OnEndpointFound(ep); });
                }
            }
        }
        Run(events);
        return {};
    }

    auto WsTransport::StopAdvertising() -> void
    {
        std::lock_guard<std::mutex> lock(mx_);
        if (!advertising_)
        {
            return;
        }
        advertising_ = false;

        websocketpp::lib::error_code ec;
        server_.stop_listening(ec);
        if (ec)
        {
            ARN_LOG_WARN("Ws", "stop_listening: {}", ec.message());
        }
    }

    auto WsTransport::StopDiscovery() -> void
    {
        std::lock_guard<std::mutex> lock(mx_);
        discovering_ = false;
    }

    // --- connection handshake ---

    auto WsTransport::RequestConnection(EndpointId const& id, std::string const& local_name) -> TransportResult
    {
        WsClient::connection_ptr con;
        {
            std::lock_guard<std::mutex> lock(mx_);
            std::optional<RosterEntry> entry = FindRoster(id);
            if (!entry)
            {
                return Fail(TransportErrorCode::UnknownEndpoint, id);
            }
            if (link_ || dialing_)
            {
                return Fail(TransportErrorCode::AlreadyConnected);
            }

            websocketpp::lib::error_code ec;
            con = client_.get_connection(entry->url, ec);
            if (ec)
            {
                return Fail(TransportErrorCode::Io, std::format("{}: {}", entry->url, ec.message()));
            }
            if (!local_name.empty())
            {
                local_name_ = local_name;
            }
            dialing_ = std::move(entry);
        }

        client_.connect(con);
        return {};
    }

    auto WsTransport::OnOpen(Hdl hdl, bool outgoing) -> void
    {
        Events events;
        {
            std::lock_guard<std::mutex> lock(mx_);
            if (outgoing)
            {
                if (!dialing_)
                {
                    events.emplace_back([this, hdl]
                    {
                        websocketpp::lib::error_code ec;
                        client_.close(hdl, websocketpp::close::status::normal, "not dialing", ec);
                    });
                }
                else
                {
                    link_ = Link{hdl, true, true, dialing_->id, dialing_->name};
                    dialing_.reset();

                    std::vector<std::uint8_t> hello(opts_.local_id.begin(), opts_.local_id.end());
                    hello.push_back(0);
                    hello.insert(hello.end(), local_name_.begin(), local_name_.end());
                    if (TransportResult sent = SendFrameLocked(FrameTag::Hello, hello); !sent)
                    {
                        ARN_LOG_WARN("Ws", "hello not sent: {}", core::error::describe(sent.error()));
                    }

                    if (listener_ != nullptr)
                    {
                        events.emplace_back([l = listener_, id = link_->peer_id, name = link_->peer_name]
                        {
                            l->OnConnectionInitiated(id, name, false);
                        });
                    }
                }
            }
            else if (link_ || !advertising_)
            {
                ARN_LOG_INFO("Ws", "extra connection refused");
                events.emplace_back([this, hdl]
                {
                    websocketpp::lib::error_code ec;
                    server_.close(hdl, websocketpp::close::status::policy_violation, "busy", ec);
                });
            }
            else
            {
                // identity arrives with HELLO
                link_ = Link{hdl, false, true};
            }
        }
        Run(events);
    }

    auto WsTransport::HandleHello(Hdl hdl, std::string_view body) -> void
    {
        Events events;
        {
            std::lock_guard<std::mutex> lock(mx_);
            if (!link_ || link_->outgoing || !SameHdl(link_->hdl, hdl) || !link_->peer_id.empty())
            {
                return;
            }
            std::size_t const sep = body.find('\0');
            if (sep == std::string_view::npos || sep == 0)
            {
                ARN_LOG_WARN("Ws", "malformed hello");
                CloseLocked("malformed hello");
                return;
            }
            link_->peer_id = std::string(body.substr(0, sep));
            link_->peer_name = std::string(body.substr(sep + 1));

            if (listener_ != nullptr)
            {
                events.emplace_back([l = listener_, id = link_->peer_id, name = link_->peer_name]
                {
                    l->OnConnectionInitiated(id, name, true);
                });
            }
        }
        Run(events);
    }

    auto WsTransport::AcceptConnection(EndpointId const& id) -> TransportResult
    {
        Events events;
        {
            std::lock_guard<std::mutex> lock(mx_);
            if (!IsLinkFor(id) || link_->established)
            {
                return Fail(TransportErrorCode::UnknownEndpoint, id);
            }
            if (TransportResult sent = SendFrameLocked(FrameTag::Accept, {}); !sent)
            {
                return sent;
            }
            link_->local_accepted = true;
            if (link_->remote_accepted)
            {
                link_->established = true;
                if (listener_ != nullptr)
                {
                    events.emplace_back([l = listener_, id] { l->OnConnectionResult(id, true); });
                }
            }
        }
        Run(events);
        return {};
    }

    auto WsTransport::HandleAccept() -> void
    {
        Events events;
        {
            std::lock_guard<std::mutex> lock(mx_);
            if (!link_ || link_->established)
            {
                return;
            }
            link_->remote_accepted = true;
            if (link_->local_accepted)
            {
                link_->established = true;
                if (listener_ != nullptr)
                {
                    events.emplace_back([l = listener_, id = link_->peer_id] { l->OnConnectionResult(id, true); });
                }
            }
        }
        Run(events);
    }

    auto WsTransport::RejectConnection(EndpointId const& id) -> TransportResult
    {
        Events events;
        {
            std::lock_guard<std::mutex> lock(mx_);
            if (!IsLinkFor(id))
            {
                return Fail(TransportErrorCode::UnknownEndpoint, id);
            }
            if (TransportResult sent = SendFrameLocked(FrameTag::Reject, {}); !sent)
            {
                ARN_LOG_DEBUG("Ws", "reject not delivered: {}", core::error::describe(sent.error()));
            }
            CloseLocked("rejected");
            if (listener_ != nullptr)
            {
                events.emplace_back([l = listener_, id] { l->OnConnectionResult(id, false); });
            }
        }
        Run(events);
        return {};
    }

    auto WsTransport::HandleReject() -> void
    {
        Events events;
        {
            std::lock_guard<std::mutex> lock(mx_);
            if (!link_)
            {
                return;
            }
            EndpointId const peer = link_->peer_id;
            CloseLocked("rejected by peer");
            if (listener_ != nullptr && !peer.empty())
            {
                events.emplace_back([l = listener_, peer] { l->OnConnectionResult(peer, false); });
            }
        }
        Run(events);
    }

    auto WsTransport::OnClose(Hdl hdl) -> void
    {
        Events events;
        {
            std::lock_guard<std::mutex> lock(mx_);
            if (dialing_ && !link_)
            {
                // outgoing dial failed before open
                if (listener_ != nullptr)
                {
                    events.emplace_back([l = listener_, id = dialing_->id] { l->OnConnectionResult(id, false); });
                }
                dialing_.reset();
            }
            else if (link_ && SameHdl(link_->hdl, hdl))
            {
                Link const gone = *link_;
                link_.reset();
                AbortIncomingLocked(gone.peer_id, events);

                if (listener_ != nullptr && !gone.peer_id.empty())
                {
                    if (gone.established)
                    {
                        events.emplace_back([l = listener_, id = gone.peer_id] { l->OnDisconnected(id); });
                    }
                    else
                    {
                        events.emplace_back([l = listener_, id = gone.peer_id] { l->OnConnectionResult(id, false); });
                    }
                }
            }
        }
        Run(events);
    }

    // --- frames ---

    auto WsTransport::OnFrame(Hdl hdl, std::string const& payload) -> void
    {
        if (payload.empty())
        {
            return;
        }
        std::string_view const body = std::string_view(payload).substr(1);

        switch (static_cast<FrameTag>(static_cast<std::uint8_t>(payload[0])))
        {
        case FrameTag::Hello:
            HandleHello(hdl, body);
            break;
        case FrameTag::Accept:
            HandleAccept();
            break;
        case FrameTag::Reject:
            HandleReject();
            break;
        case FrameTag::Bytes:
            {
                TransportListener* l = nullptr;
                EndpointId peer;
                {
                    std::lock_guard<std::mutex> lock(mx_);
                    if (!link_ || !link_->established || !SameHdl(link_->hdl, hdl))
                    {
                        return;
                    }
                    l = listener_;
                    peer = link_->peer_id;
                }
                if (l != nullptr)
                {
                    l->OnBytesReceived(peer, std::vector<std::uint8_t>(body.begin(), body.end()));
                }
                break;
            }
        case FrameTag::FileBegin:
            HandleFileBegin(body);
            break;
        case FrameTag::Chunk:
            HandleChunk(body);
            break;
        case FrameTag::FileEnd:
            HandleFileEnd(body);
            break;
        default:
            ARN_LOG_DEBUG("Ws", "unknown frame tag {}", static_cast<int>(payload[0]));
            break;
        }
    }

    auto WsTransport::SendFrameLocked(FrameTag tag, std::span<std::uint8_t const> body) -> TransportResult
    {
        if (!link_ || !link_->open)
        {
            return Fail(TransportErrorCode::NotConnected);
        }

        std::vector<std::uint8_t> frame;
        frame.reserve(body.size() + 1);
        frame.push_back(static_cast<std::uint8_t>(tag));
        frame.insert(frame.end(), body.begin(), body.end());

        websocketpp::lib::error_code ec;
        if (link_->outgoing)
        {
            client_.send(link_->hdl, frame.data(), frame.size(), websocketpp::frame::opcode::binary, ec);
        }
        else
        {
            server_.send(link_->hdl, frame.data(), frame.size(), websocketpp::frame::opcode::binary, ec);
        }
        if (ec)
        {
            return Fail(TransportErrorCode::Io, ec.message());
        }
        return {};
    }

    // Drops the link record and closes its socket. The close handler then finds no
    // link and stays silent.
    auto WsTransport::CloseLocked(std::string const& reason) -> void
    {
        if (!link_)
        {
            return;
        }
        websocketpp::lib::error_code ec;
        if (link_->outgoing)
        {
            client_.close(link_->hdl, websocketpp::close::status::normal, reason, ec);
        }
        else
        {
            server_.close(link_->hdl, websocketpp::close::status::normal, reason, ec);
        }
        if (ec)
        {
            ARN_LOG_DEBUG("Ws", "close: {}", ec.message());
        }
        link_.reset();
        incoming_.clear();
    }

    // Files still in flight when the socket went away end as Failure.
    auto WsTransport::AbortIncomingLocked(EndpointId const& peer, Events& events) -> void
    {
        for (auto& [payload, inc] : incoming_)
        {
            inc.out.close();
            ARN_LOG_WARN("Ws", "payload {} cut off at {}/{} bytes", payload, inc.received, inc.total);
            if (listener_ != nullptr && !peer.empty())
            {
                events.emplace_back([l = listener_, peer, payload, got = inc.received, total = inc.total]
                {
                    l->OnTransferProgress(peer, payload, TransferStatus::Failure, got, total);
                });
            }
        }
        incoming_.clear();
    }

    // --- payloads ---

    auto WsTransport::SendBytes(EndpointId const& id, std::span<std::uint8_t const> bytes) -> TransportResult
    {
        std::lock_guard<std::mutex> lock(mx_);
        if (!IsLinkFor(id) || !link_->established)
        {
            return Fail(TransportErrorCode::NotConnected, id);
        }
        return SendFrameLocked(FrameTag::Bytes, bytes);
    }

    auto WsTransport::SendFile(EndpointId const& id, std::filesystem::path const& path)
        -> std::expected<PayloadId, TransportError>
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            return Fail(TransportErrorCode::Io, path.string());
        }
        std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

        Events events;
        PayloadId payload{};
        {
            std::lock_guard<std::mutex> lock(mx_);
            if (!IsLinkFor(id) || !link_->established)
            {
                return Fail(TransportErrorCode::NotConnected, id);
            }

            // dialing side uses odd ids, accepting side even ones
            payload = next_payload_++ * 2 + (link_->outgoing ? 1 : 0);
            std::uint64_t const total = bytes.size();

            std::vector<std::uint8_t> head;
            PutU64(head, static_cast<std::uint64_t>(payload));
            PutU64(head, total);
            if (TransportResult sent = SendFrameLocked(FrameTag::FileBegin, head); !sent)
            {
                return std::unexpected(sent.error());
            }

            for (std::size_t at = 0; at < bytes.size(); at += opts_.chunk_size)
            {
                std::size_t const n = std::min(opts_.chunk_size, bytes.size() - at);
                std::vector<std::uint8_t> chunk;
                chunk.reserve(n + 8);
                PutU64(chunk, static_cast<std::uint64_t>(payload));
                chunk.insert(chunk.end(), bytes.begin() + static_cast<std::ptrdiff_t>(at),
                             bytes.begin() + static_cast<std::ptrdiff_t>(at + n));
                if (TransportResult sent = SendFrameLocked(FrameTag::Chunk, chunk); !sent)
                {
                    return std::unexpected(sent.error());
                }
            }

            std::vector<std::uint8_t> tail;
            PutU64(tail, static_cast<std::uint64_t>(payload));
            if (TransportResult sent = SendFrameLocked(FrameTag::FileEnd, tail); !sent)
            {
                return std::unexpected(sent.error());
            }

            if (listener_ != nullptr)
            {
                events.emplace_back([l = listener_, id, payload, total]
                {
                    l->OnTransferProgress(id, payload, TransferStatus::Success, total, total);
                });
            }
        }
        Run(events);
        return payload;
    }

    auto WsTransport::HandleFileBegin(std::string_view body) -> void
    {
        std::optional<std::uint64_t> const id = GetU64(body, 0);
        std::optional<std::uint64_t> const total = GetU64(body, 8);
        if (!id || !total)
        {
            ARN_LOG_WARN("Ws", "short FILE_BEGIN frame");
            return;
        }

        Events events;
        {
            std::lock_guard<std::mutex> lock(mx_);
            if (!link_ || !link_->established)
            {
                return;
            }
            PayloadId const payload = static_cast<PayloadId>(*id);

            std::error_code ec;
            std::filesystem::create_directories(opts_.inbox, ec);
            std::filesystem::path target = opts_.inbox / std::format("payload_{}", payload);

            Incoming inc;
            inc.path = target;
            inc.total = *total;
            inc.out.open(target, std::ios::binary | std::ios::out | std::ios::trunc);
            if (!inc.out)
            {
                ARN_LOG_WARN("Ws", "cannot open {}", target.string());
            }
            incoming_[payload] = std::move(inc);

            if (listener_ != nullptr)
            {
                events.emplace_back([l = listener_, peer = link_->peer_id, payload, target, t = *total]
                {
                    l->OnFileReceived(peer, payload, target);
                    l->OnTransferProgress(peer, payload, TransferStatus::InProgress, 0, t);
                });
            }
        }
        Run(events);
    }

    auto WsTransport::HandleChunk(std::string_view body) -> void
    {
        std::optional<std::uint64_t> const id = GetU64(body, 0);
        if (!id)
        {
            return;
        }
        std::lock_guard<std::mutex> lock(mx_);
        auto it = incoming_.find(static_cast<PayloadId>(*id));
        if (it == incoming_.end())
        {
            return;
        }
        std::string_view const data = body.substr(8);
        it->second.out.write(data.data(), static_cast<std::streamsize>(data.size()));
        it->second.received += data.size();
    }

    auto WsTransport::HandleFileEnd(std::string_view body) -> void
    {
        std::optional<std::uint64_t> const id = GetU64(body, 0);
        if (!id)
        {
            return;
        }

        Events events;
        {
            std::lock_guard<std::mutex> lock(mx_);
            auto it = incoming_.find(static_cast<PayloadId>(*id));
            if (it == incoming_.end() || !link_)
            {
                return;
            }
            Incoming& inc = it->second;
            inc.out.close();
            bool const ok = static_cast<bool>(inc.out) && inc.received == inc.total;
            TransferStatus const status = ok ? TransferStatus::Success : TransferStatus::Failure;

            if (listener_ != nullptr)
            {
                events.emplace_back([l = listener_, peer = link_->peer_id, payload = it->first, status,
                                        got = inc.received, total = inc.total]
                {
                    l->OnTransferProgress(peer, payload, status, got, total);
                });
            }
            incoming_.erase(it);
        }
        Run(events);
    }

    // --- teardown ---

    auto WsTransport::DisconnectFromEndpoint(EndpointId const& id) -> void
    {
        std::lock_guard<std::mutex> lock(mx_);
        if (IsLinkFor(id))
        {
            CloseLocked("disconnect");
        }
    }

    auto WsTransport::StopAll() -> void
    {
        StopAdvertising();
        StopDiscovery();

        std::lock_guard<std::mutex> lock(mx_);
        dialing_.reset();
        CloseLocked("stop");
    }
}
