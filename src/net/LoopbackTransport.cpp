//
// LoopbackTransport.cpp
//

#include "net/LoopbackTransport.hpp"

#include "core/Log.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace arena::net
{
    using core::error::TransportErrorCode;

    static auto Fail(TransportErrorCode code, std::string msg = {}) -> std::unexpected<TransportError>
    {
        return std::unexpected(TransportError{code, std::move(msg)});
    }

    auto CreateLoopbackPair(EndpointId first_id,
                            EndpointId second_id,
                            std::filesystem::path inbox_root) -> LoopbackPair
    {
        auto medium = std::make_shared<LoopbackTransport::Medium>();
        medium->st[0].id = std::move(first_id);
        medium->st[0].inbox = inbox_root / medium->st[0].id;
        medium->st[1].id = std::move(second_id);
        medium->st[1].inbox = inbox_root / medium->st[1].id;

        return {
            std::shared_ptr<LoopbackTransport>(new LoopbackTransport(medium, 0)),
            std::shared_ptr<LoopbackTransport>(new LoopbackTransport(medium, 1))
        };
    }

    LoopbackTransport::LoopbackTransport(std::shared_ptr<Medium> medium, std::size_t index)
        : medium_{std::move(medium)}
          , index_{index}
    {
    }

    auto LoopbackTransport::Run(std::vector<Event>& events) -> void
    {
        for (Event& e : events)
        {
            e();
        }
        events.clear();
    }

    auto LoopbackTransport::Id() const -> EndpointId const&
    {
        return medium_->st[index_].id;
    }

    auto LoopbackTransport::SetListener(TransportListener* listener) -> void
    {
        std::lock_guard<std::mutex> lock(medium_->m);
        Self().listener = listener;
    }

    auto LoopbackTransport::StartAdvertising(std::string const& name) -> TransportResult
    {
        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(medium_->m);
            Station& me = Self();
            Station& other = Peer();
            if (!me.radio)
            {
                return Fail(TransportErrorCode::RadioDisabled);
            }
            me.name = name;
            me.advertising = true;

            if (other.discovering && other.listener && !medium_->linked)
            {
                events.emplace_back([l = other.listener, ep = EndpointInfo{me.id, me.name}] { l->OnEndpointFound(ep); });
            }
        }
        Run(events);
        return {};
    }

    auto LoopbackTransport::StartDiscovery(std::string const& name) -> TransportResult
    {
        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(medium_->m);
            Station& me = Self();
            Station& other = Peer();
            if (!me.radio)
            {
                return Fail(TransportErrorCode::RadioDisabled);
            }
            if (me.name.empty())
            {
                me.name = name;
            }
            me.discovering = true;

            if (other.advertising && me.listener && !medium_->linked)
            {
                events.emplace_back([l = me.listener, ep = EndpointInfo{other.id, other.name}] { l->OnEndpointFound(ep); });
            }
        }
        Run(events);
        return {};
    }

    auto LoopbackTransport::StopAdvertising() -> void
    {
        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(medium_->m);
            Station& me = Self();
            Station& other = Peer();
            if (!me.advertising)
            {
                return;
            }
            me.advertising = false;
            if (other.discovering && other.listener)
            {
                events.emplace_back([l = other.listener, id = me.id] { l->OnEndpointLost(id); });
            }
        }
        Run(events);
    }

    auto LoopbackTransport::StopDiscovery() -> void
    {
        std::lock_guard<std::mutex> lock(medium_->m);
        Self().discovering = false;
    }

    auto LoopbackTransport::RequestConnection(EndpointId const& id, std::string const& local_name) -> TransportResult
    {
        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(medium_->m);
            Station& me = Self();
            Station& other = Peer();
            if (!me.radio)
            {
                return Fail(TransportErrorCode::RadioDisabled);
            }
            if (id != other.id || !other.advertising)
            {
                return Fail(TransportErrorCode::UnknownEndpoint, id);
            }
            if (medium_->linked || medium_->pending)
            {
                return Fail(TransportErrorCode::AlreadyConnected);
            }

            medium_->pending = true;
            me.accepted = false;
            other.accepted = false;
            if (!local_name.empty())
            {
                me.name = local_name;
            }

            if (me.listener)
            {
                events.emplace_back([l = me.listener, pid = other.id, pname = other.name]
                {
                    l->OnConnectionInitiated(pid, pname, false);
                });
            }
            if (other.listener)
            {
                events.emplace_back([l = other.listener, mid = me.id, mname = me.name]
                {
                    l->OnConnectionInitiated(mid, mname, true);
                });
            }
        }
        Run(events);
        return {};
    }

    auto LoopbackTransport::AcceptConnection(EndpointId const& id) -> TransportResult
    {
        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(medium_->m);
            Station& me = Self();
            Station& other = Peer();
            if (id != other.id || !medium_->pending)
            {
                return Fail(TransportErrorCode::UnknownEndpoint, id);
            }
            me.accepted = true;
            if (!other.accepted)
            {
                return {};
            }

            medium_->pending = false;
            medium_->linked = true;
            if (me.listener)
            {
                events.emplace_back([l = me.listener, pid = other.id] { l->OnConnectionResult(pid, true); });
            }
            if (other.listener)
            {
                events.emplace_back([l = other.listener, mid = me.id] { l->OnConnectionResult(mid, true); });
            }
        }
        Run(events);
        return {};
    }

    auto LoopbackTransport::RejectConnection(EndpointId const& id) -> TransportResult
    {
        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(medium_->m);
            Station& me = Self();
            Station& other = Peer();
            if (id != other.id)
            {
                return Fail(TransportErrorCode::UnknownEndpoint, id);
            }
            if (!medium_->pending)
            {
                return {};
            }
            medium_->pending = false;
            me.accepted = false;
            other.accepted = false;
            if (me.listener)
            {
                events.emplace_back([l = me.listener, pid = other.id] { l->OnConnectionResult(pid, false); });
            }
            if (other.listener)
            {
                events.emplace_back([l = other.listener, mid = me.id] { l->OnConnectionResult(mid, false); });
            }
        }
        Run(events);
        return {};
    }

    auto LoopbackTransport::SendBytes(EndpointId const& id, std::span<std::uint8_t const> bytes) -> TransportResult
    {
        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(medium_->m);
            Station& me = Self();
            Station& other = Peer();
            if (!medium_->linked || id != other.id)
            {
                return Fail(TransportErrorCode::NotConnected, id);
            }
            if (other.listener)
            {
                events.emplace_back([l = other.listener, mid = me.id, data = std::vector<std::uint8_t>(bytes.begin(), bytes.end())]() mutable
                {
                    l->OnBytesReceived(mid, std::move(data));
                });
            }
        }
        Run(events);
        return {};
    }

    static auto WriteBytes(std::filesystem::path const& target,
                           std::span<std::uint8_t const> bytes,
                           std::ios::openmode mode) -> bool
    {
        std::ofstream out(target, std::ios::binary | std::ios::out | mode);
        if (!out)
        {
            return false;
        }
        out.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        return static_cast<bool>(out);
    }

    auto LoopbackTransport::SendFile(EndpointId const& id, std::filesystem::path const& path)
        -> std::expected<PayloadId, TransportError>
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            return Fail(TransportErrorCode::Io, path.string());
        }
        std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

        std::vector<Event> events;
        PayloadId payload{};
        {
            std::lock_guard<std::mutex> lock(medium_->m);
            Station& me = Self();
            Station& other = Peer();
            if (!medium_->linked || id != other.id)
            {
                return Fail(TransportErrorCode::NotConnected, id);
            }

            payload = medium_->next_payload++;

            std::error_code ec;
            std::filesystem::create_directories(other.inbox, ec);
            std::filesystem::path const target = other.inbox / std::format("payload_{}", payload);
            std::uint64_t const total = bytes.size();
            std::size_t const half = bytes.size() / 2;

            if (me.fail_next_file)
            {
                me.fail_next_file = false;
                if (other.listener)
                {
                    events.emplace_back([l = other.listener, mid = me.id, payload, target, total]
                    {
                        l->OnFileReceived(mid, payload, target);
                        l->OnTransferProgress(mid, payload, TransferStatus::Failure, 0, total);
                    });
                }
                if (me.listener)
                {
                    events.emplace_back([l = me.listener, pid = other.id, payload, total]
                    {
                        l->OnTransferProgress(pid, payload, TransferStatus::Failure, 0, total);
                    });
                }
            }
            else
            {
                // the receiver is told about the file while it is still half written
                if (!WriteBytes(target, std::span<std::uint8_t const>{bytes.data(), half}, std::ios::trunc))
                {
                    return Fail(TransportErrorCode::Io, target.string());
                }
                if (other.listener)
                {
                    events.emplace_back([l = other.listener, mid = me.id, payload, target, half, total]
                    {
                        l->OnFileReceived(mid, payload, target);
                        l->OnTransferProgress(mid, payload, TransferStatus::InProgress, half, total);
                    });
                }

                StalledFile rest{payload, target, std::vector<std::uint8_t>(bytes.begin() + static_cast<std::ptrdiff_t>(half), bytes.end())};
                if (me.stall_files)
                {
                    me.stalled.push_back(std::move(rest));
                }
                else
                {
                    events.emplace_back([this, rest = std::move(rest), total]
                    {
                        std::vector<Event> done;
                        {
                            std::lock_guard<std::mutex> inner(medium_->m);
                            if (!WriteBytes(rest.target, rest.bytes, std::ios::app))
                            {
                                ARN_LOG_WARN("Loopback", "cannot finish {}", rest.target.string());
                            }
                            Station& me2 = Self();
                            Station& other2 = Peer();
                            if (other2.listener)
                            {
                                done.emplace_back([l = other2.listener, mid = me2.id, p = rest.payload, total]
                                {
                                    l->OnTransferProgress(mid, p, TransferStatus::Success, total, total);
                                });
                            }
                            if (me2.listener)
                            {
                                done.emplace_back([l = me2.listener, pid = other2.id, p = rest.payload, total]
                                {
                                    l->OnTransferProgress(pid, p, TransferStatus::Success, total, total);
                                });
                            }
                        }
                        Run(done);
                    });
                }
            }
        }
        Run(events);
        return payload;
    }

    auto LoopbackTransport::FlushFiles() -> std::size_t
    {
        std::vector<Event> events;
        std::size_t flushed{};
        {
            std::lock_guard<std::mutex> lock(medium_->m);
            Station& me = Self();
            Station& other = Peer();
            for (StalledFile& f : me.stalled)
            {
                if (!WriteBytes(f.target, f.bytes, std::ios::app))
                {
                    ARN_LOG_WARN("Loopback", "cannot finish {}", f.target.string());
                }
                std::error_code ec;
                std::uint64_t const total = std::filesystem::file_size(f.target, ec);
                if (other.listener)
                {
                    events.emplace_back([l = other.listener, mid = me.id, p = f.payload, total]
                    {
                        l->OnTransferProgress(mid, p, TransferStatus::Success, total, total);
                    });
                }
                if (me.listener)
                {
                    events.emplace_back([l = me.listener, pid = other.id, p = f.payload, total]
                    {
                        l->OnTransferProgress(pid, p, TransferStatus::Success, total, total);
                    });
                }
                ++flushed;
            }
            me.stalled.clear();
        }
        Run(events);
        return flushed;
    }

    auto LoopbackTransport::DisconnectFromEndpoint(EndpointId const& id) -> void
    {
        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(medium_->m);
            Station& me = Self();
            Station& other = Peer();
            if (id != other.id || (!medium_->linked && !medium_->pending))
            {
                return;
            }
            medium_->linked = false;
            medium_->pending = false;
            me.stalled.clear();
            if (other.listener)
            {
                events.emplace_back([l = other.listener, mid = me.id] { l->OnDisconnected(mid); });
            }
        }
        Run(events);
    }

    auto LoopbackTransport::StopAll() -> void
    {
        StopAdvertising();
        StopDiscovery();
        DisconnectFromEndpoint(medium_->st[1 - index_].id);
    }

    auto LoopbackTransport::SetRadioEnabled(bool enabled) -> void
    {
        std::lock_guard<std::mutex> lock(medium_->m);
        Self().radio = enabled;
    }

    auto LoopbackTransport::SetStallFiles(bool stall) -> void
    {
        std::lock_guard<std::mutex> lock(medium_->m);
        Self().stall_files = stall;
    }

    auto LoopbackTransport::FailNextFile() -> void
    {
        std::lock_guard<std::mutex> lock(medium_->m);
        Self().fail_next_file = true;
    }

    auto LoopbackTransport::DropLink() -> void
    {
        std::vector<Event> events;
        {
            std::lock_guard<std::mutex> lock(medium_->m);
            if (!medium_->linked)
            {
                return;
            }
            medium_->linked = false;
            Station& me = Self();
            Station& other = Peer();
            me.stalled.clear();
            other.stalled.clear();
            if (me.listener)
            {
                events.emplace_back([l = me.listener, pid = other.id] { l->OnDisconnected(pid); });
            }
            if (other.listener)
            {
                events.emplace_back([l = other.listener, mid = me.id] { l->OnDisconnected(mid); });
            }
        }
        Run(events);
    }

    auto LoopbackTransport::IsLinked() const -> bool
    {
        std::lock_guard<std::mutex> lock(medium_->m);
        return medium_->linked;
    }
}
