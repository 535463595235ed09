//
// RecordingTransport.hpp
//

#ifndef CARDARENA_RECORDINGTRANSPORT_HPP
#define CARDARENA_RECORDINGTRANSPORT_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "../core/Messages.hpp"
#include "../net/Transport.hpp"
#include "../net/codec.hpp"

namespace arena::core::debug
{
    // Wraps another transport and keeps a copy of every outgoing byte message and
    // file. Calls are forwarded unchanged.
    class RecordingTransport final : public arena::net::TransportAdapter
    {
    public:
        explicit RecordingTransport(arena::net::TransportAdapter& inner)
            : inner_{inner}
        {
        }

        auto SetListener(arena::net::TransportListener* listener) -> void override { inner_.SetListener(listener); }

        auto StartAdvertising(std::string const& name) -> error::TransportResult override
        {
            return inner_.StartAdvertising(name);
        }

        auto StartDiscovery(std::string const& name) -> error::TransportResult override
        {
            return inner_.StartDiscovery(name);
        }

        auto StopAdvertising() -> void override { inner_.StopAdvertising(); }
        auto StopDiscovery() -> void override { inner_.StopDiscovery(); }

        auto RequestConnection(EndpointId const& id, std::string const& local_name) -> error::TransportResult override
        {
            return inner_.RequestConnection(id, local_name);
        }

        auto AcceptConnection(EndpointId const& id) -> error::TransportResult override
        {
            return inner_.AcceptConnection(id);
        }

        auto RejectConnection(EndpointId const& id) -> error::TransportResult override
        {
            return inner_.RejectConnection(id);
        }

        auto SendBytes(EndpointId const& id, std::span<std::uint8_t const> bytes) -> error::TransportResult override
        {
            {
                std::lock_guard<std::mutex> lock(m_);
                sent_.emplace_back(bytes.begin(), bytes.end());
            }
            return inner_.SendBytes(id, bytes);
        }

        auto SendFile(EndpointId const& id, std::filesystem::path const& path)
            -> std::expected<PayloadId, error::TransportError> override
        {
            {
                std::lock_guard<std::mutex> lock(m_);
                files_.push_back(path);
            }
            return inner_.SendFile(id, path);
        }

        auto DisconnectFromEndpoint(EndpointId const& id) -> void override { inner_.DisconnectFromEndpoint(id); }
        auto StopAll() -> void override { inner_.StopAll(); }

        // Every outgoing message, decoded. Undecodable frames are skipped.
        auto SentMessages() const -> std::vector<Message>
        {
            std::lock_guard<std::mutex> lock(m_);
            std::vector<Message> out;
            out.reserve(sent_.size());
            for (std::vector<std::uint8_t> const& raw : sent_)
            {
                std::expected<net::DecodedMessage, net::ParseError> d = net::Decode(std::span<std::uint8_t const>(raw));
                if (d)
                {
                    out.push_back(std::move(d->message));
                }
            }
            return out;
        }

        auto SentFiles() const -> std::vector<std::filesystem::path>
        {
            std::lock_guard<std::mutex> lock(m_);
            return files_;
        }

        auto Clear() -> void
        {
            std::lock_guard<std::mutex> lock(m_);
            sent_.clear();
            files_.clear();
        }

    private:
        arena::net::TransportAdapter& inner_;
        mutable std::mutex m_;
        std::vector<std::vector<std::uint8_t>> sent_;
        std::vector<std::filesystem::path> files_;
    };
}

#endif //CARDARENA_RECORDINGTRANSPORT_HPP
