//
// PayloadTransferManager.cpp
//

#include "PayloadTransferManager.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace arena::core
{
    static auto SafeFileName(std::string const& raw) -> std::string
    {
        std::string name = std::filesystem::path(raw).filename().string();
        std::ranges::replace_if(name, [](char c)
        {
            return c == '/' || c == '\\' || c == ':' || c == '|';
        }, '_');
        return name.empty() ? std::string{"image"} : name;
    }

    FileImageSink::FileImageSink(std::filesystem::path dir)
        : dir_{std::move(dir)}
    {
    }

    auto FileImageSink::PathFor(CardId card, std::string const& file_name) const -> std::filesystem::path
    {
        return dir_ / std::format("card_{}_{}", card, SafeFileName(file_name));
    }

    auto FileImageSink::Store(CardId card,
                              std::string const& file_name,
                              std::span<std::uint8_t const> bytes)
        -> std::expected<std::filesystem::path, error::PayloadError>
    {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec)
        {
            return std::unexpected(error::PayloadError{
                error::PayloadErrorCode::SinkFailed, 0, std::format("mkdir {}: {}", dir_.string(), ec.message())
            });
        }

        std::filesystem::path const target = PathFor(card, file_name);
        std::ofstream out(target, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!out)
        {
            return std::unexpected(error::PayloadError{
                error::PayloadErrorCode::SinkFailed, 0, std::format("cannot open {}", target.string())
            });
        }
        out.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out)
        {
            return std::unexpected(error::PayloadError{
                error::PayloadErrorCode::SinkFailed, 0, std::format("short write to {}", target.string())
            });
        }
        return target;
    }

    auto ReadCompletedFile(PayloadId id, std::filesystem::path const& path)
        -> std::expected<std::vector<std::uint8_t>, error::PayloadError>
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            return std::unexpected(error::PayloadError{
                error::PayloadErrorCode::MissingFile, id, path.string()
            });
        }
        std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        return bytes;
    }

    auto PayloadTransferManager::NoteIncomingFile(PayloadId id, std::filesystem::path path) -> void
    {
        incoming_files_.insert_or_assign(id, std::move(path));
    }

    auto PayloadTransferManager::TakeIncomingFile(PayloadId id) -> std::optional<std::filesystem::path>
    {
        auto it = incoming_files_.find(id);
        if (it == incoming_files_.end())
        {
            return std::nullopt;
        }
        std::filesystem::path p = std::move(it->second);
        incoming_files_.erase(it);
        return p;
    }

    auto PayloadTransferManager::Finalize(ImageTransferMetaMsg const& meta, std::vector<std::uint8_t> bytes) -> Outcome
    {
        if (bytes.size() != meta.declared_size)
        {
            return std::unexpected(error::PayloadError{
                error::PayloadErrorCode::SizeMismatch,
                meta.payload_id,
                std::format("declared {} bytes, received {}", meta.declared_size, bytes.size())
            });
        }
        return FinalizedTransfer{meta.payload_id, meta.card_id, meta.file_name, std::move(bytes)};
    }

    auto PayloadTransferManager::OnDataComplete(PayloadId id, std::vector<std::uint8_t> bytes) -> Outcome
    {
        auto it = pending_.find(id);
        if (it == pending_.end())
        {
            ARN_LOG_DEBUG("Payload", "payload {} complete ({} bytes), waiting for metadata", id, bytes.size());
            pending_.emplace(id, DataPending{std::move(bytes)});
            return std::optional<FinalizedTransfer>{};
        }

        if (auto* meta = std::get_if<MetaPending>(&it->second))
        {
            ImageTransferMetaMsg const m = std::move(meta->meta);
            pending_.erase(it);
            return Finalize(m, std::move(bytes));
        }

        // a second completion for the same id replaces the first
        ARN_LOG_WARN("Payload", "payload {} completed twice, keeping latest bytes", id);
        it->second = DataPending{std::move(bytes)};
        return std::optional<FinalizedTransfer>{};
    }

    auto PayloadTransferManager::OnMetadata(ImageTransferMetaMsg const& meta) -> Outcome
    {
        auto it = pending_.find(meta.payload_id);
        if (it == pending_.end())
        {
            ARN_LOG_DEBUG("Payload", "metadata for payload {} (card {}), waiting for data", meta.payload_id, meta.card_id);
            pending_.emplace(meta.payload_id, MetaPending{meta});
            return std::optional<FinalizedTransfer>{};
        }

        if (auto* data = std::get_if<DataPending>(&it->second))
        {
            std::vector<std::uint8_t> bytes = std::move(data->bytes);
            pending_.erase(it);
            return Finalize(meta, std::move(bytes));
        }

        ARN_LOG_WARN("Payload", "duplicate metadata for payload {}, keeping latest", meta.payload_id);
        it->second = MetaPending{meta};
        return std::optional<FinalizedTransfer>{};
    }

    auto PayloadTransferManager::OnTransferFailed(PayloadId id) -> error::PayloadError
    {
        pending_.erase(id);
        incoming_files_.erase(id);
        return error::PayloadError{error::PayloadErrorCode::TransferFailed, id, {}};
    }

    auto PayloadTransferManager::Purge() -> std::size_t
    {
        std::size_t const dropped = pending_.size();
        pending_.clear();
        incoming_files_.clear();
        if (dropped > 0)
        {
            ARN_LOG_DEBUG("Payload", "purged {} orphaned transfer(s)", dropped);
        }
        return dropped;
    }
}
