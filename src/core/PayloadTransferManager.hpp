//
// PayloadTransferManager.hpp
//

#ifndef CARDARENA_PAYLOADTRANSFERMANAGER_HPP
#define CARDARENA_PAYLOADTRANSFERMANAGER_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "Exception.hpp"
#include "Messages.hpp"
#include "Types.hpp"

namespace arena::core
{
    // Both halves of an image transfer, matched by payload id.
    struct FinalizedTransfer
    {
        PayloadId payload_id{};
        CardId card_id{};
        std::string file_name;
        std::vector<std::uint8_t> bytes;
    };

    // Where finished card art goes. Storing the same card twice overwrites.
    class ImageSink
    {
    public:
        virtual ~ImageSink() = default;

        virtual auto Store(CardId card,
                           std::string const& file_name,
                           std::span<std::uint8_t const> bytes)
            -> std::expected<std::filesystem::path, error::PayloadError> = 0;
    };

    class FileImageSink final : public ImageSink
    {
    public:
        explicit FileImageSink(std::filesystem::path dir);

        auto Store(CardId card,
                   std::string const& file_name,
                   std::span<std::uint8_t const> bytes)
            -> std::expected<std::filesystem::path, error::PayloadError> override;

        [[nodiscard]]
        auto PathFor(CardId card, std::string const& file_name) const -> std::filesystem::path;

    private:
        std::filesystem::path dir_;
    };

    // Reads a completed transfer from disk. Only called after a terminal Success.
    auto ReadCompletedFile(PayloadId id, std::filesystem::path const& path)
        -> std::expected<std::vector<std::uint8_t>, error::PayloadError>;

    class PayloadTransferManager
    {
    public:
        // value() == nullopt: parked until the other half shows up
        using Outcome = std::expected<std::optional<FinalizedTransfer>, error::PayloadError>;

        PayloadTransferManager() = default;

        // Transport reported a received file for `id`. It may still be incomplete.
        auto NoteIncomingFile(PayloadId id, std::filesystem::path path) -> void;

        // Hands out the path noted for `id` exactly once.
        auto TakeIncomingFile(PayloadId id) -> std::optional<std::filesystem::path>;

        // Must only be fed bytes whose transfer reached terminal Success.
        auto OnDataComplete(PayloadId id, std::vector<std::uint8_t> bytes) -> Outcome;

        auto OnMetadata(ImageTransferMetaMsg const& meta) -> Outcome;

        // Failure/cancel: drop whatever half we hold for `id`.
        auto OnTransferFailed(PayloadId id) -> error::PayloadError;

        // Session reset. Returns how many pending entries were dropped.
        auto Purge() -> std::size_t;

        [[nodiscard]]
        auto PendingCount() const noexcept -> std::size_t { return pending_.size(); }

        [[nodiscard]]
        auto HasPending(PayloadId id) const -> bool { return pending_.contains(id); }

    private:
        struct DataPending
        {
            std::vector<std::uint8_t> bytes;
        };

        struct MetaPending
        {
            ImageTransferMetaMsg meta;
        };

        using PendingTransfer = std::variant<DataPending, MetaPending>;

        static auto Finalize(ImageTransferMetaMsg const& meta, std::vector<std::uint8_t> bytes) -> Outcome;

        std::unordered_map<PayloadId, PendingTransfer> pending_;
        std::unordered_map<PayloadId, std::filesystem::path> incoming_files_;
    };
}

#endif //CARDARENA_PAYLOADTRANSFERMANAGER_HPP
