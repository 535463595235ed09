#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

#include "../core/PayloadTransferManager.hpp"
#include "../core/Messages.hpp"

using namespace arena::core;

namespace
{
    auto Bytes(std::size_t n, std::uint8_t seed = 7) -> std::vector<std::uint8_t>
    {
        std::vector<std::uint8_t> b(n);
        for (std::size_t i = 0; i < n; ++i)
        {
            b[i] = static_cast<std::uint8_t>(seed + i * 31);
        }
        return b;
    }

    auto Slurp(std::filesystem::path const& p) -> std::vector<std::uint8_t>
    {
        std::ifstream in(p, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    auto ScratchDir(char const* name) -> std::filesystem::path
    {
        namespace fs = std::filesystem;
        fs::path const d = fs::temp_directory_path() / "arena_tests" / name;
        fs::remove_all(d);
        fs::create_directories(d);
        return d;
    }
}

TEST(PayloadTransfer, DataThenMetadata)
{
    PayloadTransferManager ptm;
    std::vector<std::uint8_t> const img = Bytes(300);

    auto first = ptm.OnDataComplete(5, img);
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(first->has_value());
    EXPECT_TRUE(ptm.HasPending(5));

    auto second = ptm.OnMetadata(ImageTransferMetaMsg{5, 42, "drake.png", img.size()});
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(second->has_value());
    EXPECT_EQ((*second)->card_id, 42);
    EXPECT_EQ((*second)->file_name, "drake.png");
    EXPECT_EQ((*second)->bytes, img);
    EXPECT_EQ(ptm.PendingCount(), 0u);
}

TEST(PayloadTransfer, MetadataThenData)
{
    PayloadTransferManager ptm;
    std::vector<std::uint8_t> const img = Bytes(64);

    auto first = ptm.OnMetadata(ImageTransferMetaMsg{9, 3, "golem.jpg", img.size()});
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(first->has_value());

    auto second = ptm.OnDataComplete(9, img);
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(second->has_value());
    EXPECT_EQ((*second)->payload_id, 9);
    EXPECT_EQ((*second)->card_id, 3);

    // nothing left to pair with, so a late duplicate parks again instead of finalizing twice
    auto again = ptm.OnDataComplete(9, img);
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(again->has_value());
}

TEST(PayloadTransfer, DifferentPayloadsDoNotPair)
{
    PayloadTransferManager ptm;
    (void)ptm.OnDataComplete(1, Bytes(10));
    auto r = ptm.OnMetadata(ImageTransferMetaMsg{2, 1, "a.png", 10});
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->has_value());
    EXPECT_EQ(ptm.PendingCount(), 2u);
}

TEST(PayloadTransfer, SizeMismatchIsRejected)
{
    PayloadTransferManager ptm;
    (void)ptm.OnMetadata(ImageTransferMetaMsg{4, 1, "a.png", 100});
    auto r = ptm.OnDataComplete(4, Bytes(99));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error::PayloadErrorCode::SizeMismatch);
    EXPECT_EQ(r.error().payload_id, 4);
    EXPECT_FALSE(ptm.HasPending(4));
}

TEST(PayloadTransfer, FailureDropsHalf)
{
    PayloadTransferManager ptm;
    (void)ptm.OnMetadata(ImageTransferMetaMsg{6, 1, "a.png", 10});
    ptm.NoteIncomingFile(6, "/tmp/nowhere");

    error::PayloadError const e = ptm.OnTransferFailed(6);
    EXPECT_EQ(e.code, error::PayloadErrorCode::TransferFailed);
    EXPECT_EQ(e.payload_id, 6);
    EXPECT_FALSE(ptm.HasPending(6));
    EXPECT_FALSE(ptm.TakeIncomingFile(6).has_value());
}

TEST(PayloadTransfer, PurgeClearsEverything)
{
    PayloadTransferManager ptm;
    (void)ptm.OnMetadata(ImageTransferMetaMsg{1, 1, "a.png", 10});
    (void)ptm.OnDataComplete(2, Bytes(10));
    ptm.NoteIncomingFile(3, "/tmp/x");

    EXPECT_EQ(ptm.Purge(), 2u);
    EXPECT_EQ(ptm.PendingCount(), 0u);
    EXPECT_FALSE(ptm.TakeIncomingFile(3).has_value());
    EXPECT_EQ(ptm.Purge(), 0u);
}

TEST(PayloadTransfer, IncomingPathIsHandedOutOnce)
{
    PayloadTransferManager ptm;
    ptm.NoteIncomingFile(11, "/inbox/payload_11");

    auto p = ptm.TakeIncomingFile(11);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(*p, std::filesystem::path("/inbox/payload_11"));
    EXPECT_FALSE(ptm.TakeIncomingFile(11).has_value());
}

TEST(PayloadTransfer, ReadCompletedFile)
{
    std::filesystem::path const dir = ScratchDir("read_completed");
    std::vector<std::uint8_t> const img = Bytes(1000, 3);
    {
        std::ofstream out(dir / "payload_1", std::ios::binary);
        out.write(reinterpret_cast<char const*>(img.data()), static_cast<std::streamsize>(img.size()));
    }

    auto ok = ReadCompletedFile(1, dir / "payload_1");
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(*ok, img);

    auto missing = ReadCompletedFile(2, dir / "payload_2");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error::PayloadErrorCode::MissingFile);
}

TEST(FileImageSink, StoresAndOverwrites)
{
    std::filesystem::path const dir = ScratchDir("sink");
    FileImageSink sink(dir / "images");

    auto first = sink.Store(12, "drake.png", Bytes(50, 1));
    ASSERT_TRUE(first.has_value()) << first.error().message;
    EXPECT_EQ(*first, sink.PathFor(12, "drake.png"));
    EXPECT_EQ(Slurp(*first), Bytes(50, 1));

    // same card again: one file, latest bytes
    auto second = sink.Store(12, "drake.png", Bytes(20, 9));
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, *first);
    EXPECT_EQ(Slurp(*second), Bytes(20, 9));

    std::size_t files = 0;
    for ([[maybe_unused]] auto const& e : std::filesystem::directory_iterator(dir / "images"))
    {
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST(FileImageSink, PathStripsDirectories)
{
    FileImageSink sink("/var/arena");
    EXPECT_EQ(sink.PathFor(3, "../../etc/passwd"), std::filesystem::path("/var/arena/card_3_passwd"));
    EXPECT_EQ(sink.PathFor(4, ""), std::filesystem::path("/var/arena/card_4_image"));
}
