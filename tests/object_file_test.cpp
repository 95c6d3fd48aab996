#include <gtest/gtest.h>

#include "fake_object_store.hpp"
#include "fs/object_file.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace S3Fs;
using S3Fs::Testing::MemoryObjectBody;
using S3Fs::Testing::ToString;

class ObjectFileTest : public ::testing::Test
{
    protected:
    std::unique_ptr<Fs::ObjectFile> MakeFile(
        const std::string& content, std::optional<std::size_t> fail_after = std::nullopt
    )
    {
        Fs::FileStat stat("hello.txt", static_cast<std::int64_t>(content.size()), mod_time_);
        return std::make_unique<Fs::ObjectFile>(
            std::move(stat), std::make_unique<MemoryObjectBody>(content, fail_after, &closes_)
        );
    }

    std::chrono::system_clock::time_point mod_time_{std::chrono::seconds(1700000000)};
    int closes_ = 0;
};

TEST_F(ObjectFileTest, ReadFillsWholeBufferAcrossShortStreamReads)
{
    auto file = MakeFile("The quick brown fox jumps over the lazy dog");
    std::vector<std::byte> buffer(43);

    auto res = file->Read(buffer);
    EXPECT_FALSE(res.error);
    EXPECT_TRUE(res);
    EXPECT_EQ(res.bytes_read, 43u);
    EXPECT_EQ(ToString(buffer, res.bytes_read), "The quick brown fox jumps over the lazy dog");
}

TEST_F(ObjectFileTest, ReadPastEndReportsUnexpectedEofWithPartialCount)
{
    auto file = MakeFile("0123456789");
    std::vector<std::byte> buffer(16);

    auto res = file->Read(buffer);
    EXPECT_EQ(res.bytes_read, 10u);
    EXPECT_EQ(res.error, Fs::FileErrc::UnexpectedEof);
    EXPECT_EQ(ToString(buffer, res.bytes_read), "0123456789");
}

TEST_F(ObjectFileTest, ReadAtEndReportsEndOfFile)
{
    auto file = MakeFile("abcdef");
    std::vector<std::byte> buffer(6);

    ASSERT_TRUE(file->Read(buffer));

    auto res = file->Read(buffer);
    EXPECT_EQ(res.bytes_read, 0u);
    EXPECT_EQ(res.error, Fs::FileErrc::EndOfFile);
}

TEST_F(ObjectFileTest, SequentialReadsContinueWhereThePreviousStopped)
{
    auto file = MakeFile("aaaabbbbcccc");
    std::vector<std::byte> buffer(4);

    std::string collected;
    for (int i = 0; i < 3; ++i) {
        auto res = file->Read(buffer);
        ASSERT_TRUE(res) << res.error.message();
        collected += ToString(buffer, res.bytes_read);
    }
    EXPECT_EQ(collected, "aaaabbbbcccc");
}

TEST_F(ObjectFileTest, EmptyBufferReadsNothingWithoutError)
{
    auto file = MakeFile("data");
    std::vector<std::byte> buffer;

    auto res = file->Read(buffer);
    EXPECT_EQ(res.bytes_read, 0u);
    EXPECT_FALSE(res.error);
}

TEST_F(ObjectFileTest, StreamErrorIsReturnedWithBytesReadSoFar)
{
    auto file = MakeFile(Testing::MakeContent(100), 20);
    std::vector<std::byte> buffer(50);

    auto res = file->Read(buffer);
    EXPECT_EQ(res.bytes_read, 20u);
    EXPECT_EQ(res.error, Store::StoreErrc::NetworkFailure);
}

TEST_F(ObjectFileTest, SeekIsANoOpReportingZero)
{
    auto file = MakeFile("0123456789");

    for (auto origin : {Fs::SeekOrigin::Begin, Fs::SeekOrigin::Current, Fs::SeekOrigin::End}) {
        for (std::int64_t offset : {std::int64_t{-5}, std::int64_t{0}, std::int64_t{4}, std::int64_t{1} << 40}) {
            auto pos = file->Seek(offset, origin);
            ASSERT_TRUE(pos.has_value());
            EXPECT_EQ(*pos, 0);
        }
    }

    std::vector<std::byte> buffer(3);
    ASSERT_TRUE(file->Read(buffer));
    EXPECT_EQ(ToString(buffer, 3), "012");

    ASSERT_TRUE(file->Seek(0, Fs::SeekOrigin::Begin).has_value());
    ASSERT_TRUE(file->Read(buffer));
    EXPECT_EQ(ToString(buffer, 3), "345");
}

TEST_F(ObjectFileTest, ReaddirIsAlwaysEmpty)
{
    auto file = MakeFile("x");

    for (int count : {-1, 0, 1, 100}) {
        auto entries = file->Readdir(count);
        ASSERT_TRUE(entries.has_value());
        EXPECT_TRUE(entries->empty());
    }
}

TEST_F(ObjectFileTest, StatReturnsSnapshot)
{
    auto file = MakeFile("12345");

    const auto& stat = file->Stat();
    EXPECT_EQ(stat.Name(), "hello.txt");
    EXPECT_EQ(stat.Size(), 5);
    EXPECT_EQ(stat.ModTime(), mod_time_);
    EXPECT_FALSE(stat.IsDir());
}

TEST_F(ObjectFileTest, CloseReleasesStreamOnce)
{
    auto file = MakeFile("12345");

    ASSERT_TRUE(file->Close().has_value());
    EXPECT_EQ(closes_, 1);

    auto again = file->Close();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Fs::FileErrc::FileClosed);
    EXPECT_EQ(closes_, 1);
}

TEST_F(ObjectFileTest, ReadAfterCloseFails)
{
    auto file = MakeFile("12345");
    ASSERT_TRUE(file->Close().has_value());

    std::vector<std::byte> buffer(2);
    auto res = file->Read(buffer);
    EXPECT_EQ(res.bytes_read, 0u);
    EXPECT_EQ(res.error, Fs::FileErrc::FileClosed);

    // Stat stays available
    EXPECT_EQ(file->Stat().Name(), "hello.txt");
}

TEST_F(ObjectFileTest, DestructorReleasesUnclosedStream)
{
    {
        auto file = MakeFile("12345");
    }
    EXPECT_EQ(closes_, 1);
}
