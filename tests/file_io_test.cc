#include "plistemit/file_io.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace plistemit {

TEST(FileIo, WriteThenReadBack)
{
    const std::string path = ::testing::TempDir() + "plistemit_file_io.bin";

    std::vector<std::byte> data(300);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::byte>(i & 0xFFU);
    }
    ASSERT_EQ(write_file_bytes(path.c_str(), data), WriteFileStatus::Ok);

    std::vector<std::byte> back;
    uint64_t size = 0;
    ASSERT_EQ(read_file_bytes(path.c_str(), &back, 0, &size),
              ReadFileStatus::Ok);
    EXPECT_EQ(size, data.size());
    ASSERT_EQ(back.size(), data.size());
    EXPECT_EQ(std::memcmp(back.data(), data.data(), data.size()), 0);

    // Truncates on rewrite.
    ASSERT_EQ(write_file_bytes(path.c_str(), std::span<const std::byte>()),
              WriteFileStatus::Ok);
    ASSERT_EQ(read_file_bytes(path.c_str(), &back, 0, nullptr),
              ReadFileStatus::Ok);
    EXPECT_TRUE(back.empty());
}


TEST(FileIo, ReadRespectsCap)
{
    const std::string path = ::testing::TempDir() + "plistemit_file_cap.bin";
    const std::vector<std::byte> data(16, std::byte { 0x5A });
    ASSERT_EQ(write_file_bytes(path.c_str(), data), WriteFileStatus::Ok);

    std::vector<std::byte> out;
    EXPECT_EQ(read_file_bytes(path.c_str(), &out, 15, nullptr),
              ReadFileStatus::TooLarge);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(read_file_bytes(path.c_str(), &out, 16, nullptr),
              ReadFileStatus::Ok);
    EXPECT_EQ(out.size(), 16U);
}


TEST(FileIo, ReportsOpenFailures)
{
    std::vector<std::byte> out;
    EXPECT_EQ(read_file_bytes("/nonexistent-dir/none.bin", &out, 0, nullptr),
              ReadFileStatus::OpenFailed);
    EXPECT_EQ(write_file_bytes("/nonexistent-dir/none.bin",
                               std::span<const std::byte>()),
              WriteFileStatus::OpenFailed);
    EXPECT_STREQ(read_file_status_name(ReadFileStatus::TooLarge), "too_large");
    EXPECT_STREQ(write_file_status_name(WriteFileStatus::OpenFailed),
                 "open_failed");
}

}  // namespace plistemit
