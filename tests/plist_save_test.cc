#include "plistemit/plist_dump.h"

#include "plistemit/file_io.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace plistemit {
namespace {

    static PlistValue sample_document()
    {
        PlistDict d;
        d.set("name", make_string("sample"));
        d.set("count", make_integer(3));
        d.set("flags", make_array({ make_bool(true), make_bool(false) }));
        return make_dict(d);
    }

    static std::string read_text(const std::string& path)
    {
        std::vector<std::byte> bytes;
        EXPECT_EQ(read_file_bytes(path.c_str(), &bytes, 0, nullptr),
                  ReadFileStatus::Ok);
        return std::string(reinterpret_cast<const char*>(bytes.data()),
                           bytes.size());
    }

}  // namespace

TEST(PlistSave, WritesEnvelopedDocument)
{
    const std::string path = ::testing::TempDir() + "plistemit_save.plist";
    const PlistValue v     = sample_document();

    // The envelope option is forced on for files.
    PlistDumpOptions opts;
    opts.envelope              = false;
    const PlistSaveResult res = save_plist(v, path.c_str(), opts);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.dump.status, PlistDumpStatus::Ok);
    EXPECT_EQ(res.file, WriteFileStatus::Ok);

    const std::string text = read_text(path);
    EXPECT_EQ(text, dump_plist_text(v, true));
    EXPECT_EQ(res.dump.written, text.size());
}


TEST(PlistSave, ReportsUnwritablePath)
{
    const PlistSaveResult res = save_plist(sample_document(),
                                           "/nonexistent-dir/out.plist");
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.dump.status, PlistDumpStatus::Ok);
    EXPECT_EQ(res.file, WriteFileStatus::OpenFailed);
}


TEST(PlistSave, FailedDumpLeavesNoFile)
{
    const std::string path = ::testing::TempDir() + "plistemit_nofile.plist";
    (void)std::remove(path.c_str());

    const PlistSaveResult res
        = save_plist(make_array({ make_opaque("Host", nullptr) }),
                     path.c_str());
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.dump.status, PlistDumpStatus::SnapshotUnavailable);

    std::vector<std::byte> bytes;
    EXPECT_EQ(read_file_bytes(path.c_str(), &bytes, 0, nullptr),
              ReadFileStatus::OpenFailed);
}

}  // namespace plistemit
