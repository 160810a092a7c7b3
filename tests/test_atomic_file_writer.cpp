#include <gtest/gtest.h>

#include "io/atomic_file_writer.hpp"
#include "testing.hpp"

#include <cerrno>
#include <filesystem>
#include <sys/stat.h>

namespace wdi {
namespace {

std::span<const std::uint8_t> AsBytes(const std::string& s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

TEST(AtomicFileWriterTest, CommitReplacesDestinationAndSetsMode) {
    testutil::TemporaryDirectory tmp;
    const std::string target = tmp.Path() + "/operadriver";
    testutil::WriteFile(target, "old");

    AtomicFileWriter writer;
    ASSERT_TRUE(AtomicFileWriter::Open(target, writer).is_ok());
    EXPECT_NE(writer.TempPath(), target);

    const std::string data = "#!/bin/sh\necho new\n";
    ASSERT_TRUE(writer.WriteAll(AsBytes(data)).is_ok());

    // Destination untouched until commit.
    EXPECT_EQ(testutil::ReadFile(target), "old");

    auto res = writer.Commit(0755);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(testutil::ReadFile(target), data);
    EXPECT_FALSE(std::filesystem::exists(writer.TempPath()));

    struct stat st{};
    ASSERT_EQ(::stat(target.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0755u);
}

TEST(AtomicFileWriterTest, UncommittedWriterLeavesNothingBehind) {
    testutil::TemporaryDirectory tmp;
    const std::string target = tmp.Path() + "/geckodriver";
    std::string temp_path;

    {
        AtomicFileWriter writer;
        ASSERT_TRUE(AtomicFileWriter::Open(target, writer).is_ok());
        temp_path = writer.TempPath();
        ASSERT_TRUE(writer.WriteAll(AsBytes("partial")).is_ok());
    }

    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_FALSE(std::filesystem::exists(temp_path));
}

TEST(AtomicFileWriterTest, OpenFailsForMissingDirectory) {
    testutil::TemporaryDirectory tmp;
    AtomicFileWriter writer;

    auto res = AtomicFileWriter::Open(tmp.Path() + "/missing/operadriver", writer);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::Io);
    EXPECT_EQ(res.err, ENOENT);
}

} // namespace
} // namespace wdi
