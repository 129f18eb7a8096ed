#include <gtest/gtest.h>

#include "archive/archive_path_policy.hpp"
#include "archive/tar.hpp"
#include "io/copy.hpp"
#include "io/os_filesystem.hpp"
#include "testing.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace filepipe {
namespace {

TEST(TarReaderTest, IteratesEntriesInStoredOrder) {
    const auto data = testutil::BuildTar({
        {"dir/", "", AE_IFDIR},
        {"dir/a.txt", "A", AE_IFREG},
        {"dir/b.txt", "BB", AE_IFREG},
    });
    testutil::MemoryReader src(data);
    std::unique_ptr<TarReader> tr;
    ASSERT_TRUE(TarReader::Open(&src, tr).ok);

    TarHeader hdr;
    ASSERT_TRUE(tr->Next(hdr).ok);
    EXPECT_EQ(hdr.name, "dir/");
    EXPECT_TRUE(hdr.IsDir());
    EXPECT_TRUE(hdr.ToFileInfo().IsDir());

    ASSERT_TRUE(tr->Next(hdr).ok);
    EXPECT_EQ(hdr.name, "dir/a.txt");
    EXPECT_EQ(hdr.size, 1u);
    EXPECT_EQ(testutil::ReadAll(*tr), "A");

    // The payload of b.txt is skipped by Next.
    ASSERT_TRUE(tr->Next(hdr).ok);
    EXPECT_EQ(hdr.name, "dir/b.txt");
    EXPECT_EQ(hdr.ToFileInfo().name, "b.txt");
    EXPECT_EQ(hdr.ToFileInfo().mode, static_cast<std::uint32_t>(S_IFREG | 0644));

    EXPECT_TRUE(IsEof(tr->Next(hdr)));
    EXPECT_TRUE(IsEof(tr->Next(hdr)));
}

TEST(TarReaderTest, EmptyStreamIsEmptyArchive) {
    testutil::MemoryReader src(std::string{});
    std::unique_ptr<TarReader> tr;
    ASSERT_TRUE(TarReader::Open(&src, tr).ok);
    TarHeader hdr;
    EXPECT_TRUE(IsEof(tr->Next(hdr)));
}

TEST(TarReaderTest, GarbageIsRejected) {
    testutil::MemoryReader src(testutil::RandomBytes(2048, 3));
    std::unique_ptr<TarReader> tr;
    auto r = TarReader::Open(&src, tr);
    if (r.ok) {
        TarHeader hdr;
        r = tr->Next(hdr);
    }
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(IsEof(r));
}

TEST(TarWriterTest, RoundTripsThroughTheReader) {
    StringWriter sink;
    std::unique_ptr<TarWriter> tw;
    ASSERT_TRUE(TarWriter::Create(&sink, tw).ok);

    TarHeader dir;
    dir.name = "d/";
    dir.typeflag = kTarTypeDir;
    dir.mode = 0755;
    ASSERT_TRUE(tw->WriteHeader(dir).ok);
    EXPECT_TRUE(tw->WriteAll(AsBytes("x")).Is(kErrIsDir));

    TarHeader file;
    file.name = "d/f.txt";
    file.size = 5;
    file.mtime = 1700000000;
    file.uname = "alice";
    ASSERT_TRUE(tw->WriteHeader(file).ok);
    ASSERT_TRUE(tw->WriteAll(AsBytes("hel")).ok);
    EXPECT_TRUE(tw->WriteAll(AsBytes("loXX")).Is(kErrWriteTooLong));

    TarHeader link;
    link.name = "d/link";
    link.typeflag = kTarTypeSymlink;
    link.linkname = "f.txt";
    ASSERT_TRUE(tw->WriteHeader(link).ok);
    ASSERT_TRUE(tw->Close().ok);
    ASSERT_TRUE(tw->Close().ok);

    testutil::MemoryReader src(sink.Str());
    std::unique_ptr<TarReader> tr;
    ASSERT_TRUE(TarReader::Open(&src, tr).ok);
    TarHeader hdr;
    ASSERT_TRUE(tr->Next(hdr).ok);
    EXPECT_EQ(hdr.name, "d/");
    EXPECT_EQ(hdr.typeflag, kTarTypeDir);
    EXPECT_EQ(hdr.mode, 0755u);
    ASSERT_TRUE(tr->Next(hdr).ok);
    EXPECT_EQ(hdr.name, "d/f.txt");
    EXPECT_EQ(hdr.mtime, 1700000000);
    EXPECT_EQ(hdr.uname, "alice");
    EXPECT_EQ(testutil::ReadAll(*tr), "hello");
    ASSERT_TRUE(tr->Next(hdr).ok);
    EXPECT_EQ(hdr.typeflag, kTarTypeSymlink);
    EXPECT_EQ(hdr.linkname, "f.txt");
    EXPECT_TRUE(IsEof(tr->Next(hdr)));
}

TEST(TarWriterTest, ShortEntryIsAnError) {
    StringWriter sink;
    std::unique_ptr<TarWriter> tw;
    ASSERT_TRUE(TarWriter::Create(&sink, tw).ok);

    TarHeader file;
    file.name = "short";
    file.size = 10;
    ASSERT_TRUE(tw->WriteHeader(file).ok);
    ASSERT_TRUE(tw->WriteAll(AsBytes("abc")).ok);

    file.name = "next";
    EXPECT_FALSE(tw->WriteHeader(file).ok);
    EXPECT_FALSE(tw->Close().ok);
}

TEST(TarWriterTest, AddFsWalksTheTree) {
    testutil::TemporaryDirectory tmp;
    std::filesystem::create_directories(tmp.Join("src/sub"));
    testutil::WriteFile(tmp.Join("src/top.txt"), "top");
    testutil::WriteFile(tmp.Join("src/sub/inner.txt"), "inner");

    StringWriter sink;
    std::unique_ptr<TarWriter> tw;
    ASSERT_TRUE(TarWriter::Create(&sink, tw).ok);
    OsFileSystem fsys(tmp.Join("src"));
    auto r = tw->AddFs(fsys);
    ASSERT_TRUE(r.ok) << r.msg;
    ASSERT_TRUE(tw->Close().ok);

    testutil::MemoryReader src(sink.Str());
    std::unique_ptr<TarReader> tr;
    ASSERT_TRUE(TarReader::Open(&src, tr).ok);
    std::vector<std::string> names;
    std::vector<std::string> bodies;
    TarHeader hdr;
    while (tr->Next(hdr).ok) {
        names.push_back(hdr.name);
        bodies.push_back(testutil::ReadAll(*tr));
    }
    EXPECT_EQ(names, (std::vector<std::string>{"sub/", "sub/inner.txt", "top.txt"}));
    EXPECT_EQ(bodies, (std::vector<std::string>{"", "inner", "top"}));
}

TEST(ArchivePathPolicyTest, IsLocal) {
    EXPECT_TRUE(ArchivePathPolicy::IsLocal("a"));
    EXPECT_TRUE(ArchivePathPolicy::IsLocal("a/b/c"));
    EXPECT_TRUE(ArchivePathPolicy::IsLocal("a/../b"));
    EXPECT_TRUE(ArchivePathPolicy::IsLocal("./a"));
    EXPECT_FALSE(ArchivePathPolicy::IsLocal(""));
    EXPECT_FALSE(ArchivePathPolicy::IsLocal("/etc/passwd"));
    EXPECT_FALSE(ArchivePathPolicy::IsLocal(".."));
    EXPECT_FALSE(ArchivePathPolicy::IsLocal("../escape.txt"));
    EXPECT_FALSE(ArchivePathPolicy::IsLocal("a/../../b"));
}

TEST(ArchivePathPolicyTest, CheckName) {
    ArchivePathPolicy strict(false);
    EXPECT_TRUE(strict.CheckName("dir/file.txt").ok);
    EXPECT_TRUE(strict.CheckName("../escape.txt").Is(kErrInsecurePath));

    ArchivePathPolicy lenient(true);
    EXPECT_TRUE(lenient.CheckName("../escape.txt").ok);
    EXPECT_TRUE(lenient.AllowNonLocal());
}

} // namespace
} // namespace filepipe
