#include <gtest/gtest.h>

#include "filepipe/reader.hpp"
#include "filepipe/writer.hpp"
#include "io/copy.hpp"
#include "io/memory_file.hpp"
#include "io/os_filesystem.hpp"
#include "testing.hpp"

#include <filesystem>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace filepipe {
namespace {

std::unique_ptr<Writer> MustOpen(IWritableFile* f, const WriteOptions& opts = {}) {
    std::unique_ptr<Writer> w;
    auto res = Writer::Open(f, opts, false, w);
    EXPECT_TRUE(res.ok) << res.msg;
    return w;
}

std::unique_ptr<Reader> ReadBack(MemoryFile& f, const ReadOptions& opts = {}) {
    std::unique_ptr<Reader> r;
    auto res = Reader::Open(&f, opts, false, r);
    EXPECT_TRUE(res.ok) << res.msg;
    return r;
}

TEST(WriterTest, PlainFileThroughEveryWriteMethod) {
    MemoryWritableFile out("notes.txt");
    auto w = MustOpen(&out);
    ASSERT_TRUE(w);
    EXPECT_FALSE(w->TarEnabled());
    EXPECT_FALSE(w->ZipEnabled());

    size_t n = 0;
    ASSERT_TRUE(w->WriteString("ab", n).ok);
    EXPECT_EQ(n, 2u);
    ASSERT_TRUE(w->WriteByte('c').ok);
    ASSERT_TRUE(w->WriteRune(U'é', n).ok);
    EXPECT_EQ(n, 2u);
    ASSERT_TRUE(w->Printf(n, "[%d-%s]", 7, "x").ok);
    ASSERT_TRUE(w->Print(n, 1, 2, "s").ok);
    ASSERT_TRUE(w->Println(n, "a", 1).ok);

    testutil::MemoryReader src(std::string("tail"));
    std::uint64_t copied = 0;
    ASSERT_TRUE(w->ReadFrom(src, copied).ok);
    EXPECT_EQ(copied, 4u);

    // Nothing reaches the file before a flush.
    EXPECT_TRUE(out.Data().empty());
    EXPECT_GT(w->Buffered(), 0u);
    ASSERT_TRUE(w->Close().ok);
    EXPECT_EQ(out.Str(), "abc\xC3\xA9[7-x]1 2sa 1\ntail");
    EXPECT_FALSE(out.Closed());
}

TEST(WriterTest, GzipRoundTrip) {
    const std::string data = testutil::RandomBytes(13 * 1024, 5);
    MemoryWritableFile out("data.bin.gz");
    WriteOptions opts;
    opts.deflate_level = 9;
    auto w = MustOpen(&out, opts);
    ASSERT_TRUE(w);
    EXPECT_EQ(w->MustWrite(AsBytes(data)), data.size());
    ASSERT_TRUE(w->Close().ok);
    EXPECT_NE(out.Str(), data);

    MemoryFile in("data.bin.gz", out.Data());
    auto r = ReadBack(in);
    ASSERT_TRUE(r);
    EXPECT_EQ(testutil::ReadAll(*r), data);
}

TEST(WriterTest, TarEntries) {
    MemoryWritableFile out("bundle.tar");
    auto w = MustOpen(&out);
    ASSERT_TRUE(w);
    ASSERT_TRUE(w->TarEnabled());

    TarHeader dir;
    dir.name = "dir/";
    dir.typeflag = kTarTypeDir;
    dir.mode = 0755;
    ASSERT_TRUE(w->TarWriteHeader(dir).ok);

    TarHeader a;
    a.name = "dir/a.txt";
    a.size = 1;
    ASSERT_TRUE(w->TarWriteHeader(a).ok);
    w->MustWriteString("A");

    TarHeader b;
    b.name = "dir/b.txt";
    b.size = 2;
    ASSERT_TRUE(w->TarWriteHeader(b).ok);
    w->MustWriteString("BB");
    ASSERT_TRUE(w->Close().ok);

    MemoryFile in("bundle.tar", out.Data());
    auto r = ReadBack(in);
    ASSERT_TRUE(r);
    TarHeader hdr;
    ASSERT_TRUE(r->TarNext(hdr).ok);
    EXPECT_EQ(hdr.name, "dir/");
    EXPECT_TRUE(hdr.IsDir());
    ASSERT_TRUE(r->TarNext(hdr).ok);
    EXPECT_EQ(hdr.name, "dir/a.txt");
    EXPECT_EQ(testutil::ReadAll(*r), "A");
    ASSERT_TRUE(r->TarNext(hdr).ok);
    EXPECT_EQ(hdr.name, "dir/b.txt");
    EXPECT_EQ(testutil::ReadAll(*r), "BB");
    EXPECT_TRUE(IsEof(r->TarNext(hdr)));
}

TEST(WriterTest, TarAddFsThroughGzip) {
    testutil::TemporaryDirectory tmp;
    std::filesystem::create_directories(tmp.Join("src/sub"));
    testutil::WriteFile(tmp.Join("src/top.txt"), std::string("top"));
    testutil::WriteFile(tmp.Join("src/sub/inner.txt"), std::string("inner"));

    MemoryWritableFile out("tree.tgz");
    auto w = MustOpen(&out);
    ASSERT_TRUE(w);
    OsFileSystem fsys(tmp.Join("src"));
    ASSERT_TRUE(w->TarAddFs(fsys).ok);
    ASSERT_TRUE(w->Close().ok);

    MemoryFile in("tree.tgz", out.Data());
    auto r = ReadBack(in);
    ASSERT_TRUE(r);
    std::set<std::string> names;
    std::string inner;
    for (;;) {
        TarHeader hdr;
        auto res = r->TarNext(hdr);
        if (IsEof(res)) break;
        ASSERT_TRUE(res.ok) << res.msg;
        names.insert(hdr.name);
        if (hdr.name == "sub/inner.txt") inner = testutil::ReadAll(*r);
    }
    EXPECT_TRUE(names.count("top.txt"));
    EXPECT_TRUE(names.count("sub/inner.txt"));
    EXPECT_EQ(inner, "inner");
}

TEST(WriterTest, ZipAfterPrefixBytes) {
    const std::string prefix = testutil::RandomBytes(5120, 8);
    MemoryWritableFile out("bundle.zip");
    ASSERT_TRUE(out.WriteAll(AsBytes(prefix)).ok);

    WriteOptions opts;
    opts.zip_offset = 5120;
    opts.zip_comment = "The end-of-central-directory comment 你好";
    auto w = MustOpen(&out, opts);
    ASSERT_TRUE(w);
    ASSERT_TRUE(w->ZipEnabled());
    ASSERT_TRUE(w->ZipCreate("hello.txt").ok);
    w->MustWriteString("hello, zip");
    ASSERT_TRUE(w->ZipCreate("empty/").ok);
    ASSERT_TRUE(w->ZipCreate("empty/data.bin").ok);
    w->MustWrite(AsBytes(testutil::RandomBytes(3000, 2)));
    ASSERT_TRUE(w->Close().ok);

    // The whole file and the archive section both open.
    for (std::int64_t offset : {0, 5120}) {
        MemoryFile in("bundle.zip", out.Data());
        ReadOptions ro;
        ro.offset = offset;
        auto r = ReadBack(in, ro);
        ASSERT_TRUE(r);
        std::string comment;
        ASSERT_TRUE(r->ZipComment(comment).ok);
        EXPECT_EQ(comment, "The end-of-central-directory comment 你好");
        std::vector<ZipFile> files;
        ASSERT_TRUE(r->ZipFiles(files).ok);
        ASSERT_EQ(files.size(), 3u);
        EXPECT_TRUE(files[1].IsDir());
        EXPECT_EQ(files[2].name, "empty/data.bin");

        std::unique_ptr<IFile> entry;
        ASSERT_TRUE(r->ZipOpen("hello.txt", entry).ok);
        EXPECT_EQ(testutil::ReadAll(*entry), "hello, zip");
        EXPECT_TRUE(entry->Close().ok);
    }
}

TEST(WriterTest, ZipWithA65535ByteDirectory) {
    // One of these name lengths puts the central directory at exactly
    // 0xFFFF bytes without needing zip64 records.
    for (size_t len : {65419u, 65420u, 65421u}) {
        const std::string long_name(len, 'b');
        MemoryWritableFile out("wide.zip");
        auto w = MustOpen(&out);
        ASSERT_TRUE(w);
        ASSERT_TRUE(w->ZipCreate("a.txt").ok);
        w->MustWriteString("first");
        ASSERT_TRUE(w->ZipCreate(long_name).ok);
        w->MustWriteString("second");
        ASSERT_TRUE(w->Close().ok);

        MemoryFile in("wide.zip", out.Data());
        auto r = ReadBack(in);
        ASSERT_TRUE(r) << "name length " << len;
        std::vector<ZipFile> files;
        ASSERT_TRUE(r->ZipFiles(files).ok);
        ASSERT_EQ(files.size(), 2u);
        EXPECT_EQ(files[1].name, long_name);
        std::unique_ptr<IFile> entry;
        ASSERT_TRUE(r->ZipOpen("a.txt", entry).ok);
        EXPECT_EQ(testutil::ReadAll(*entry), "first");
        EXPECT_TRUE(entry->Close().ok);
    }
}

TEST(WriterTest, ZipWriteStates) {
    MemoryWritableFile out("states.zip");
    auto w = MustOpen(&out);
    ASSERT_TRUE(w);

    size_t n = 0;
    EXPECT_TRUE(w->WriteString("early", n).Is(kErrZipWriteBeforeCreate));
    EXPECT_EQ(n, 0u);

    ASSERT_TRUE(w->ZipCreate("d/").ok);
    EXPECT_TRUE(w->WriteByte('x').Is(kErrIsDir));

    ASSERT_TRUE(w->ZipCreate("d/f.txt").ok);
    EXPECT_TRUE(w->WriteString("payload", n).ok);

    // Failures are not sticky.
    ASSERT_TRUE(w->ZipCreate("d/g.txt").ok);
    EXPECT_TRUE(w->WriteString("more", n).ok);

    TarHeader hdr;
    EXPECT_TRUE(w->TarWriteHeader(hdr).Is(kErrNotTar));
    ASSERT_TRUE(w->Close().ok);

    MemoryFile in("states.zip", out.Data());
    auto r = ReadBack(in);
    ASSERT_TRUE(r);
    std::unique_ptr<IFile> entry;
    ASSERT_TRUE(r->ZipOpen("d/f.txt", entry).ok);
    EXPECT_EQ(testutil::ReadAll(*entry), "payload");
    EXPECT_TRUE(entry->Close().ok);
}

TEST(WriterTest, ZipCopyFromAnotherArchive) {
    const auto src = testutil::BuildZip({{"keep.txt", "kept"}, {"other.txt", "other"}});
    MemoryFile in("src.zip", src);
    auto r = ReadBack(in);
    ASSERT_TRUE(r);
    std::vector<ZipFile> files;
    ASSERT_TRUE(r->ZipFiles(files).ok);

    MemoryWritableFile out("copy.zip");
    auto w = MustOpen(&out);
    ASSERT_TRUE(w);
    ASSERT_TRUE(w->ZipCopy(files[0]).ok);
    size_t n = 0;
    EXPECT_TRUE(w->WriteString("x", n).Is(kErrZipWriteBeforeCreate));
    ASSERT_TRUE(w->Close().ok);
    ASSERT_TRUE(r->Close().ok);

    MemoryFile copied("copy.zip", out.Data());
    auto r2 = ReadBack(copied);
    ASSERT_TRUE(r2);
    std::unique_ptr<IFile> entry;
    ASSERT_TRUE(r2->ZipOpen("keep.txt", entry).ok);
    EXPECT_EQ(testutil::ReadAll(*entry), "kept");
    EXPECT_TRUE(entry->Close().ok);
}

TEST(WriterTest, ModeErrorsOnAPlainFile) {
    MemoryWritableFile out("plain.txt");
    auto w = MustOpen(&out);
    ASSERT_TRUE(w);
    TarHeader hdr;
    EXPECT_TRUE(w->TarWriteHeader(hdr).Is(kErrNotTar));
    EXPECT_TRUE(w->ZipCreate("a").Is(kErrNotZip));
    ZipFileHeader fh;
    EXPECT_TRUE(w->ZipCreateHeader(fh).Is(kErrNotZip));
}

TEST(WriterTest, ClosedWriter) {
    MemoryWritableFile out("closed.txt");
    auto w = MustOpen(&out);
    ASSERT_TRUE(w);
    w->MustWriteString("data");
    ASSERT_TRUE(w->Close().ok);
    EXPECT_TRUE(w->Closed());
    EXPECT_TRUE(w->Close().ok);
    EXPECT_EQ(out.Str(), "data");

    size_t n = 0;
    EXPECT_TRUE(w->WriteString("late", n).Is(kErrFileWriterClosed));
    EXPECT_TRUE(w->WriteAll(AsBytes("late")).Is(kErrFileWriterClosed));
    EXPECT_TRUE(w->Flush().ok);
    EXPECT_EQ(out.Str(), "data");

    try {
        w->MustWriteString("late");
        FAIL() << "expected WritePanic";
    } catch (const WritePanic& e) {
        EXPECT_TRUE(e.result().Is(kErrFileWriterClosed));
    }
    EXPECT_THROW(w->MustWriteByte('x'), WritePanic);
    EXPECT_THROW(w->MustPrintf("%d", 1), WritePanic);
    EXPECT_THROW(w->MustPrintln("x"), WritePanic);

    EXPECT_TRUE(w->WriteByte('x').Is(kErrFileWriterClosed));
    EXPECT_TRUE(w->WriteRune(U'é', n).Is(kErrFileWriterClosed));
    EXPECT_EQ(n, 0u);
    EXPECT_TRUE(w->Printf(n, "%d", 1).Is(kErrFileWriterClosed));
    EXPECT_TRUE(w->Print(n, "x").Is(kErrFileWriterClosed));
    testutil::MemoryReader src(std::string("late"));
    std::uint64_t copied = 0;
    EXPECT_TRUE(w->ReadFrom(src, copied).Is(kErrFileWriterClosed));
    EXPECT_EQ(copied, 0u);
    EXPECT_EQ(src.Position(), 0u);
    EXPECT_EQ(out.Str(), "data");
}

TEST(WriterTest, ClosedArchiveWriters) {
    MemoryWritableFile zip_out("closed.zip");
    auto zw = MustOpen(&zip_out);
    ASSERT_TRUE(zw);
    ASSERT_TRUE(zw->Close().ok);
    EXPECT_TRUE(zw->ZipCreate("late.txt").Is(kErrFileWriterClosed));
    TarHeader hdr;
    hdr.name = "late.txt";
    EXPECT_TRUE(zw->TarWriteHeader(hdr).Is(kErrNotTar));

    MemoryWritableFile tar_out("closed.tar");
    auto tw = MustOpen(&tar_out);
    ASSERT_TRUE(tw);
    ASSERT_TRUE(tw->Close().ok);
    EXPECT_TRUE(tw->TarWriteHeader(hdr).Is(kErrFileWriterClosed));
    EXPECT_TRUE(tw->ZipCreate("late.txt").Is(kErrNotZip));
}

TEST(WriterTest, TarGzipStackClosesEachStageOnce) {
    testutil::CountingWritableFile out("bundle.tar.gz");
    {
        std::unique_ptr<Writer> w;
        ASSERT_TRUE(Writer::Open(&out, {}, true, w).ok);
        TarHeader hdr;
        hdr.name = "a.txt";
        hdr.size = 3;
        ASSERT_TRUE(w->TarWriteHeader(hdr).ok);
        w->MustWriteString("abc");
        ASSERT_TRUE(w->Close().ok);
        EXPECT_TRUE(w->Close().ok);
    }
    EXPECT_EQ(out.CloseCount(), 1);
    // The tar trailer and the gzip trailer were written before the file closed.
    EXPECT_EQ(out.SizeAtClose(), out.Data().size());

    MemoryFile in("bundle.tar.gz", out.Data());
    auto r = ReadBack(in);
    ASSERT_TRUE(r);
    TarHeader hdr;
    ASSERT_TRUE(r->TarNext(hdr).ok);
    EXPECT_EQ(testutil::ReadAll(*r), "abc");
    EXPECT_TRUE(IsEof(r->TarNext(hdr)));
}

TEST(WriterTest, ShortTarEntryThroughGzipTearsDownCleanly) {
    testutil::CountingWritableFile out("short.tar.gz");
    {
        std::unique_ptr<Writer> w;
        ASSERT_TRUE(Writer::Open(&out, {}, true, w).ok);
        TarHeader hdr;
        hdr.name = "short.txt";
        hdr.size = 10;
        ASSERT_TRUE(w->TarWriteHeader(hdr).ok);
        w->MustWriteString("abc");
        EXPECT_FALSE(w->Close().ok);
    }
    EXPECT_EQ(out.CloseCount(), 1);
    EXPECT_EQ(out.SizeAtClose(), out.Data().size());
}

TEST(WriterTest, ShortTarEntryDestroyedWithoutClose) {
    testutil::CountingWritableFile out("short.tar");
    {
        std::unique_ptr<Writer> w;
        ASSERT_TRUE(Writer::Open(&out, {}, true, w).ok);
        TarHeader hdr;
        hdr.name = "short.txt";
        hdr.size = 10;
        ASSERT_TRUE(w->TarWriteHeader(hdr).ok);
        w->MustWriteString("abc");
    }
    EXPECT_EQ(out.CloseCount(), 1);
    EXPECT_EQ(out.SizeAtClose(), out.Data().size());
}

TEST(WriterTest, DestructorFlushes) {
    MemoryWritableFile out("implicit.txt");
    {
        auto w = MustOpen(&out);
        ASSERT_TRUE(w);
        w->MustWriteString("flushed on destruction");
    }
    EXPECT_EQ(out.Str(), "flushed on destruction");
}

TEST(WriterTest, CloseFileOption) {
    MemoryWritableFile out("owned.txt");
    std::unique_ptr<Writer> w;
    ASSERT_TRUE(Writer::Open(&out, {}, true, w).ok);
    ASSERT_TRUE(w->Close().ok);
    EXPECT_TRUE(out.Closed());
}

TEST(WriterTest, InvalidOptionsThrow) {
    MemoryWritableFile out("x.gz");
    std::unique_ptr<Writer> w;
    WriteOptions opts;
    opts.deflate_level = 10;
    EXPECT_THROW(Writer::Open(&out, opts, false, w), std::invalid_argument);
    opts.deflate_level = -3;
    EXPECT_THROW(Writer::Open(&out, opts, false, w), std::invalid_argument);
    opts = {};
    opts.zip_offset = -1;
    EXPECT_THROW(Writer::Open(&out, opts, false, w), std::invalid_argument);
    EXPECT_THROW(Writer::Open(static_cast<IWritableFile*>(nullptr), {}, false, w), std::invalid_argument);
}

TEST(WriterTest, RawAndUnsupportedExtensionsWritePlainBytes) {
    WriteOptions raw;
    raw.raw = true;
    MemoryWritableFile gz("raw.tar.gz");
    auto w = MustOpen(&gz, raw);
    ASSERT_TRUE(w);
    EXPECT_FALSE(w->TarEnabled());
    w->MustWriteString("as is");
    ASSERT_TRUE(w->Close().ok);
    EXPECT_EQ(gz.Str(), "as is");

    MemoryWritableFile bz("notes.txt.bz2");
    w = MustOpen(&bz);
    ASSERT_TRUE(w);
    w->MustWriteString("not compressed");
    ASSERT_TRUE(w->Close().ok);
    EXPECT_EQ(bz.Str(), "not compressed");
}

TEST(WriterTest, OptionsAndStat) {
    MemoryWritableFile out("opts.zip");
    WriteOptions opts;
    opts.buf_size = 128;
    opts.zip_compressors[77] = nullptr;
    auto w = MustOpen(&out, opts);
    ASSERT_TRUE(w);
    EXPECT_EQ(w->Options().buf_size, 128);
    EXPECT_TRUE(w->Options().zip_compressors.empty());
    EXPECT_GE(w->Size(), 128u);
    EXPECT_EQ(w->Available(), w->Size());

    FileInfo info;
    ASSERT_TRUE(w->FileStat(info).ok);
    EXPECT_EQ(info.name, "opts.zip");
    ASSERT_TRUE(w->Close().ok);
}

} // namespace
} // namespace filepipe
