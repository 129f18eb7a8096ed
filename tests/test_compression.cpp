#include <gtest/gtest.h>

#include "io/bzip2_reader.hpp"
#include "io/copy.hpp"
#include "io/deflate_writer.hpp"
#include "io/inflate_reader.hpp"
#include "testing.hpp"

#include <memory>
#include <string>
#include <vector>

namespace filepipe {
namespace {

std::vector<std::uint8_t> Concat(std::vector<std::uint8_t> a, const std::vector<std::uint8_t>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

std::string Deflate(const std::string& body, ZlibFraming framing, int level) {
    StringWriter sink;
    std::unique_ptr<DeflateWriter> w;
    EXPECT_TRUE(DeflateWriter::Create(&sink, framing, level, w).ok);
    EXPECT_TRUE(w->WriteAll(AsBytes(body)).ok);
    EXPECT_TRUE(w->Close().ok);
    return sink.Str();
}

std::string Inflate(const std::string& compressed, ZlibFraming framing) {
    testutil::MemoryReader src(compressed);
    std::unique_ptr<InflateReader> r;
    auto res = InflateReader::Create(&src, framing, r);
    EXPECT_TRUE(res.ok) << res.msg;
    if (!res.ok) return {};
    return testutil::ReadAll(*r);
}

TEST(InflateReaderTest, DecompressesGzipData) {
    // echo -n "hello" | gzip -c | xxd -i
    std::vector<std::uint8_t> compressed = {0x1f, 0x8b, 0x08, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                            0x03, 0xcb, 0x48, 0xcd, 0xc9, 0xc9, 0x07, 0x00, 0x86,
                                            0xa6, 0x10, 0x36, 0x05, 0x00, 0x00, 0x00};
    testutil::MemoryReader src(compressed);
    std::unique_ptr<InflateReader> r;
    ASSERT_TRUE(InflateReader::Create(&src, ZlibFraming::kGzip, r).ok);
    EXPECT_EQ(testutil::ReadAll(*r), "hello");
    EXPECT_TRUE(r->Close().ok);
}

TEST(InflateReaderTest, RejectsInvalidGzipHeader) {
    testutil::MemoryReader src(std::vector<std::uint8_t>{0x00, 0x01, 0x02, 0x03});
    std::unique_ptr<InflateReader> r;
    auto res = InflateReader::Create(&src, ZlibFraming::kGzip, r);
    EXPECT_TRUE(res.Is(kErrFormat));
    EXPECT_EQ(r, nullptr);
}

TEST(InflateReaderTest, EmptyInputIsUnexpectedEof) {
    testutil::MemoryReader src(std::string{});
    std::unique_ptr<InflateReader> r;
    EXPECT_TRUE(InflateReader::Create(&src, ZlibFraming::kGzip, r).Is(kErrUnexpectedEof));
}

TEST(InflateReaderTest, ConcatenatedMembersDecodeAsOneStream) {
    const auto data = Concat(testutil::GzipBytes("first "), testutil::GzipBytes("second"));
    EXPECT_EQ(Inflate(testutil::ToString(data), ZlibFraming::kGzip), "first second");

    testutil::MemoryReader src(data);
    std::unique_ptr<InflateReader> r;
    ASSERT_TRUE(InflateReader::Create(&src, ZlibFraming::kGzip, r).ok);
    r->SetMultistream(false);
    EXPECT_EQ(testutil::ReadAll(*r), "first ");
}

TEST(InflateReaderTest, TruncatedStreamFails) {
    auto data = testutil::GzipBytes(testutil::RandomBytes(4096));
    data.resize(data.size() / 2);
    testutil::MemoryReader src(data);
    std::unique_ptr<InflateReader> r;
    ASSERT_TRUE(InflateReader::Create(&src, ZlibFraming::kGzip, r).ok);

    std::vector<std::uint8_t> buf(8192);
    ssize_t n = 0;
    while ((n = r->Read(buf)) > 0) {
    }
    EXPECT_EQ(n, -1);
    EXPECT_TRUE(r->LastError().Is(kErrUnexpectedEof));
}

TEST(InflateReaderTest, ReadAfterCloseFails) {
    testutil::MemoryReader src(testutil::GzipBytes("x"));
    std::unique_ptr<InflateReader> r;
    ASSERT_TRUE(InflateReader::Create(&src, ZlibFraming::kGzip, r).ok);
    ASSERT_TRUE(r->Close().ok);
    std::uint8_t buf[4];
    EXPECT_EQ(r->Read(buf), -1);
}

TEST(DeflateWriterTest, RoundTripsAtEveryLevel) {
    const std::string body = testutil::RandomBytes(3000) + std::string(3000, 'a');
    for (int level : {kHuffmanOnly, kDefaultCompression, 0, 1, 5, 9}) {
        SCOPED_TRACE(level);
        EXPECT_EQ(Inflate(Deflate(body, ZlibFraming::kGzip, level), ZlibFraming::kGzip), body);
        EXPECT_EQ(Inflate(Deflate(body, ZlibFraming::kRawDeflate, level), ZlibFraming::kRawDeflate), body);
    }
}

TEST(DeflateWriterTest, RejectsInvalidLevel) {
    StringWriter sink;
    std::unique_ptr<DeflateWriter> w;
    EXPECT_FALSE(DeflateWriter::Create(&sink, ZlibFraming::kGzip, 10, w).ok);
    EXPECT_FALSE(DeflateWriter::Create(&sink, ZlibFraming::kGzip, -3, w).ok);

    EXPECT_TRUE(ValidDeflateLevel(kHuffmanOnly));
    EXPECT_TRUE(ValidDeflateLevel(kBestCompression));
    EXPECT_FALSE(ValidDeflateLevel(42));
}

TEST(DeflateWriterTest, GzipOutputHasMagic) {
    const std::string out = Deflate("payload", ZlibFraming::kGzip, 6);
    ASSERT_GE(out.size(), 2u);
    EXPECT_EQ(static_cast<std::uint8_t>(out[0]), 0x1f);
    EXPECT_EQ(static_cast<std::uint8_t>(out[1]), 0x8b);
}

TEST(Bzip2ReaderTest, Decompresses) {
    const std::string body = testutil::RandomBytes(20000, 7) + std::string(5000, 'z');
    testutil::MemoryReader src(testutil::Bzip2Bytes(body));
    Bzip2Reader r(&src);
    EXPECT_EQ(testutil::ReadAll(r), body);
    EXPECT_TRUE(r.Close().ok);
}

TEST(Bzip2ReaderTest, ConcatenatedStreams) {
    testutil::MemoryReader src(Concat(testutil::Bzip2Bytes("abc"), testutil::Bzip2Bytes("def")));
    Bzip2Reader r(&src);
    EXPECT_EQ(testutil::ReadAll(r), "abcdef");
}

TEST(Bzip2ReaderTest, RejectsGarbage) {
    testutil::MemoryReader src(std::string("not bzip2 data"));
    Bzip2Reader r(&src);
    std::uint8_t buf[16];
    EXPECT_EQ(r.Read(buf), -1);
    EXPECT_TRUE(r.LastError().Is(kErrFormat));
}

TEST(Bzip2ReaderTest, EmptyInputIsUnexpectedEof) {
    testutil::MemoryReader src(std::string{});
    Bzip2Reader r(&src);
    std::uint8_t buf[16];
    EXPECT_EQ(r.Read(buf), -1);
    EXPECT_TRUE(r.LastError().Is(kErrUnexpectedEof));
}

} // namespace
} // namespace filepipe
