#include <gtest/gtest.h>

#include "crypto/hash.hpp"
#include "filepipe/checksum.hpp"
#include "io/copy.hpp"
#include "io/memory_file.hpp"
#include "io/os_filesystem.hpp"
#include "testing.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

namespace filepipe {
namespace {

const std::string kData = "The quick brown fox jumps over the lazy dog";
const std::string kSha256 = "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592";
const std::string kMd5 = "9e107d9d372bb6826bd81d3542a419d6";
const std::string kCrc32 = "414fa339";

bool VerifyData(const std::vector<HashChecksum>& cs) {
    MemoryFile f("data.txt", kData);
    return VerifyChecksum(&f, false, cs);
}

TEST(HashTest, KnownDigests) {
    EXPECT_EQ(crypto::HexDigest(crypto::Sha256Factory(), AsBytes(kData)), kSha256);
    EXPECT_EQ(crypto::HexDigest(crypto::Md5Factory(), AsBytes(kData)), kMd5);
    EXPECT_EQ(crypto::HexDigest(crypto::Crc32Factory(), AsBytes(kData)), kCrc32);
    EXPECT_EQ(crypto::HexDigest(crypto::Sha1Factory(), AsBytes(kData)),
              "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
}

TEST(HashTest, FactoryByName) {
    EXPECT_TRUE(crypto::FactoryByName("sha256"));
    EXPECT_TRUE(crypto::FactoryByName("sha512"));
    EXPECT_TRUE(crypto::FactoryByName("crc32"));
    EXPECT_FALSE(crypto::FactoryByName("whirlpool"));

    auto h = crypto::FactoryByName("sha512")();
    EXPECT_EQ(h->Size(), 64u);
    h->Update(AsBytes("abc"));
    const auto first = h->Sum();
    h->Reset();
    h->Update(AsBytes("abc"));
    EXPECT_EQ(h->Sum(), first);
}

TEST(ChecksumTest, AllDigestsMatch) {
    EXPECT_TRUE(VerifyData({
        {crypto::Sha256Factory(), kSha256, false},
        {crypto::Md5Factory(), kMd5, false},
        {crypto::Crc32Factory(), kCrc32, false},
    }));
}

TEST(ChecksumTest, HexIsCaseInsensitive) {
    std::string upper = kSha256;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_TRUE(VerifyData({{crypto::Sha256Factory(), upper, false}}));
}

TEST(ChecksumTest, PrefixMatch) {
    EXPECT_TRUE(VerifyData({{crypto::Sha256Factory(), kSha256.substr(0, 9), true}}));
    EXPECT_FALSE(VerifyData({{crypto::Sha256Factory(), kSha256.substr(0, 9), false}}));
    EXPECT_FALSE(VerifyData({{crypto::Sha256Factory(), "d7a8fbb308", true}}));
}

TEST(ChecksumTest, OneMismatchFailsAll) {
    EXPECT_FALSE(VerifyData({
        {crypto::Md5Factory(), kMd5, false},
        {crypto::Sha256Factory(), std::string(64, '0'), false},
    }));
    EXPECT_FALSE(VerifyData({{crypto::Sha256Factory(), "not hex", false}}));
}

TEST(ChecksumTest, EmptyListOnlyReadsTheFile) {
    testutil::NonSeekableFile f("data.txt", kData);
    EXPECT_TRUE(VerifyChecksum(&f, true, {}));
    EXPECT_EQ(f.Position(), kData.size());
    EXPECT_EQ(f.CloseCount(), 1);
}

TEST(ChecksumTest, MalformedChecksumsThrow) {
    MemoryFile f("data.txt", kData);
    EXPECT_THROW(VerifyChecksum(nullptr, false, {}), std::invalid_argument);
    EXPECT_THROW(VerifyChecksum(&f, false, {{crypto::HashFactory(), kMd5, false}}), std::invalid_argument);
    EXPECT_THROW(VerifyChecksum(&f, false, {{crypto::Md5Factory(), "", false}}), std::invalid_argument);

    testutil::NonSeekableFile closed("data.txt", kData);
    EXPECT_THROW(VerifyChecksum(&closed, true, {{crypto::Md5Factory(), "", false}}), std::invalid_argument);
    EXPECT_EQ(closed.CloseCount(), 1);
}

TEST(ChecksumTest, FromFileSystem) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Join("data.txt"), kData);
    OsFileSystem fsys(tmp.Path());

    EXPECT_TRUE(VerifyChecksumFromFs(&fsys, "data.txt", {{crypto::Sha256Factory(), kSha256, false}}));
    EXPECT_FALSE(VerifyChecksumFromFs(&fsys, "data.txt", {{crypto::Md5Factory(), kSha256, false}}));
    EXPECT_FALSE(VerifyChecksumFromFs(&fsys, "missing.txt", {{crypto::Sha256Factory(), kSha256, false}}));
    EXPECT_THROW(VerifyChecksumFromFs(nullptr, "data.txt", {}), std::invalid_argument);
    EXPECT_THROW(VerifyChecksumFromFs(&fsys, "missing.txt", {{crypto::Md5Factory(), "", false}}),
                 std::invalid_argument);
}

} // namespace
} // namespace filepipe
