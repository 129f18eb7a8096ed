#include <gtest/gtest.h>

#include "util/errors.hpp"
#include "util/hex.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/result.hpp"
#include "util/utf8.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace filepipe {

TEST(ResultTest, WrapKeepsKind) {
    auto r = ErrIsDir().Wrap("open a/b");
    EXPECT_FALSE(r.ok);
    EXPECT_TRUE(r.Is(kErrIsDir));
    EXPECT_EQ(r.msg, "open a/b: file is a directory");

    EXPECT_TRUE(Result::Ok().Wrap("ignored").ok);
}

TEST(ResultTest, CombineKeepsFirstFailureAndJoinsTheRest) {
    auto r = Result::Combine({Result::Ok(), ErrEof(), Result::Fail(EBADF, "bad fd"), ErrNotTar()});
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.err, kErrEof);
    EXPECT_TRUE(r.Is(EBADF));
    EXPECT_TRUE(r.Is(kErrNotTar));
    EXPECT_FALSE(r.Is(kErrNotZip));
    EXPECT_EQ(r.msg, "EOF; bad fd; " + ErrNotTar().msg);

    EXPECT_TRUE(Result::Combine({Result::Ok(), Result::Ok()}).ok);
    EXPECT_TRUE(Result::Combine(std::vector<Result>{}).ok);
}

TEST(ResultTest, IsOnOkResultIsFalse) {
    Result ok;
    EXPECT_FALSE(ok.Is(0));
    EXPECT_FALSE(IsEof(ok));
}

TEST(ResultTest, ClosedErrors) {
    EXPECT_TRUE(IsClosedError(ErrFileReaderClosed()));
    EXPECT_TRUE(IsClosedError(ErrFileWriterClosed()));
    EXPECT_FALSE(IsClosedError(ErrEof()));
}

TEST(HexTest, EncodeAndCompare) {
    const std::vector<std::uint8_t> digest = {0xde, 0xad, 0xbe, 0xef};
    EXPECT_EQ(HexEncode(digest), "deadbeef");

    EXPECT_TRUE(CanEncodeToHex(digest, "deadbeef"));
    EXPECT_TRUE(CanEncodeToHex(digest, "DEADBEEF"));
    EXPECT_FALSE(CanEncodeToHex(digest, "deadbee"));
    EXPECT_TRUE(CanEncodeToHex(digest, "deadbe", true));
    EXPECT_TRUE(CanEncodeToHex(digest, "DEA", true));
    EXPECT_FALSE(CanEncodeToHex(digest, "eadb", true));
    EXPECT_FALSE(CanEncodeToHex(digest, "deadbeef00", true));
    EXPECT_FALSE(CanEncodeToHex(digest, ""));
    EXPECT_FALSE(CanEncodeToHex(digest, "", true));
}

TEST(Utf8Test, DecodeValidAndInvalid) {
    const std::string s = "a\xc3\xa9\xe4\xbd\xa0\xf0\x9f\x98\x80";
    std::span<const std::uint8_t> p(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());

    size_t size = 0;
    EXPECT_EQ(utf8::DecodeRune(p, size), U'a');
    EXPECT_EQ(size, 1u);
    p = p.subspan(size);
    EXPECT_EQ(utf8::DecodeRune(p, size), U'é');
    EXPECT_EQ(size, 2u);
    p = p.subspan(size);
    EXPECT_EQ(utf8::DecodeRune(p, size), U'你');
    EXPECT_EQ(size, 3u);
    p = p.subspan(size);
    EXPECT_EQ(utf8::DecodeRune(p, size), U'\U0001F600');
    EXPECT_EQ(size, 4u);

    const std::uint8_t bad[] = {0xff, 'x'};
    EXPECT_EQ(utf8::DecodeRune(bad, size), utf8::kRuneError);
    EXPECT_EQ(size, 1u);

    const std::uint8_t truncated[] = {0xe4, 0xbd};
    EXPECT_FALSE(utf8::FullRune(truncated));
    EXPECT_EQ(utf8::DecodeRune(truncated, size), utf8::kRuneError);
    EXPECT_EQ(size, 1u);

    EXPECT_EQ(utf8::DecodeRune({}, size), utf8::kRuneError);
    EXPECT_EQ(size, 0u);
}

TEST(Utf8Test, EncodeRune) {
    std::uint8_t buf[utf8::kUtfMax] = {};
    EXPECT_EQ(utf8::EncodeRune(U'你', buf), 3u);
    EXPECT_EQ(buf[0], 0xe4);
    EXPECT_EQ(buf[1], 0xbd);
    EXPECT_EQ(buf[2], 0xa0);

    // Surrogates are not valid runes.
    EXPECT_EQ(utf8::EncodeRune(0xd800, buf), 3u);
    EXPECT_EQ(buf[0], 0xef);
    EXPECT_EQ(buf[1], 0xbf);
    EXPECT_EQ(buf[2], 0xbd);
}

TEST(PathUtilsTest, ExtAndBaseName) {
    EXPECT_EQ(PathExt("a/b.tar.gz"), ".gz");
    EXPECT_EQ(PathExt("a.d/b"), "");
    EXPECT_EQ(PathExt("noext"), "");
    EXPECT_EQ(BaseName("a/b/c.txt"), "c.txt");
    EXPECT_EQ(BaseName("dir/"), "dir");
    EXPECT_EQ(BaseName("/"), "/");
}

TEST(PathUtilsTest, JoinAndValidate) {
    EXPECT_EQ(JoinPath(".", "a"), "a");
    EXPECT_EQ(JoinPath("a", "b"), "a/b");
    EXPECT_EQ(JoinPath("a/", "b"), "a/b");

    EXPECT_TRUE(ValidFsPath("."));
    EXPECT_TRUE(ValidFsPath("a/b"));
    EXPECT_FALSE(ValidFsPath(""));
    EXPECT_FALSE(ValidFsPath("/a"));
    EXPECT_FALSE(ValidFsPath("a/../b"));
    EXPECT_FALSE(ValidFsPath("a//b"));
    EXPECT_FALSE(ValidFsPath("a/"));
}

TEST(LoggerTest, ParseLogLevel) {
    LogLevel lvl = LogLevel::Info;
    ASSERT_TRUE(ParseLogLevel("DEBUG", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    ASSERT_TRUE(ParseLogLevel("warning", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    ASSERT_TRUE(ParseLogLevel("off", lvl));
    EXPECT_EQ(lvl, LogLevel::None);
    EXPECT_FALSE(ParseLogLevel("loud", lvl));
    EXPECT_EQ(lvl, LogLevel::None);
}

TEST(LoggerTest, FiltersByLevel) {
    std::FILE* f = std::tmpfile();
    ASSERT_NE(f, nullptr);
    auto& log = Logger::Instance();
    const LogLevel saved = log.Level();
    log.SetStream(f);
    log.SetLevel(LogLevel::Warn);
    LogInfo("hidden %d", 1);
    LogWarn("shown %d", 2);
    log.SetStream(nullptr);
    log.SetLevel(saved);

    std::rewind(f);
    char buf[512]{};
    const size_t n = std::fread(buf, 1, sizeof(buf) - 1, f);
    std::fclose(f);
    const std::string out(buf, n);
    EXPECT_EQ(out.find("hidden"), std::string::npos);
    EXPECT_NE(out.find("[WARN]"), std::string::npos);
    EXPECT_NE(out.find("shown 2"), std::string::npos);
    EXPECT_NE(out.find("test_util.cpp"), std::string::npos);
}

} // namespace filepipe
