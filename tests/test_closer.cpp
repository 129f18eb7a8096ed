#include <gtest/gtest.h>

#include "io/closer.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace filepipe {
namespace {

class RecordingCloser final : public ICloser {
  public:
    RecordingCloser(std::string name, std::vector<std::string>* log, int failures = 0)
        : name_(std::move(name)), log_(log), failures_(failures) {}

    Result Close() override {
        log_->push_back(name_);
        if (failures_ > 0) {
            --failures_;
            return Result::Fail(EIO, name_ + " failed");
        }
        return Result::Ok();
    }

  private:
    std::string name_;
    std::vector<std::string>* log_;
    int failures_;
};

TEST(CloserTest, NoOpCloser) {
    NoOpCloser c;
    EXPECT_FALSE(c.Closed());
    EXPECT_TRUE(c.Close().ok);
    EXPECT_TRUE(c.Closed());
    EXPECT_TRUE(c.Close().ok);
}

TEST(CloserTest, NoErrorCloserRetriesUntilSuccess) {
    std::vector<std::string> log;
    RecordingCloser inner("f", &log, 1);
    NoErrorCloser c(&inner);

    EXPECT_TRUE(c.Close().Is(EIO));
    EXPECT_FALSE(c.Closed());
    EXPECT_TRUE(c.Close().ok);
    EXPECT_TRUE(c.Closed());
    EXPECT_TRUE(c.Close().ok);
    EXPECT_EQ(log.size(), 2u);

    EXPECT_THROW(NoErrorCloser c2(nullptr), std::invalid_argument);
}

TEST(CloserTest, ErrorCloserFailsAfterClose) {
    std::vector<std::string> log;
    RecordingCloser inner("f", &log);
    ErrorCloser c(&inner, "reader", kErrFileReaderClosed);

    ASSERT_TRUE(c.Close().ok);
    auto r = c.Close();
    EXPECT_TRUE(r.Is(kErrFileReaderClosed));
    EXPECT_EQ(r.msg, "reader is already closed");
    EXPECT_EQ(log.size(), 1u);
}

TEST(CloserTest, MultiCloserClosesInReverseOrder) {
    std::vector<std::string> log;
    RecordingCloser a("a", &log), b("b", &log), c("c", &log);
    MultiCloser mc(true, true, {&a, nullptr, &b, &c});

    EXPECT_FALSE(mc.Closed());
    ASSERT_TRUE(mc.Close().ok);
    EXPECT_TRUE(mc.Closed());
    EXPECT_EQ(log, (std::vector<std::string>{"c", "b", "a"}));

    ASSERT_TRUE(mc.Close().ok);
    EXPECT_EQ(log.size(), 3u);

    bool closed = false;
    EXPECT_TRUE(mc.CloserClosed(&b, closed));
    EXPECT_TRUE(closed);
    RecordingCloser other("x", &log);
    EXPECT_FALSE(mc.CloserClosed(&other, closed));
}

TEST(CloserTest, MultiCloserTryAllCombinesFailures) {
    std::vector<std::string> log;
    RecordingCloser a("a", &log, 1), b("b", &log), c("c", &log, 1);
    MultiCloser mc(true, false, {&a, &b, &c});

    auto r = mc.Close();
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.msg, "c failed; a failed");
    EXPECT_EQ(log, (std::vector<std::string>{"c", "b", "a"}));
    EXPECT_FALSE(mc.Closed());

    // Only the failed closers are retried.
    log.clear();
    ASSERT_TRUE(mc.Close().ok);
    EXPECT_EQ(log, (std::vector<std::string>{"c", "a"}));
    EXPECT_TRUE(mc.Closed());

    EXPECT_TRUE(mc.Close().Is(kErrGeneric));
}

TEST(CloserTest, MultiCloserTryAllRetryOfAMiddleFailure) {
    std::vector<std::string> log;
    RecordingCloser a("a", &log), b("b", &log, 1), c("c", &log);
    MultiCloser mc(true, false, {&a, &b, &c});

    EXPECT_TRUE(mc.Close().Is(EIO));
    EXPECT_EQ(log, (std::vector<std::string>{"c", "b", "a"}));
    EXPECT_FALSE(mc.Closed());

    log.clear();
    ASSERT_TRUE(mc.Close().ok);
    EXPECT_EQ(log, (std::vector<std::string>{"b"}));
    EXPECT_TRUE(mc.Closed());
    EXPECT_TRUE(mc.Close().Is(kErrGeneric));
}

TEST(CloserTest, MultiCloserStopsAtFirstFailure) {
    std::vector<std::string> log;
    RecordingCloser a("a", &log), b("b", &log, 1), c("c", &log);
    MultiCloser mc(false, true, {&a, &b, &c});

    EXPECT_TRUE(mc.Close().Is(EIO));
    EXPECT_EQ(log, (std::vector<std::string>{"c", "b"}));

    log.clear();
    ASSERT_TRUE(mc.Close().ok);
    EXPECT_EQ(log, (std::vector<std::string>{"b", "a"}));
}

TEST(CloserTest, EmptyMultiCloserStartsClosed) {
    MultiCloser mc(true, true, {});
    EXPECT_TRUE(mc.Closed());
    EXPECT_TRUE(mc.Close().ok);
}

} // namespace
} // namespace filepipe
