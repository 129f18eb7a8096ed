#pragma once

#include "io/io.hpp"

#include <string>
#include <vector>

namespace filepipe {

// A closer that remembers whether it has been closed successfully.
class Closer : public ICloser {
public:
    virtual bool Closed() const = 0;
};

// Does nothing; closed after the first Close.
class NoOpCloser final : public Closer {
public:
    Result Close() override {
        closed_ = true;
        return Result::Ok();
    }
    bool Closed() const override { return closed_; }

private:
    bool closed_ = false;
};

// Forwards the first successful Close to c (not owned); later calls
// succeed without doing anything.
class NoErrorCloser final : public Closer {
public:
    explicit NoErrorCloser(ICloser* c);

    Result Close() override;
    bool Closed() const override { return ok_; }

private:
    ICloser* c_;
    bool ok_ = false;
};

// Like NoErrorCloser, but calls after the first successful Close fail with
// closed_kind ("<device_name> is already closed").
class ErrorCloser final : public Closer {
public:
    ErrorCloser(ICloser* c, std::string device_name, int closed_kind);

    Result Close() override;
    bool Closed() const override { return ok_; }

private:
    ICloser* c_;
    std::string device_name_;
    int closed_kind_;
    bool ok_ = false;
};

// Closes a list of closers (not owned) in reverse order.
//
// With try_all, every closer is attempted and all failures are combined;
// otherwise closing stops at the first failure. A closer that closed
// successfully is never closed again. Once everything is closed, Close
// succeeds (no_error) or fails with kErrGeneric "already closed".
// Null closers are ignored; an empty MultiCloser starts closed.
class MultiCloser final : public Closer {
public:
    MultiCloser(bool try_all, bool no_error, std::vector<ICloser*> closers);

    Result Close() override;
    bool Closed() const override { return idx_ == 0; }

    // closed reports whether c was closed by this MultiCloser; the return
    // value reports whether c belongs to it.
    bool CloserClosed(const ICloser* c, bool& closed) const;

private:
    std::vector<ICloser*> closers_;
    std::vector<bool> done_;
    size_t idx_ = 0;
    bool try_all_;
    bool no_error_;
};

} // namespace filepipe
