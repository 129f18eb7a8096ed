#pragma once

#include "util/result.hpp"

namespace filepipe {

// Owns a POSIX descriptor. Standard streams are never closed.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();
    Result Close();

  private:
    int fd_{-1};
};

} // namespace filepipe
