#pragma once

#include "io/io.hpp"

#include <vector>

namespace filepipe {

// Duplicates every write to each writer in order; stops at the first failure.
class MultiWriter final : public IWriter {
public:
    explicit MultiWriter(std::vector<IWriter*> writers) : writers_(std::move(writers)) {}

    Result WriteAll(std::span<const std::uint8_t> in) override {
        for (auto* w : writers_) {
            auto r = w->WriteAll(in);
            if (!r.ok) return r;
        }
        return Result::Ok();
    }

private:
    std::vector<IWriter*> writers_;
};

} // namespace filepipe
