#include "io/closer.hpp"

#include "util/errors.hpp"

#include <stdexcept>

namespace filepipe {

NoErrorCloser::NoErrorCloser(ICloser* c) : c_(c) {
    if (!c_) throw std::invalid_argument("closer is null");
}

Result NoErrorCloser::Close() {
    if (ok_) return Result::Ok();
    auto r = c_->Close();
    if (r.ok) ok_ = true;
    return r;
}

ErrorCloser::ErrorCloser(ICloser* c, std::string device_name, int closed_kind)
    : c_(c), device_name_(std::move(device_name)), closed_kind_(closed_kind) {
    if (!c_) throw std::invalid_argument("closer is null");
    if (device_name_.empty()) device_name_ = "closer";
}

Result ErrorCloser::Close() {
    if (ok_) return Result::Fail(closed_kind_, device_name_ + " is already closed");
    auto r = c_->Close();
    if (r.ok) ok_ = true;
    return r;
}

MultiCloser::MultiCloser(bool try_all, bool no_error, std::vector<ICloser*> closers)
    : try_all_(try_all), no_error_(no_error) {
    for (auto* c : closers) {
        if (c) closers_.push_back(c);
    }
    done_.assign(closers_.size(), false);
    idx_ = closers_.size();
}

Result MultiCloser::Close() {
    if (idx_ == 0) {
        if (no_error_) return Result::Ok();
        return Result::Fail(kErrGeneric, "MultiCloser is already closed");
    }

    if (!try_all_) {
        while (idx_ > 0) {
            auto r = closers_[idx_ - 1]->Close();
            if (!r.ok) return r;
            done_[idx_ - 1] = true;
            --idx_;
        }
        return Result::Ok();
    }

    std::vector<Result> errs;
    for (size_t i = idx_; i > 0; --i) {
        if (done_[i - 1]) continue;
        auto r = closers_[i - 1]->Close();
        if (!r.ok) {
            errs.push_back(std::move(r));
            continue;
        }
        done_[i - 1] = true;
    }
    while (idx_ > 0 && done_[idx_ - 1]) --idx_;
    return Result::Combine(errs);
}

bool MultiCloser::CloserClosed(const ICloser* c, bool& closed) const {
    for (size_t i = 0; i < closers_.size(); ++i) {
        if (closers_[i] == c) {
            closed = done_[i];
            return true;
        }
    }
    closed = false;
    return false;
}

} // namespace filepipe
