#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "errors.hpp"

// Shared cancellation flag. Copies observe the same flag; a default token is never cancelled.
class CancelToken {
public:
    CancelToken()
        : flag_(std::make_shared<std::atomic<bool>>(false)) { }

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

    // throws Cancelled naming the operation about to run
    void check(const std::string& where) const {
        if (cancelled()) throw Cancelled(where + " cancelled");
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};
