#pragma once

#include <atomic>
#include <memory>

namespace nzbstream {

// Copyable handle on a shared stop flag. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace nzbstream
