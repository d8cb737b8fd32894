#pragma once

#include <atomic>
#include <memory>
#include <vcsv/errors.h>

namespace vcsv {

// Read-only view of a cancellation flag. A default constructed token can
// never be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancellationRequested() const {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    // Throws OperationCancelled if cancellation was requested.
    void throwIfCancellationRequested() const {
        if (isCancellationRequested()) throw OperationCancelled();
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

// Owner side of a cancellation flag; hand out tokens to readers and call
// cancel() from any thread.
class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool isCancellationRequested() const { return flag_->load(std::memory_order_acquire); }
    CancellationToken token() const { return CancellationToken(flag_); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace vcsv
