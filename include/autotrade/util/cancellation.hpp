#pragma once

#include "../errors.hpp"

#include <atomic>
#include <memory>

namespace autotrade {
namespace util {

/**
 * Cooperative cancellation.
 *
 * A CancellationSource hands out tokens that share one flag. Long-running
 * work checks its token at each suspension point and stops by throwing
 * CancelledError. Tokens stay valid after the source is destroyed.
 *
 * Usage:
 *   CancellationSource source;
 *   std::thread worker([token = source.token()] {
 *       token.throw_if_cancelled();
 *       ...
 *   });
 *   source.cancel();
 */
class CancellationToken {
public:
    // A token that is never cancelled
    CancellationToken()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

    void throw_if_cancelled() const {
        if (is_cancelled()) {
            throw CancelledError();
        }
    }

private:
    friend class CancellationSource;

    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag)
        : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

class CancellationSource {
public:
    CancellationSource()
        : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(flag_); }

    void cancel() { flag_->store(true, std::memory_order_release); }
    bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace util
}  // namespace autotrade
