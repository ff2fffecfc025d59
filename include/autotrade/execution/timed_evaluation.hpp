#pragma once

#include "../errors.hpp"
#include "../util/cancellation.hpp"

#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <exception>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace autotrade {
namespace execution {

enum class EvalStatus : uint8_t { Completed, Failed, TimedOut };

template <typename T>
struct TimedResult {
    EvalStatus status = EvalStatus::Failed;
    std::optional<T> value;       // set when Completed
    std::exception_ptr error;     // set when Failed; TimeoutError when TimedOut
    double elapsed_s = 0.0;
};

/**
 * TimedEvaluator - run work on a helper thread under a hard deadline.
 *
 * The work receives a CancellationToken. When the deadline passes the token
 * is cancelled and run() returns TimedOut immediately; the helper thread is
 * kept on an abandoned list and joined once it observes the token (reap()).
 * At most one evaluation is in flight per run() call.
 *
 * Usage:
 *   TimedEvaluator<Signal> eval;
 *   auto r = eval.run([&](const CancellationToken& t) { return s.evaluate(ctx, p, t); }, 30.0);
 *   if (r.status == EvalStatus::TimedOut) { ... }
 */
template <typename T>
class TimedEvaluator {
public:
    using Work = std::function<T(const util::CancellationToken&)>;

    TimedEvaluator() = default;

    ~TimedEvaluator() {
        // Workers were cancelled when abandoned; wait for them to notice
        for (auto& worker : abandoned_) {
            if (worker.thread.joinable())
                worker.thread.join();
        }
    }

    // Non-copyable
    TimedEvaluator(const TimedEvaluator&) = delete;
    TimedEvaluator& operator=(const TimedEvaluator&) = delete;

    TimedResult<T> run(Work work, double timeout_s) {
        reap();

        auto state = std::make_shared<SharedState>();
        util::CancellationSource source;
        util::CancellationToken token = source.token();
        auto start = std::chrono::steady_clock::now();

        std::thread thread([state, token, work = std::move(work)]() {
            std::optional<T> value;
            std::exception_ptr error;
            try {
                value.emplace(work(token));
            } catch (...) {
                error = std::current_exception(); // handed to the caller
            }
            std::lock_guard<std::mutex> lock(state->mutex);
            state->value = std::move(value);
            state->error = error;
            state->done = true;
            state->cv.notify_all();
        });

        TimedResult<T> result;
        bool finished;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            finished = state->cv.wait_for(lock, std::chrono::duration<double>(timeout_s),
                                          [&state] { return state->done; });
            if (finished) {
                result.value = std::move(state->value);
                result.error = state->error;
            }
        }
        result.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        if (!finished) {
            source.cancel();
            abandoned_.push_back(Abandoned{std::move(thread), state});
            result.status = EvalStatus::TimedOut;
            result.error = std::make_exception_ptr(
                TimeoutError("Evaluation exceeded " + std::to_string(timeout_s) + "s deadline"));
            return result;
        }

        thread.join();
        result.status = result.error ? EvalStatus::Failed : EvalStatus::Completed;
        return result;
    }

    /// Join abandoned workers that have finished. Returns how many remain.
    size_t reap() {
        for (auto it = abandoned_.begin(); it != abandoned_.end();) {
            bool done;
            {
                std::lock_guard<std::mutex> lock(it->state->mutex);
                done = it->state->done;
            }
            if (done) {
                it->thread.join();
                it = abandoned_.erase(it);
            } else {
                ++it;
            }
        }
        return abandoned_.size();
    }

    size_t abandoned_count() const { return abandoned_.size(); }

private:
    struct SharedState {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::optional<T> value;
        std::exception_ptr error;
    };

    struct Abandoned {
        std::thread thread;
        std::shared_ptr<SharedState> state;
    };

    std::list<Abandoned> abandoned_;
};

}  // namespace execution
}  // namespace autotrade
