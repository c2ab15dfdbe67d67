#pragma once

// Detached background work that an owner can wait out before it is destroyed

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace keygate {
namespace detail {

class AsyncTracker {
  public:
    AsyncTracker() = default;
    AsyncTracker(const AsyncTracker&) = delete;
    AsyncTracker& operator=(const AsyncTracker&) = delete;

    ~AsyncTracker() { wait_idle(); }

    /// Run a task on a detached thread
    void run(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++pending_;
        }
        std::thread([this, task = std::move(task)]() {
            task();
            std::lock_guard<std::mutex> lock(mutex_);
            --pending_;
            idle_.notify_all();
        }).detach();
    }

    /// Block until every task started by run() has finished
    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this]() { return pending_ == 0; });
    }

  private:
    std::mutex mutex_;
    std::condition_variable idle_;
    int pending_ = 0;
};

/**
 * Gate for store callbacks that can outlive the object they call into.
 *
 * Stores copy their handlers before invoking them, so cancelling a
 * subscription does not stop a delivery already under way. Callbacks hold a
 * shared_ptr to the lifeline and enter through run(); the owner calls close()
 * before it is destroyed, which turns later deliveries into no-ops and waits
 * out the ones in progress on other threads.
 */
class Lifeline {
  public:
    Lifeline() = default;
    Lifeline(const Lifeline&) = delete;
    Lifeline& operator=(const Lifeline&) = delete;

    /// Run fn unless the lifeline is closed
    template <typename Fn> void run(Fn&& fn) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            inside_.push_back(std::this_thread::get_id());
        }

        struct Leave {
            Lifeline& owner;
            ~Leave() { owner.leave(); }
        } leave{*this};

        fn();
    }

    /// Refuse further calls and wait for running ones on other threads
    void close() {
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        auto self = std::this_thread::get_id();
        // Deliveries on this thread are further up our own stack
        idle_.wait(lock, [this, self]() {
            for (const auto& id : inside_) {
                if (id != self) {
                    return false;
                }
            }
            return true;
        });
    }

  private:
    void leave() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto self = std::this_thread::get_id();
        for (auto it = inside_.begin(); it != inside_.end(); ++it) {
            if (*it == self) {
                inside_.erase(it);
                break;
            }
        }
        idle_.notify_all();
    }

    std::mutex mutex_;
    std::condition_variable idle_;
    std::vector<std::thread::id> inside_;
    bool closed_ = false;
};

}  // namespace detail
}  // namespace keygate
