#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace rd {
    // Cooperative stop signal. Workers poll requested() once per iteration
    // and pace themselves with sleep_for(), which wakes early on request().
    class CancelToken {
    public:
        void request() {
            {
                std::lock_guard lk(m_);
                stop_.store(true, std::memory_order_release);
            }
            cv_.notify_all();
        }

        bool requested() const { return stop_.load(std::memory_order_acquire); }

        void reset() { stop_.store(false, std::memory_order_release); }

        // Returns false when cancelled before the full duration elapsed.
        template <class Rep, class Period>
        bool sleep_for(std::chrono::duration<Rep, Period> d) {
            std::unique_lock lk(m_);
            return !cv_.wait_for(lk, d, [&] { return stop_.load(std::memory_order_acquire); });
        }

    private:
        std::atomic<bool> stop_{false};
        std::mutex m_;
        std::condition_variable cv_;
    };

    // A single long-lived worker thread per kind of background job.
    // At most one thread runs in a slot; a new one is launched only after
    // the previous one has been joined.
    class WorkerSlot {
    public:
        using Job = std::function<void(CancelToken&)>;

        explicit WorkerSlot(std::string name);
        ~WorkerSlot();

        WorkerSlot(const WorkerSlot&) = delete;
        WorkerSlot& operator=(const WorkerSlot&) = delete;

        // Refused (false) while a previous job is still running.
        bool launch(Job job);

        // Fire-and-forget.
        void request_stop();

        // Waits up to `timeout` for the job to finish. True when the slot is empty.
        bool join_for(std::chrono::milliseconds timeout);

        // Unbounded wait.
        void join();

        bool alive() const;

        const std::string& name() const { return name_; }

    private:
        void reap_locked_();

        std::string name_;
        CancelToken token_;

        mutable std::mutex m_;
        std::condition_variable done_cv_;
        std::thread thr_;
        bool running_ = false;
    };
}
