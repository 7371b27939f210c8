#include <common/cancellation.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace rd {
    WorkerSlot::WorkerSlot(std::string name)
        : name_(std::move(name)) {}

    WorkerSlot::~WorkerSlot() {
        request_stop();
        join();
    }

    bool WorkerSlot::launch(Job job) {
        std::lock_guard lk(m_);
        if (running_) return false;
        reap_locked_();

        token_.reset();
        running_ = true;
        thr_ = std::thread([this, job = std::move(job)] {
            try {
                job(token_);
            } catch (const std::exception& e) {
                std::cerr << "[Worker:" << name_ << "] aborted: " << e.what() << "\n";
            }
            // leave the signal clear so the next launch starts clean
            token_.reset();
            {
                std::lock_guard done_lk(m_);
                running_ = false;
            }
            done_cv_.notify_all();
        });
        return true;
    }

    void WorkerSlot::request_stop() {
        std::lock_guard lk(m_);
        if (running_) token_.request();
    }

    bool WorkerSlot::join_for(std::chrono::milliseconds timeout) {
        std::unique_lock lk(m_);
        if (thr_.joinable() && thr_.get_id() == std::this_thread::get_id()) {
            // a job cannot wait for itself
            return false;
        }
        if (!done_cv_.wait_for(lk, timeout, [&] { return !running_; })) {
            return false;
        }
        reap_locked_();
        return true;
    }

    void WorkerSlot::join() {
        std::unique_lock lk(m_);
        if (thr_.joinable() && thr_.get_id() == std::this_thread::get_id()) return;
        done_cv_.wait(lk, [&] { return !running_; });
        reap_locked_();
    }

    bool WorkerSlot::alive() const {
        std::lock_guard lk(m_);
        return running_;
    }

    void WorkerSlot::reap_locked_() {
        if (thr_.joinable()) thr_.join();
    }
}
