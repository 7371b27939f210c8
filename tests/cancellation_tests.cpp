#include <common/cancellation.hpp>

#include <atomic>
#include <chrono>
#include <thread>

#include "fakes.hpp"

using namespace std::chrono_literals;
using rd_test::check;

namespace {
    void test_sleep_runs_full_duration_when_not_cancelled() {
        rd::CancelToken tok;
        const auto t0 = std::chrono::steady_clock::now();
        const bool full = tok.sleep_for(30ms);
        const auto elapsed = std::chrono::steady_clock::now() - t0;
        check(full, "sleep_for should report a full sleep");
        check(elapsed >= 25ms, "sleep_for returned too early");
    }

    void test_request_wakes_sleeper() {
        rd::CancelToken tok;
        std::atomic<bool> full{true};
        const auto t0 = std::chrono::steady_clock::now();
        std::thread sleeper([&] { full = tok.sleep_for(5s); });
        std::this_thread::sleep_for(20ms);
        tok.request();
        sleeper.join();
        check(!full.load(), "cancelled sleep should return false");
        check(std::chrono::steady_clock::now() - t0 < 2s, "request() did not wake the sleeper");
        check(tok.requested(), "token should stay requested until reset");
        tok.reset();
        check(!tok.requested(), "reset should clear the token");
    }

    void test_slot_refuses_second_launch_while_running() {
        rd::WorkerSlot slot("test");
        const bool first = slot.launch([](rd::CancelToken& stop) {
            while (!stop.requested()) stop.sleep_for(5ms);
        });
        check(first, "first launch should succeed");
        check(slot.alive(), "slot should report alive");

        const bool second = slot.launch([](rd::CancelToken&) {});
        check(!second, "second launch must be refused while the first runs");

        slot.request_stop();
        check(slot.join_for(1s), "cooperative job should exit within the timeout");
        check(!slot.alive(), "slot should be empty after join");
    }

    void test_join_for_times_out_on_slow_job() {
        rd::WorkerSlot slot("slow");
        std::atomic<bool> release{false};
        slot.launch([&](rd::CancelToken&) {
            while (!release.load()) std::this_thread::sleep_for(2ms);
        });

        slot.request_stop();
        check(!slot.join_for(30ms), "join_for should time out while the job ignores the stop");
        check(slot.alive(), "slow job should still be alive");

        release = true;
        slot.join();
        check(!slot.alive(), "join should wait for the job to finish");
    }

    void test_token_is_clear_for_next_launch() {
        rd::WorkerSlot slot("relaunch");
        slot.launch([](rd::CancelToken& stop) {
            while (!stop.requested()) stop.sleep_for(5ms);
        });
        slot.request_stop();
        slot.join();

        std::atomic<bool> saw_stop{true};
        slot.launch([&](rd::CancelToken& stop) { saw_stop = stop.requested(); });
        slot.join();
        check(!saw_stop.load(), "a fresh job must not inherit the previous stop request");
    }

    void test_throwing_job_leaves_slot_reusable() {
        rd::WorkerSlot slot("throws");
        slot.launch([](rd::CancelToken&) { throw std::runtime_error("boom"); });
        slot.join();
        check(!slot.alive(), "slot should be empty after a job throws");
        check(slot.launch([](rd::CancelToken&) {}), "slot should accept a job after a failure");
        slot.join();
    }

    void test_self_join_returns_false() {
        rd::WorkerSlot slot("self");
        std::atomic<int> result{-1};
        slot.launch([&](rd::CancelToken&) { result = slot.join_for(10ms) ? 1 : 0; });
        slot.join();
        check(result.load() == 0, "a job joining its own slot should get false");
    }

    void test_stop_on_idle_slot_is_noop() {
        rd::WorkerSlot slot("idle");
        slot.request_stop();
        check(slot.join_for(10ms), "idle slot should join immediately");
        check(slot.launch([](rd::CancelToken& stop) { check(!stop.requested(), "idle stop leaked"); }),
              "launch after idle stop should succeed");
        slot.join();
    }
}

int main() {
    test_sleep_runs_full_duration_when_not_cancelled();
    test_request_wakes_sleeper();
    test_slot_refuses_second_launch_while_running();
    test_join_for_times_out_on_slow_job();
    test_token_is_clear_for_next_launch();
    test_throwing_job_leaves_slot_reusable();
    test_self_join_returns_false();
    test_stop_on_idle_slot_is_noop();
    return rd_test::finish("cancellation");
}
