#include <detection/detection_worker.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "fakes.hpp"

using namespace std::chrono_literals;
using rd_test::check;
using rd_test::eventually;

namespace {
    struct Rig {
        rd_test::FakeDisplay display;
        std::vector<std::string> names{"hey_rover"};
        rd_test::ScriptedClassifier::Script script = [](int) { return std::vector<float>{0.0f}; };

        std::shared_ptr<std::atomic<int>> built = std::make_shared<std::atomic<int>>(0);
        std::shared_ptr<std::atomic<int>> closes = std::make_shared<std::atomic<int>>(0);
        std::shared_ptr<std::atomic<int>> chunks = std::make_shared<std::atomic<int>>(0);
        std::shared_ptr<std::atomic<bool>> capture_fails = std::make_shared<std::atomic<bool>>(false);
        std::shared_ptr<std::atomic<int>> factory_failures_left = std::make_shared<std::atomic<int>>(0);

        std::mutex cb_m;
        std::vector<std::pair<std::string, float>> callbacks;

        std::unique_ptr<rd::DetectionWorker> worker;

        void build(rd::DetectionOptions opt) {
            auto names_copy = names;
            auto script_copy = script;
            auto built_ref = built;
            auto chunks_ref = chunks;
            auto failures_ref = factory_failures_left;
            rd::ClassifierFactory classifiers = [=]() -> std::unique_ptr<rd::IKeywordClassifier> {
                if (failures_ref->load() > 0) {
                    failures_ref->fetch_sub(1);
                    throw std::runtime_error("model files missing");
                }
                built_ref->fetch_add(1);
                return std::make_unique<rd_test::ScriptedClassifier>(
                    names_copy, [script_copy, chunks_ref](int i) {
                        chunks_ref->fetch_add(1);
                        return script_copy(i);
                    });
            };

            auto closes_ref = closes;
            auto fails_ref = capture_fails;
            rd::CaptureFactory captures = [closes_ref, fails_ref] {
                return std::make_unique<rd_test::FakeCapture>(5ms, fails_ref->load(), closes_ref);
            };

            worker = std::make_unique<rd::DetectionWorker>(display, classifiers, captures, opt);
        }

        rd::DetectionCallback recorder() {
            return [this](const std::string& model, float score) {
                std::lock_guard lk(cb_m);
                callbacks.emplace_back(model, score);
            };
        }

        size_t callback_count() {
            std::lock_guard lk(cb_m);
            return callbacks.size();
        }
    };

    rd::DetectionOptions fast_options() {
        rd::DetectionOptions opt;
        opt.cooldown = 200ms;
        opt.join_timeout = 1000ms;
        opt.notify_hold = 0ms;
        opt.chunk = 64;
        return opt;
    }

    void test_burst_within_cooldown_fires_once() {
        Rig rig;
        rig.script = [](int i) { return std::vector<float>{i < 3 ? 0.9f : 0.0f}; };
        rig.build(fast_options());

        check(rig.worker->start(rig.recorder()).ok, "start should succeed");
        check(eventually([&] { return rig.chunks->load() >= 6; }), "worker should consume chunks");
        rig.worker->stop();

        check(rig.callback_count() == 1, "detections inside the cooldown should collapse into one callback");
        check(rig.worker->status().detections == 1, "only accepted detections are counted");
    }

    void test_spaced_detections_fire_twice() {
        Rig rig;
        // 5 ms per chunk: chunk 40 lands well past a 50 ms cooldown
        rig.script = [](int i) { return std::vector<float>{(i == 0 || i == 40) ? 0.8f : 0.0f}; };
        auto opt = fast_options();
        opt.cooldown = 50ms;
        rig.build(opt);

        rig.worker->start(rig.recorder());
        check(eventually([&] { return rig.chunks->load() >= 45; }), "worker should reach the second detection");
        rig.worker->stop();

        check(rig.callback_count() == 2, "detections spaced beyond the cooldown should both fire");
        const auto events = rig.worker->recent_events();
        check(events.size() == 2 && events[0].model == "hey_rover", "events should record the model name");
    }

    void test_threshold_is_exclusive() {
        Rig rig;
        rig.script = [](int) { return std::vector<float>{0.5f}; };
        rig.build(fast_options());

        rig.worker->start(rig.recorder());
        check(eventually([&] { return rig.chunks->load() >= 5; }), "worker should consume chunks");
        rig.worker->stop();
        check(rig.callback_count() == 0, "a score equal to the threshold must not trigger");
    }

    void test_cooldown_is_shared_across_models() {
        Rig rig;
        rig.names = {"alpha", "bravo"};
        rig.script = [](int i) {
            if (i == 0) return std::vector<float>{0.9f, 0.95f};
            if (i == 2) return std::vector<float>{0.0f, 0.9f};
            return std::vector<float>{0.0f, 0.0f};
        };
        rig.build(fast_options());

        rig.worker->start(rig.recorder());
        check(eventually([&] { return rig.chunks->load() >= 5; }), "worker should consume chunks");
        rig.worker->stop();

        check(rig.callback_count() == 1, "one model's detection should suppress the others");
        std::lock_guard lk(rig.cb_m);
        check(!rig.callbacks.empty() && rig.callbacks[0].first == "alpha",
              "models above threshold in one chunk are handled in load order");
    }

    void test_stop_keeps_model_loaded() {
        Rig rig;
        rig.build(fast_options());

        rig.worker->start();
        check(rig.worker->status().active, "worker should be active after start");
        check(rig.worker->stop().ok, "stop should succeed");

        const auto st = rig.worker->status();
        check(!st.active, "status should be inactive after stop");
        check(st.model_loaded, "model should stay loaded after stop");
        check(st.models.size() == 1 && st.models[0] == "hey_rover", "status should list loaded models");
        check(rig.closes->load() == 1, "audio capture should be released on exit");
    }

    void test_model_built_once_across_restarts() {
        Rig rig;
        rig.build(fast_options());

        rig.worker->start();
        rig.worker->start();
        rig.worker->stop();
        rig.worker->start();
        rig.worker->stop();
        check(rig.built->load() == 1, "the classifier should be built exactly once");

        check(rig.worker->reload_model().ok, "reload should succeed");
        check(!rig.worker->status().model_loaded, "reload should drop the model");
        rig.worker->start();
        rig.worker->stop();
        check(rig.built->load() == 2, "the next start after reload should rebuild the classifier");
    }

    void test_failed_model_load_can_be_retried() {
        Rig rig;
        rig.factory_failures_left->store(1);
        rig.build(fast_options());

        const auto first = rig.worker->start();
        check(!first.ok, "start should fail when the model cannot load");
        const auto st = rig.worker->status();
        check(!st.active && !st.model_loaded, "nothing should run after a failed load");
        check(st.last_error.find("model files missing") != std::string::npos, "load error should be recorded");

        check(rig.worker->start().ok, "a later start should retry the load");
        rig.worker->stop();
    }

    void test_capture_failure_ends_worker() {
        Rig rig;
        rig.capture_fails->store(true);
        rig.build(fast_options());

        check(rig.worker->start().ok, "start returns once the worker is launched");
        check(eventually([&] { return !rig.worker->status().active; }), "worker should exit without audio");
        check(rig.worker->status().last_error.find("audio capture") != std::string::npos,
              "capture failure should be recorded");

        rig.capture_fails->store(false);
        check(rig.worker->start().ok, "worker should be restartable after a capture failure");
        check(rig.worker->status().active, "restarted worker should be active");
        rig.worker->stop();
    }

    void test_detection_flashes_display() {
        Rig rig;
        rig.script = [](int i) { return std::vector<float>{i == 1 ? 0.7f : 0.0f}; };
        rig.build(fast_options());

        rig.worker->start();
        check(eventually([&] { return rig.display.count() >= 2; }), "notification should render and clear");
        rig.worker->stop();
        check(rig.display.count() == 2, "one detection should produce one text frame and one clear");
        check(rig.display.bad_frames() == 0, "notification frames should match the panel");
    }

    void test_throwing_callback_does_not_kill_worker() {
        Rig rig;
        rig.script = [](int i) { return std::vector<float>{i == 0 ? 0.9f : 0.0f}; };
        rig.build(fast_options());

        rig.worker->start([](const std::string&, float) { throw std::runtime_error("callback down"); });
        check(eventually([&] { return rig.chunks->load() >= 4; }), "worker should keep listening");
        check(rig.worker->status().active, "worker should survive a failing callback");
        rig.worker->stop();
        check(rig.worker->status().detections == 1, "the detection should still be counted");
    }

    void test_stop_when_idle_is_noop() {
        Rig rig;
        rig.build(fast_options());
        check(rig.worker->stop().ok, "stop on an idle detector should succeed");
        check(rig.built->load() == 0, "stop must not build the classifier");
    }
}

int main() {
    test_burst_within_cooldown_fires_once();
    test_spaced_detections_fire_twice();
    test_threshold_is_exclusive();
    test_cooldown_is_shared_across_models();
    test_stop_keeps_model_loaded();
    test_model_built_once_across_restarts();
    test_failed_model_load_can_be_retried();
    test_capture_failure_ends_worker();
    test_detection_flashes_display();
    test_throwing_callback_does_not_kill_worker();
    test_stop_when_idle_is_noop();
    return rd_test::finish("detection");
}
