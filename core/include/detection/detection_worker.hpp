#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <audio/audio_capture.hpp>
#include <common/cancellation.hpp>
#include <common/status.hpp>
#include <display/display_sink.hpp>
#include <wakeword/keyword_classifier.hpp>

namespace rd {
    using DetectionCallback = std::function<void(const std::string& model, float score)>;
    using ClassifierFactory = std::function<std::unique_ptr<IKeywordClassifier>()>;
    using CaptureFactory = std::function<std::unique_ptr<IAudioCapture>()>;

    struct DetectionOptions {
        float threshold = 0.5f;
        std::chrono::milliseconds cooldown{2000};
        std::chrono::milliseconds join_timeout{2000};

        int sample_rate = 16000;
        int channels = 1;
        int chunk = 1280;

        std::string notify_text = "Wake!";
        Rgb notify_color{255, 255, 255};
        Rgb notify_background{0, 0, 0};
        double notify_scale = 1.0;
        std::chrono::milliseconds notify_hold{1000};

        size_t max_events = 32;
    };

    struct DetectionEvent {
        std::string model;
        float score = 0.0f;
        std::chrono::system_clock::time_point at;
    };

    struct DetectionStatus {
        bool active = false;
        bool model_loaded = false;
        std::vector<std::string> models;
        uint64_t detections = 0;
        double last_detection_age_s = -1.0; // < 0 when nothing was detected yet
        std::string last_error;
    };

    class DetectionWorker {
    public:
        DetectionWorker(IDisplaySink& display,
                        ClassifierFactory classifiers,
                        CaptureFactory captures,
                        DetectionOptions opt);
        ~DetectionWorker();

        DetectionWorker(const DetectionWorker&) = delete;
        DetectionWorker& operator=(const DetectionWorker&) = delete;

        // Stops a running detector (bounded join), builds the classifier on
        // first use and launches the listen loop.
        CommandStatus start(DetectionCallback callback = {});

        // Bounded join; no-op when idle.
        CommandStatus stop();

        // Stops and drops the classifier so the next start() rebuilds it.
        CommandStatus reload_model();

        DetectionStatus status() const;
        std::vector<DetectionEvent> recent_events() const;

    private:
        CommandStatus stop_locked_();
        bool ensure_model_locked_(std::string& err);
        void run_(CancelToken& stop,
                  std::shared_ptr<IKeywordClassifier> model,
                  DetectionCallback callback);
        bool try_accept_(std::chrono::steady_clock::time_point now);
        void record_(const std::string& model, float score);
        void notify_(CancelToken& stop);
        void fail_(const std::string& msg);

        IDisplaySink& display_;
        ClassifierFactory classifiers_;
        CaptureFactory captures_;
        DetectionOptions opt_;

        std::mutex control_mtx_;

        mutable std::mutex model_mtx_;
        std::shared_ptr<IKeywordClassifier> model_;

        // shared by every keyword: one accepted detection suppresses all others
        std::mutex cooldown_mtx_;
        std::optional<std::chrono::steady_clock::time_point> last_detection_;

        mutable std::mutex events_mtx_;
        std::deque<DetectionEvent> events_;
        uint64_t detections_ = 0;
        std::string last_error_;

        // declared last: joined before the members above go away
        WorkerSlot slot_{"detection"};
    };
}
