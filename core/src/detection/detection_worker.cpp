#include <detection/detection_worker.hpp>

#include <iostream>
#include <utility>

namespace rd {
    DetectionWorker::DetectionWorker(IDisplaySink& display,
                                     ClassifierFactory classifiers,
                                     CaptureFactory captures,
                                     DetectionOptions opt)
        : display_(display),
          classifiers_(std::move(classifiers)),
          captures_(std::move(captures)),
          opt_(std::move(opt)) {}

    DetectionWorker::~DetectionWorker() {
        slot_.request_stop();
        slot_.join();
    }

    CommandStatus DetectionWorker::start(DetectionCallback callback) {
        std::lock_guard lk(control_mtx_);

        if (slot_.alive()) {
            const auto st = stop_locked_();
            if (!st.ok) return st;
        }

        std::string err;
        if (!ensure_model_locked_(err)) {
            fail_(err);
            return CommandStatus::failure_of(Failure::Unavailable, err);
        }

        std::shared_ptr<IKeywordClassifier> model;
        {
            std::lock_guard mk(model_mtx_);
            model = model_;
        }
        model->reset();

        {
            std::lock_guard ek(events_mtx_);
            last_error_.clear();
        }

        const bool launched = slot_.launch([this, model, cb = std::move(callback)](CancelToken& stop) {
            run_(stop, model, cb);
        });
        if (!launched) {
            return CommandStatus::failure_of(Failure::Unavailable, "Wake-word detector busy");
        }
        std::cout << "[Detection](start) listening for " << model->model_names().size() << " keyword(s)\n";
        return CommandStatus::success("Wake-word detection started");
    }

    CommandStatus DetectionWorker::stop() {
        std::lock_guard lk(control_mtx_);
        return stop_locked_();
    }

    CommandStatus DetectionWorker::stop_locked_() {
        if (!slot_.alive()) {
            // reap a worker that already ended on its own
            slot_.join_for(std::chrono::milliseconds(0));
            return CommandStatus::success("Wake-word detection not running");
        }

        slot_.request_stop();
        if (!slot_.join_for(opt_.join_timeout)) {
            std::cerr << "[Detection](stop) worker did not exit within "
                      << opt_.join_timeout.count() << " ms\n";
            return CommandStatus::failure_of(Failure::Unavailable, "Wake-word detector did not stop in time");
        }
        std::cout << "[Detection](stop) stopped\n";
        return CommandStatus::success("Wake-word detection stopped");
    }

    CommandStatus DetectionWorker::reload_model() {
        std::lock_guard lk(control_mtx_);
        const auto st = stop_locked_();
        if (!st.ok) return st;

        std::lock_guard mk(model_mtx_);
        model_.reset();
        return CommandStatus::success("Wake-word model will be reloaded on next start");
    }

    bool DetectionWorker::ensure_model_locked_(std::string& err) {
        std::lock_guard mk(model_mtx_);
        if (model_) return true;
        if (!classifiers_) {
            err = "No wake-word classifier available";
            return false;
        }

        try {
            auto m = classifiers_();
            if (!m) {
                err = "Wake-word classifier factory returned nothing";
                return false;
            }
            model_ = std::move(m);
        } catch (const std::exception& e) {
            err = std::string("Failed to load wake-word model: ") + e.what();
            return false;
        }
        std::cout << "[Detection] model loaded\n";
        return true;
    }

    void DetectionWorker::run_(CancelToken& stop,
                               std::shared_ptr<IKeywordClassifier> model,
                               DetectionCallback callback) {
        std::unique_ptr<IAudioCapture> cap = captures_ ? captures_() : nullptr;
        if (!cap || !cap->open(opt_.sample_rate, opt_.channels, opt_.chunk)) {
            fail_("Failed to open audio capture");
            return;
        }

        std::vector<int16_t> chunk;
        std::vector<int16_t> mono;
        try {
            while (!stop.requested()) {
                if (!cap->read(chunk)) {
                    fail_("Audio capture read failed");
                    break;
                }

                const int16_t* pcm = chunk.data();
                size_t n = chunk.size();
                if (opt_.channels > 1) {
                    // keep the first channel
                    const size_t ch = static_cast<size_t>(opt_.channels);
                    mono.resize(chunk.size() / ch);
                    for (size_t i = 0; i < mono.size(); ++i) mono[i] = chunk[i * ch];
                    pcm = mono.data();
                    n = mono.size();
                }

                const auto scores = model->score(pcm, n);
                for (const auto& s : scores) {
                    if (s.score <= opt_.threshold) continue;
                    if (!try_accept_(std::chrono::steady_clock::now())) continue;

                    record_(s.name, s.score);
                    std::cout << "[Detection] wake word '" << s.name << "' score " << s.score << "\n";

                    if (callback) {
                        try {
                            callback(s.name, s.score);
                        } catch (const std::exception& e) {
                            std::cerr << "[Detection] callback failed: " << e.what() << "\n";
                        }
                    }
                    notify_(stop);
                }
            }
        } catch (const std::exception& e) {
            fail_(std::string("Detection loop aborted: ") + e.what());
        }

        cap->close();
    }

    bool DetectionWorker::try_accept_(std::chrono::steady_clock::time_point now) {
        std::lock_guard lk(cooldown_mtx_);
        if (last_detection_ && now - *last_detection_ < opt_.cooldown) return false;
        last_detection_ = now;
        return true;
    }

    void DetectionWorker::record_(const std::string& model, float score) {
        std::lock_guard lk(events_mtx_);
        events_.push_back({model, score, std::chrono::system_clock::now()});
        while (events_.size() > opt_.max_events) events_.pop_front();
        ++detections_;
    }

    void DetectionWorker::notify_(CancelToken& stop) {
        display_.render_text(opt_.notify_text, opt_.notify_color, opt_.notify_scale, opt_.notify_background);
        stop.sleep_for(opt_.notify_hold);
        display_.clear();
    }

    void DetectionWorker::fail_(const std::string& msg) {
        std::cerr << "[Detection] " << msg << "\n";
        std::lock_guard lk(events_mtx_);
        last_error_ = msg;
    }

    DetectionStatus DetectionWorker::status() const {
        DetectionStatus s;
        s.active = slot_.alive();
        {
            std::lock_guard mk(model_mtx_);
            s.model_loaded = model_ != nullptr;
            if (model_) s.models = model_->model_names();
        }
        {
            std::lock_guard ek(events_mtx_);
            s.detections = detections_;
            s.last_error = last_error_;
            if (!events_.empty()) {
                const std::chrono::duration<double> age = std::chrono::system_clock::now() - events_.back().at;
                s.last_detection_age_s = age.count();
            }
        }
        return s;
    }

    std::vector<DetectionEvent> DetectionWorker::recent_events() const {
        std::lock_guard lk(events_mtx_);
        return {events_.begin(), events_.end()};
    }
}
