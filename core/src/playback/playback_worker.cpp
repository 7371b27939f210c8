#include <playback/playback_worker.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>
#include <utility>
#include <vector>

#include <common/frame_ops.hpp>

namespace rd {
    PlaybackWorker::PlaybackWorker(IDisplaySink& display, MediaFactory media, PlaybackOptions opt)
        : display_(display),
          media_(std::move(media)),
          opt_(opt) {}

    PlaybackWorker::~PlaybackWorker() {
        slot_.request_stop();
        slot_.join();
    }

    CommandStatus PlaybackWorker::start(const std::string& path, MediaKind kind) {
        namespace fs = std::filesystem;
        std::error_code ec;
        if (path.empty() || !fs::is_regular_file(fs::path(path), ec)) {
            std::cerr << "[Playback](start) source not found: " << path << "\n";
            return CommandStatus::failure_of(Failure::NotFound, "File not found: " + path);
        }

        std::lock_guard lk(start_mtx_);

        if (slot_.alive()) {
            slot_.request_stop();
            std::this_thread::sleep_for(opt_.grace);
            if (!slot_.join_for(opt_.grace)) {
                std::cerr << "[Playback](start) previous session still rendering, waiting for it.\n";
                slot_.join();
            }
        }

        {
            std::lock_guard st(state_mtx_);
            kind_ = to_string(kind);
            path_ = path;
            last_error_.clear();
        }
        frames_ = 0;

        const bool launched = slot_.launch([this, path, kind](CancelToken& stop) {
            run_(stop, path, kind);
        });
        if (!launched) {
            return CommandStatus::failure_of(Failure::Unavailable, "Playback worker busy");
        }

        std::cout << "[Playback](start) " << to_string(kind) << " " << path << "\n";
        return CommandStatus::success(std::string("Playing ") + to_string(kind) + ": " + path);
    }

    CommandStatus PlaybackWorker::stop() {
        if (!slot_.alive()) return CommandStatus::success("Nothing playing");
        slot_.request_stop();
        std::cout << "[Playback](stop) stop requested\n";
        return CommandStatus::success("Playback stopped");
    }

    bool PlaybackWorker::wait_idle(std::chrono::milliseconds timeout) {
        return slot_.join_for(timeout);
    }

    PlaybackStatus PlaybackWorker::status() const {
        PlaybackStatus s;
        s.active = slot_.alive();
        s.frames_rendered = frames_.load();
        std::lock_guard lk(state_mtx_);
        s.kind = kind_;
        s.path = path_;
        s.last_error = last_error_;
        return s;
    }

    void PlaybackWorker::run_(CancelToken& stop, const std::string& path, MediaKind kind) {
        bool ok = false;
        try {
            ok = kind == MediaKind::Video ? play_video_(stop, path) : play_animation_(stop, path);
        } catch (const cv::Exception& e) {
            fail_(std::string("OpenCV error: ") + e.what());
        } catch (const std::exception& e) {
            fail_(e.what());
        }
        std::cout << "[Playback] " << to_string(kind) << " " << path
                  << (ok ? " finished" : " aborted") << " after " << frames_.load() << " frames\n";
    }

    bool PlaybackWorker::play_video_(CancelToken& stop, const std::string& path) {
        auto dec = media_.video ? media_.video() : nullptr;
        if (!dec || !dec->open(path)) {
            fail_("Failed to open video: " + path);
            return false;
        }

        double fps = dec->fps();
        if (!(fps > 0.0)) fps = opt_.default_fps;
        const std::chrono::duration<double> interval(1.0 / fps);

        cv::Mat bgr;
        int64_t since_rewind = 0;
        while (!stop.requested()) {
            const ReadStatus rs = dec->read(bgr);
            if (rs == ReadStatus::EndOfStream) {
                if (since_rewind == 0) {
                    fail_("Video has no frames: " + path);
                    dec->close();
                    return false;
                }
                if (!dec->rewind()) {
                    fail_("Failed to rewind video: " + path);
                    dec->close();
                    return false;
                }
                since_rewind = 0;
                continue;
            }
            if (rs == ReadStatus::Error || bgr.empty()) {
                fail_("Failed to read video frame: " + path);
                dec->close();
                return false;
            }
            ++since_rewind;

            cv::Mat out = resize_frame(ensure_bgr(bgr), display_.width(), display_.height(), opt_.video_interp);
            out = bgr_to_order(out, display_.color_order());
            out = invert_frame(out);
            present_(out);

            stop.sleep_for(interval);
        }

        dec->close();
        return true;
    }

    bool PlaybackWorker::play_animation_(CancelToken& stop, const std::string& path) {
        auto src = media_.animation ? media_.animation() : nullptr;
        if (!src || !src->open(path)) {
            fail_("Failed to open animation: " + path);
            return false;
        }

        // containers that cannot report a count are a single still
        const int n = std::max(1, src->frame_count());
        std::vector<cv::Mat> prepared(static_cast<size_t>(n));

        while (!stop.requested()) {
            for (int i = 0; i < n; ++i) {
                if (stop.requested()) break;

                cv::Mat& out = prepared[static_cast<size_t>(i)];
                if (out.empty()) {
                    const cv::Mat& raw = src->frame(i);
                    if (raw.empty()) {
                        fail_("Empty animation frame " + std::to_string(i) + ": " + path);
                        return false;
                    }
                    cv::Mat ordered = bgr_to_order(ensure_bgr(raw), display_.color_order());
                    out = resize_frame(ordered, display_.width(), display_.height(), opt_.animation_interp);
                }
                present_(out);

                double d = src->duration_s(i);
                if (!(d > 0.0)) d = opt_.default_frame_s;
                if (!stop.sleep_for(std::chrono::duration<double>(d))) break;
            }
        }
        return true;
    }

    void PlaybackWorker::present_(const cv::Mat& frame) {
        if (!display_.render(frame)) {
            std::cerr << "[Playback](present) display rejected frame\n";
            return;
        }
        frames_.fetch_add(1);
    }

    void PlaybackWorker::fail_(const std::string& msg) {
        std::cerr << "[Playback] " << msg << "\n";
        std::lock_guard lk(state_mtx_);
        last_error_ = msg;
    }
}
