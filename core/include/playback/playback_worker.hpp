#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include <common/cancellation.hpp>
#include <common/status.hpp>
#include <display/display_sink.hpp>
#include <media/media_factory.hpp>

namespace rd {
    struct PlaybackOptions {
        // drain period granted to the previous session's in-flight render
        std::chrono::milliseconds grace{100};

        double default_fps = 30.0;      // when the video declares none
        double default_frame_s = 0.1;   // when an animation frame declares none

        int video_interp = cv::INTER_LINEAR;
        int animation_interp = cv::INTER_NEAREST;
    };

    struct PlaybackStatus {
        bool active = false;
        std::string kind;
        std::string path;
        uint64_t frames_rendered = 0;
        std::string last_error;
    };

    class PlaybackWorker {
    public:
        PlaybackWorker(IDisplaySink& display, MediaFactory media, PlaybackOptions opt);
        ~PlaybackWorker();

        PlaybackWorker(const PlaybackWorker&) = delete;
        PlaybackWorker& operator=(const PlaybackWorker&) = delete;

        // Validates the source, drains any running session and launches a new
        // one. Returns before the first frame is rendered.
        CommandStatus start(const std::string& path, MediaKind kind);

        // Requests cancellation and returns immediately.
        CommandStatus stop();

        // Waits for the current session (if any) to exit.
        bool wait_idle(std::chrono::milliseconds timeout);

        PlaybackStatus status() const;

    private:
        void run_(CancelToken& stop, const std::string& path, MediaKind kind);
        bool play_video_(CancelToken& stop, const std::string& path);
        bool play_animation_(CancelToken& stop, const std::string& path);
        void present_(const cv::Mat& frame);
        void fail_(const std::string& msg);

        IDisplaySink& display_;
        MediaFactory media_;
        PlaybackOptions opt_;

        std::mutex start_mtx_;

        mutable std::mutex state_mtx_;
        std::string kind_;
        std::string path_;
        std::string last_error_;
        std::atomic<uint64_t> frames_{0};

        // declared last: joined before the members above go away
        WorkerSlot slot_{"playback"};
    };
}
