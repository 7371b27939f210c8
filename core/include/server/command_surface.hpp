#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include <common/config.hpp>
#include <detection/detection_worker.hpp>
#include <display/display_sink.hpp>
#include <motor/motor_driver.hpp>
#include <playback/playback_worker.hpp>

namespace rd {
    struct Reply {
        int status = 200;
        nlohmann::json body;
    };

    // Request handlers, independent of the HTTP transport. Every handler
    // catches its own failures and answers with a JSON status object.
    class CommandSurface {
    public:
        CommandSurface(MotorDriver& motors,
                       IDisplaySink& display,
                       PlaybackWorker& playback,
                       DetectionWorker& detection,
                       NotifyConfig text_defaults);

        Reply api_info() const;

        // forward|backward|clockwise|anticlockwise|stop
        Reply drive(const std::string& action);

        Reply set_speed(const std::string& body);
        Reply set_side_speed(Side side, const std::string& body);
        Reply get_speed() const;

        Reply display_text(const std::string& body);
        Reply display_clear();

        Reply media_play(const std::string& body);
        Reply media_stop();
        Reply media_status() const;

        Reply wakeword_start(const std::string& body);
        Reply wakeword_stop();
        Reply wakeword_reload();
        Reply wakeword_status() const;
        Reply wakeword_events() const;

    private:
        void quiet_playback_();

        MotorDriver& motors_;
        IDisplaySink& display_;
        PlaybackWorker& playback_;
        DetectionWorker& detection_;
        NotifyConfig text_defaults_;
    };

    // {"status":"error","message":msg}
    Reply error_reply(int status, const std::string& msg);
}
