#pragma once

#include <array>
#include <string>
#include <vector>

namespace rd {
    struct ServerConfig {
        std::string host = "0.0.0.0";
        int port = 5000;
    };

    // BCM pin numbers for the L298N driver
    struct MotorConfig {
        int left_forward = 23;
        int left_backward = 24;
        int right_forward = 22;
        int right_backward = 27;
        int left_enable = 5;
        int right_enable = 6;
        int pwm_hz = 1000;
        int default_speed = 100;
        std::string gpio_chip = "/dev/gpiochip0";
    };

    struct DisplayConfig {
        std::string backend = "fbdev"; // fbdev|none
        std::string device = "/dev/fb1";
        int width = 240;
        int height = 240;
        std::string color_order = "RGB"; // RGB|BGR
        bool preview = true;
        int jpeg_quality = 80;
    };

    struct PlaybackConfig {
        int grace_ms = 100;
        double default_fps = 30.0;
        int default_frame_ms = 100;
        std::string video_interp = "linear";
        std::string animation_interp = "nearest";
        int open_timeout_ms = 5000;
    };

    struct KeywordModelConfig {
        std::string name;
        std::string param_path;
        std::string bin_path;
    };

    struct DetectionConfig {
        float threshold = 0.5f;
        double cooldown_s = 2.0;
        double join_timeout_s = 2.0;

        std::string melspec_param = "models/wakeword/melspectrogram.ncnn.param";
        std::string melspec_bin = "models/wakeword/melspectrogram.ncnn.bin";
        std::string embedding_param = "models/wakeword/embedding.ncnn.param";
        std::string embedding_bin = "models/wakeword/embedding.ncnn.bin";
        int ncnn_threads = 1;

        std::vector<KeywordModelConfig> models;
    };

    struct AudioConfig {
        std::string device = "default";
        int sample_rate = 16000;
        int channels = 1;
        int chunk = 1280; // 80 ms at 16 kHz
    };

    struct NotifyConfig {
        std::string text = "Wake!";
        std::array<int, 3> color{255, 255, 255};      // RGB
        std::array<int, 3> background{0, 0, 0};       // RGB
        double scale = 1.0;
        int hold_ms = 1000;
    };

    struct AppConfig {
        ServerConfig server;
        MotorConfig motors;
        DisplayConfig display;
        PlaybackConfig playback;
        DetectionConfig detection;
        AudioConfig audio;
        NotifyConfig notify;
    };

    AppConfig load_config_yaml(const std::string& path);
}
