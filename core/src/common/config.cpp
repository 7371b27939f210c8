#include <common/config.hpp>

#include <set>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace rd {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static double get_double(
        const YAML::Node& n, const char* key, double def) {
        return (n && n[key]) ? n[key].as<double>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static std::array<int, 3> get_rgb(
        const YAML::Node& n, const char* key, const std::array<int, 3>& def) {
        if (!n || !n[key]) return def;
        const auto v = n[key].as<std::vector<int>>();
        if (v.size() != 3) {
            throw std::runtime_error(std::string("[Config] ") + key + " must be [r, g, b]!");
        }
        std::array<int, 3> out{};
        for (size_t i = 0; i < 3; ++i) {
            if (v[i] < 0 || v[i] > 255) {
                throw std::runtime_error(std::string("[Config] ") + key + " channel out of range!");
            }
            out[i] = v[i];
        }
        return out;
    }

    static MotorConfig parse_motor_config(const YAML::Node& m) {
        MotorConfig c;
        if (!m) return c;
        c.left_forward = get_int(m, "left_forward", c.left_forward);
        c.left_backward = get_int(m, "left_backward", c.left_backward);
        c.right_forward = get_int(m, "right_forward", c.right_forward);
        c.right_backward = get_int(m, "right_backward", c.right_backward);
        c.left_enable = get_int(m, "left_enable", c.left_enable);
        c.right_enable = get_int(m, "right_enable", c.right_enable);
        c.pwm_hz = get_int(m, "pwm_hz", c.pwm_hz);
        c.default_speed = get_int(m, "default_speed", c.default_speed);
        c.gpio_chip = get_str(m, "gpio_chip", c.gpio_chip);

        if (c.default_speed < 0 || c.default_speed > 100) {
            throw std::runtime_error("[Config] motors.default_speed must be within 0..100!");
        }
        if (c.pwm_hz <= 0) {
            throw std::runtime_error("[Config] motors.pwm_hz must be > 0!");
        }
        return c;
    }

    static DisplayConfig parse_display_config(const YAML::Node& d) {
        DisplayConfig c;
        if (!d) return c;
        c.backend = get_str(d, "backend", c.backend);
        c.device = get_str(d, "device", c.device);
        c.width = get_int(d, "width", c.width);
        c.height = get_int(d, "height", c.height);
        c.color_order = get_str(d, "color_order", c.color_order);
        c.preview = get_bool(d, "preview", c.preview);
        c.jpeg_quality = get_int(d, "jpeg_quality", c.jpeg_quality);

        if (c.width <= 0 || c.height <= 0) {
            throw std::runtime_error("[Config] display width/height must be > 0!");
        }
        if (c.color_order != "RGB" && c.color_order != "BGR") {
            throw std::runtime_error("[Config] display.color_order must be RGB or BGR!");
        }
        if (c.backend != "fbdev" && c.backend != "none") {
            throw std::runtime_error("[Config] unknown display.backend: " + c.backend);
        }
        return c;
    }

    static PlaybackConfig parse_playback_config(const YAML::Node& p) {
        PlaybackConfig c;
        if (!p) return c;
        c.grace_ms = get_int(p, "grace_ms", c.grace_ms);
        c.default_fps = get_double(p, "default_fps", c.default_fps);
        c.default_frame_ms = get_int(p, "default_frame_ms", c.default_frame_ms);
        c.video_interp = get_str(p, "video_interp", c.video_interp);
        c.animation_interp = get_str(p, "animation_interp", c.animation_interp);
        c.open_timeout_ms = get_int(p, "open_timeout_ms", c.open_timeout_ms);

        if (c.grace_ms < 0) c.grace_ms = 0;
        if (c.default_fps <= 0.0) {
            throw std::runtime_error("[Config] playback.default_fps must be > 0!");
        }
        if (c.default_frame_ms <= 0) {
            throw std::runtime_error("[Config] playback.default_frame_ms must be > 0!");
        }
        return c;
    }

    static DetectionConfig parse_detection_config(const YAML::Node& d) {
        DetectionConfig c;
        if (!d) return c;
        c.threshold = static_cast<float>(get_double(d, "threshold", c.threshold));
        c.cooldown_s = get_double(d, "cooldown_s", c.cooldown_s);
        c.join_timeout_s = get_double(d, "join_timeout_s", c.join_timeout_s);
        c.melspec_param = get_str(d, "melspec_param", c.melspec_param);
        c.melspec_bin = get_str(d, "melspec_bin", c.melspec_bin);
        c.embedding_param = get_str(d, "embedding_param", c.embedding_param);
        c.embedding_bin = get_str(d, "embedding_bin", c.embedding_bin);
        c.ncnn_threads = get_int(d, "ncnn_threads", c.ncnn_threads);

        if (c.threshold <= 0.0f || c.threshold > 1.0f) {
            throw std::runtime_error("[Config] detection.threshold must be within (0, 1]!");
        }
        if (c.cooldown_s < 0.0 || c.join_timeout_s < 0.0) {
            throw std::runtime_error("[Config] detection timings must not be negative!");
        }

        auto models = d["models"];
        if (!models) return c;
        if (!models.IsSequence()) {
            throw std::runtime_error("[Config] detection.models must be a list!");
        }

        std::set<std::string> seen;
        for (const auto& m : models) {
            KeywordModelConfig km;
            km.name = get_str(m, "name", "");
            km.param_path = get_str(m, "param", "models/wakeword/" + km.name + ".ncnn.param");
            km.bin_path = get_str(m, "bin", "models/wakeword/" + km.name + ".ncnn.bin");
            if (km.name.empty()) {
                throw std::runtime_error("[Config] detection model without a name!");
            }
            if (!seen.insert(km.name).second) {
                throw std::runtime_error("[Config] duplicate detection model: " + km.name);
            }
            c.models.push_back(std::move(km));
        }
        return c;
    }

    static AudioConfig parse_audio_config(const YAML::Node& a) {
        AudioConfig c;
        if (!a) return c;
        c.device = get_str(a, "device", c.device);
        c.sample_rate = get_int(a, "sample_rate", c.sample_rate);
        c.channels = get_int(a, "channels", c.channels);
        c.chunk = get_int(a, "chunk", c.chunk);

        if (c.sample_rate <= 0 || c.channels <= 0 || c.chunk <= 0) {
            throw std::runtime_error("[Config] audio sample_rate/channels/chunk must be > 0!");
        }
        return c;
    }

    static NotifyConfig parse_notify_config(const YAML::Node& n) {
        NotifyConfig c;
        if (!n) return c;
        c.text = get_str(n, "text", c.text);
        c.color = get_rgb(n, "color", c.color);
        c.background = get_rgb(n, "background", c.background);
        c.scale = get_double(n, "scale", c.scale);
        c.hold_ms = get_int(n, "hold_ms", c.hold_ms);
        if (c.hold_ms < 0) c.hold_ms = 0;
        return c;
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        const YAML::Node srv = root["server"];
        cfg.server.host = get_str(srv, "host", cfg.server.host);
        cfg.server.port = get_int(srv, "port", cfg.server.port);
        if (cfg.server.port <= 0 || cfg.server.port > 65535) {
            throw std::runtime_error("[Config] server.port out of range!");
        }

        cfg.motors = parse_motor_config(root["motors"]);
        cfg.display = parse_display_config(root["display"]);
        cfg.playback = parse_playback_config(root["playback"]);
        cfg.detection = parse_detection_config(root["detection"]);
        cfg.audio = parse_audio_config(root["audio"]);
        cfg.notify = parse_notify_config(root["notify"]);
        return cfg;
    }
}
