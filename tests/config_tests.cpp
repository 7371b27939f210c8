#include <common/config.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>

#include <yaml-cpp/exceptions.h>

#include "fakes.hpp"

using rd_test::check;

namespace {
    rd::AppConfig load(const std::string& yaml) {
        const std::string path = rd_test::write_temp_file("rd_cfg", yaml);
        try {
            rd::AppConfig cfg = rd::load_config_yaml(path);
            std::filesystem::remove(path);
            return cfg;
        } catch (const std::exception&) {
            std::filesystem::remove(path);
            throw;
        }
    }

    bool load_throws(const std::string& yaml) {
        try {
            (void)load(yaml);
            return false;
        } catch (const std::runtime_error&) {
            return true;
        } catch (const YAML::Exception&) {
            return true;
        }
    }

    void test_defaults_for_empty_document() {
        const rd::AppConfig cfg = load("server: {}\n");
        check(cfg.server.port == 5000, "default port should be 5000");
        check(cfg.motors.left_forward == 23 && cfg.motors.left_backward == 24, "default left pins");
        check(cfg.motors.right_forward == 22 && cfg.motors.right_backward == 27, "default right pins");
        check(cfg.motors.default_speed == 100, "default speed should be 100");
        check(cfg.display.width == 240 && cfg.display.height == 240, "default panel size");
        check(cfg.display.color_order == "RGB", "default color order");
        check(cfg.playback.grace_ms == 100, "default grace period");
        check(cfg.detection.threshold == 0.5f, "default threshold");
        check(cfg.detection.cooldown_s == 2.0, "default cooldown");
        check(cfg.detection.models.empty(), "no models by default");
        check(cfg.audio.sample_rate == 16000 && cfg.audio.chunk == 1280, "default audio format");
    }

    void test_full_document_is_parsed() {
        const rd::AppConfig cfg = load(R"(
server:
  host: 127.0.0.1
  port: 8080
motors:
  left_forward: 5
  default_speed: 60
  pwm_hz: 500
display:
  backend: none
  width: 320
  height: 170
  color_order: BGR
  preview: false
playback:
  grace_ms: 50
  default_fps: 24
  animation_interp: linear
detection:
  threshold: 0.7
  cooldown_s: 1.5
  models:
    - name: hey_rover
    - name: stop_now
      param: /opt/m/stop.param
      bin: /opt/m/stop.bin
audio:
  device: hw:1,0
  channels: 2
notify:
  text: Hi
  color: [255, 0, 0]
  hold_ms: 250
)");
        check(cfg.server.host == "127.0.0.1" && cfg.server.port == 8080, "server section");
        check(cfg.motors.left_forward == 5 && cfg.motors.default_speed == 60 && cfg.motors.pwm_hz == 500,
              "motor section");
        check(cfg.motors.right_forward == 22, "unset motor pins keep defaults");
        check(cfg.display.backend == "none" && cfg.display.width == 320 && cfg.display.height == 170,
              "display section");
        check(cfg.display.color_order == "BGR" && !cfg.display.preview, "display order and preview");
        check(cfg.playback.grace_ms == 50 && cfg.playback.default_fps == 24.0, "playback section");
        check(cfg.playback.animation_interp == "linear", "animation interpolation");
        check(cfg.detection.threshold > 0.69f && cfg.detection.threshold < 0.71f, "threshold");
        check(cfg.detection.cooldown_s == 1.5, "cooldown");

        check(cfg.detection.models.size() == 2, "two models expected");
        if (cfg.detection.models.size() == 2) {
            check(cfg.detection.models[0].name == "hey_rover", "models keep their order");
            check(cfg.detection.models[0].param_path == "models/wakeword/hey_rover.ncnn.param",
                  "param path derives from the name");
            check(cfg.detection.models[1].bin_path == "/opt/m/stop.bin", "explicit bin path");
        }

        check(cfg.audio.device == "hw:1,0" && cfg.audio.channels == 2, "audio section");
        check(cfg.notify.text == "Hi" && cfg.notify.hold_ms == 250, "notify section");
        check(cfg.notify.color[0] == 255 && cfg.notify.color[1] == 0, "notify color");
    }

    void test_rejects_invalid_values() {
        check(load_throws("server:\n  port: 70000\n"), "port out of range should fail");
        check(load_throws("motors:\n  default_speed: 150\n"), "speed above 100 should fail");
        check(load_throws("motors:\n  pwm_hz: 0\n"), "zero PWM frequency should fail");
        check(load_throws("display:\n  color_order: GRB\n"), "unknown color order should fail");
        check(load_throws("display:\n  backend: hdmi\n"), "unknown backend should fail");
        check(load_throws("display:\n  width: 0\n"), "zero width should fail");
        check(load_throws("playback:\n  default_fps: 0\n"), "zero fps should fail");
        check(load_throws("detection:\n  threshold: 1.5\n"), "threshold above 1 should fail");
        check(load_throws("detection:\n  cooldown_s: -1\n"), "negative cooldown should fail");
        check(load_throws("detection:\n  models: hey_rover\n"), "models must be a list");
        check(load_throws("detection:\n  models:\n    - param: x\n"), "model without a name should fail");
        check(load_throws("detection:\n  models:\n    - name: a\n    - name: a\n"), "duplicate model should fail");
        check(load_throws("audio:\n  chunk: 0\n"), "zero chunk should fail");
        check(load_throws("notify:\n  color: [1, 2]\n"), "short color should fail");
        check(load_throws("notify:\n  background: [0, 0, 300]\n"), "channel out of range should fail");
    }

    void test_negative_grace_is_clamped() {
        const rd::AppConfig cfg = load("playback:\n  grace_ms: -20\n");
        check(cfg.playback.grace_ms == 0, "negative grace should clamp to zero");
    }

    void test_missing_file_throws() {
        bool threw = false;
        try {
            (void)rd::load_config_yaml("/nonexistent/rover.yaml");
        } catch (const YAML::Exception&) {
            threw = true;
        }
        check(threw, "missing config file should throw");
    }
}

int main() {
    test_defaults_for_empty_document();
    test_full_document_is_parsed();
    test_rejects_invalid_values();
    test_negative_grace_is_clamped();
    test_missing_file_throws();
    return rd_test::finish("config");
}
