#include <common/config.hpp>
#include <common/frame_ops.hpp>
#include <audio/alsa_capture.hpp>
#include <detection/detection_worker.hpp>
#include <display/display_factory.hpp>
#include <display/preview_display.hpp>
#include <media/media_factory.hpp>
#include <motor/motor_driver.hpp>
#include <motor/gpiod_gpio.hpp>
#include <playback/playback_worker.hpp>
#include <server/command_surface.hpp>
#include <server/http_server.hpp>
#include <wakeword/ncnn_keyword_classifier.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

static rd::PlaybackOptions playback_options(const rd::PlaybackConfig& c) {
    rd::PlaybackOptions o;
    o.grace = std::chrono::milliseconds(c.grace_ms);
    o.default_fps = c.default_fps;
    o.default_frame_s = c.default_frame_ms / 1000.0;
    o.video_interp = rd::interp_from_str(c.video_interp);
    o.animation_interp = rd::interp_from_str(c.animation_interp);
    return o;
}

static rd::DetectionOptions detection_options(const rd::AppConfig& cfg) {
    using ms = std::chrono::milliseconds;
    rd::DetectionOptions o;
    o.threshold = cfg.detection.threshold;
    o.cooldown = ms(static_cast<int64_t>(cfg.detection.cooldown_s * 1000.0));
    o.join_timeout = ms(static_cast<int64_t>(cfg.detection.join_timeout_s * 1000.0));
    o.sample_rate = cfg.audio.sample_rate;
    o.channels = cfg.audio.channels;
    o.chunk = cfg.audio.chunk;
    o.notify_text = cfg.notify.text;
    o.notify_color = {cfg.notify.color[0], cfg.notify.color[1], cfg.notify.color[2]};
    o.notify_background = {cfg.notify.background[0], cfg.notify.background[1], cfg.notify.background[2]};
    o.notify_scale = cfg.notify.scale;
    o.notify_hold = ms(cfg.notify.hold_ms);
    return o;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::string cfg_path = "configs/rover.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    rd::AppConfig cfg;
    try {
        cfg = rd::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::cout << "==================================================\n"
              << "RoverDeck starting...\n"
              << "==================================================\n";

    rd::GpiodGpio gpio(cfg.motors.gpio_chip);
    rd::MotorDriver motors(gpio, cfg.motors);
    if (!motors.setup()) {
        std::cerr << "[Main] GPIO setup failed, drive commands will report errors\n";
    } else {
        std::cout << "[Main] GPIO initialized\n";
    }

    rd::FrameHub* hub = nullptr;
    std::unique_ptr<rd::IDisplaySink> display;
    try {
        display = rd::make_display(cfg.display, &hub);
    } catch (const std::exception& e) {
        std::cerr << "[Main] display: " << e.what() << "\n";
        motors.shutdown();
        return 1;
    }
    if (!display->clear()) std::cerr << "[Main] display rejected the initial clear\n";

    rd::PlaybackWorker playback(*display,
                                rd::make_media_factory(cfg.playback.open_timeout_ms),
                                playback_options(cfg.playback));

    rd::NcnnKeywordClassifierConfig kw;
    kw.melspec_param = cfg.detection.melspec_param;
    kw.melspec_bin = cfg.detection.melspec_bin;
    kw.embedding_param = cfg.detection.embedding_param;
    kw.embedding_bin = cfg.detection.embedding_bin;
    kw.models = cfg.detection.models;
    kw.ncnn_threads = cfg.detection.ncnn_threads;

    const std::string audio_device = cfg.audio.device;
    rd::DetectionWorker detection(
        *display,
        [kw]() -> std::unique_ptr<rd::IKeywordClassifier> {
            return std::make_unique<rd::NcnnKeywordClassifier>(kw);
        },
        [audio_device]() -> std::unique_ptr<rd::IAudioCapture> {
            return std::make_unique<rd::AlsaCapture>(audio_device);
        },
        detection_options(cfg));

    rd::CommandSurface commands(motors, *display, playback, detection, cfg.notify);
    rd::HttpServer server(cfg.server.host, cfg.server.port, commands, hub);
    if (!server.start()) {
        motors.shutdown();
        return 1;
    }

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "Shutting down...\n";
    server.stop();

    const auto det = detection.stop();
    if (!det.ok) std::cerr << "[Main] " << det.message << "\n";

    playback.stop();
    if (!playback.wait_idle(std::chrono::milliseconds(2000))) {
        std::cerr << "[Main] playback worker slow to exit, waiting\n";
    }

    if (!display->clear()) std::cerr << "[Main] display rejected the final clear\n";
    motors.shutdown();
    return 0;
}
