#include <server/command_surface.hpp>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <utility>

#include <httplib.h>

namespace rd {
    using nlohmann::json;

    namespace {
        constexpr auto kQuietTimeout = std::chrono::milliseconds(1000);

        bool parse_body(const std::string& body, json& out) {
            if (body.empty()) return false;
            out = json::parse(body, nullptr, false);
            return !out.is_discarded() && out.is_object();
        }

        // Accepts integers, floats (truncated) and integer strings. Values
        // beyond the int64 range saturate so range checks still reject them.
        bool parse_int(const json& v, int64_t& out) {
            if (v.is_number_unsigned()) {
                const uint64_t u = v.get<uint64_t>();
                out = u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
                    ? std::numeric_limits<int64_t>::max()
                    : static_cast<int64_t>(u);
                return true;
            }
            if (v.is_number_integer()) {
                out = v.get<int64_t>();
                return true;
            }
            if (v.is_number_float()) {
                const double d = v.get<double>();
                if (!std::isfinite(d)) return false;
                if (d >= 9.0e18) out = std::numeric_limits<int64_t>::max();
                else if (d <= -9.0e18) out = std::numeric_limits<int64_t>::min();
                else out = static_cast<int64_t>(d);
                return true;
            }
            if (v.is_string()) {
                const std::string s = v.get<std::string>();
                size_t i = 0;
                while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
                size_t j = s.size();
                while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
                if (i == j) return false;
                size_t k = i;
                if (s[k] == '+' || s[k] == '-') ++k;
                if (k == j) return false;
                for (size_t p = k; p < j; ++p) {
                    if (!std::isdigit(static_cast<unsigned char>(s[p]))) return false;
                }
                try {
                    out = std::stoll(s.substr(i, j - i));
                } catch (const std::out_of_range&) {
                    out = s[i] == '-' ? std::numeric_limits<int64_t>::min() : std::numeric_limits<int64_t>::max();
                }
                return true;
            }
            return false;
        }

        // 0..100, or a 400 reply in `err`.
        bool parse_speed(const std::string& body, int& speed, Reply& err) {
            json req;
            if (!parse_body(body, req) || !req.contains("speed")) {
                err = error_reply(400, "Missing speed parameter");
                return false;
            }
            int64_t v = 0;
            if (!parse_int(req["speed"], v)) {
                err = error_reply(400, "Invalid speed value");
                return false;
            }
            if (v < 0 || v > 100) {
                err = error_reply(400, "Speed must be between 0 and 100");
                return false;
            }
            speed = static_cast<int>(v);
            return true;
        }

        Rgb parse_rgb(const json& v, Rgb def) {
            if (!v.is_array() || v.size() != 3) return def;
            Rgb c;
            int* ch[3] = {&c.r, &c.g, &c.b};
            for (size_t i = 0; i < 3; ++i) {
                int64_t x = 0;
                if (!parse_int(v[i], x) || x < 0 || x > 255) return def;
                *ch[i] = static_cast<int>(x);
            }
            return c;
        }

        Rgb to_rgb(const std::array<int, 3>& a) {
            return Rgb{a[0], a[1], a[2]};
        }

        Reply ok_reply(json body) {
            body["status"] = "success";
            return Reply{200, std::move(body)};
        }

        // Runs on the detection thread, so the worst case (connect + write +
        // read) has to stay well under the detector's join timeout.
        constexpr long kCallbackTimeoutUs = 250000;

        // Posts each detection to an external listener.
        DetectionCallback make_http_callback(const std::string& url) {
            const auto scheme = url.find("://");
            const auto slash = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
            const std::string host = slash == std::string::npos ? url : url.substr(0, slash);
            const std::string path = slash == std::string::npos ? "/" : url.substr(slash);

            return [host, path](const std::string& model, float score) {
                httplib::Client cli(host);
                cli.set_connection_timeout(0, kCallbackTimeoutUs);
                cli.set_write_timeout(0, kCallbackTimeoutUs);
                cli.set_read_timeout(0, kCallbackTimeoutUs);
                const json payload = {{"event", "wake_word"}, {"model", model}, {"score", score}};
                auto res = cli.Post(path, payload.dump(), "application/json");
                if (!res) {
                    std::cerr << "[Commands] wake-word callback to " << host << path << " failed: "
                              << httplib::to_string(res.error()) << "\n";
                }
            };
        }
    } // namespace

    Reply error_reply(int status, const std::string& msg) {
        return Reply{status, json{{"status", "error"}, {"message", msg}}};
    }

    CommandSurface::CommandSurface(MotorDriver& motors,
                                   IDisplaySink& display,
                                   PlaybackWorker& playback,
                                   DetectionWorker& detection,
                                   NotifyConfig text_defaults)
        : motors_(motors),
          display_(display),
          playback_(playback),
          detection_(detection),
          text_defaults_(std::move(text_defaults)) {}

    Reply CommandSurface::api_info() const {
        return Reply{200, json{
            {"message", "RoverDeck control API (L298N drive, display, wake word)"},
            {"current_speed", motors_.speed()},
            {"endpoints", {
                {"/forward", "Move forward"},
                {"/backward", "Move backward"},
                {"/rotate/clockwise", "Rotate clockwise at center"},
                {"/rotate/anticlockwise", "Rotate anticlockwise at center"},
                {"/stop", "Stop all motors"},
                {"/speed/set", "Set speed (POST with JSON: {\"speed\": 0-100})"},
                {"/speed/get", "Get current speed"},
                {"/speed/left", "Set left motor speed (POST with JSON: {\"speed\": 0-100})"},
                {"/speed/right", "Set right motor speed (POST with JSON: {\"speed\": 0-100})"},
                {"/display/text", "Show text (POST with JSON: {\"text\", \"color\", \"background\", \"scale\"})"},
                {"/display/clear", "Clear the display"},
                {"/media/play", "Play media (POST with JSON: {\"path\", \"kind\": \"video\"|\"animation\"})"},
                {"/media/stop", "Stop media playback"},
                {"/media/status", "Playback status"},
                {"/wakeword/start", "Start wake-word detection (optional JSON: {\"callback_url\"})"},
                {"/wakeword/stop", "Stop wake-word detection"},
                {"/wakeword/reload", "Rebuild the wake-word model on next start"},
                {"/wakeword/status", "Detection status"},
                {"/wakeword/events", "Recent detections"},
                {"/display/snapshot", "Latest panel frame (JPEG)"},
                {"/display/stream", "Panel preview (MJPEG)"}
            }}
        }};
    }

    Reply CommandSurface::drive(const std::string& action) {
        bool ok = false;
        std::string done;
        try {
            if (action == "forward") {
                ok = motors_.forward();
                done = "moving forward";
            } else if (action == "backward") {
                ok = motors_.backward();
                done = "moving backward";
            } else if (action == "clockwise") {
                ok = motors_.rotate_clockwise();
                done = "rotating clockwise";
            } else if (action == "anticlockwise") {
                ok = motors_.rotate_anticlockwise();
                done = "rotating anticlockwise";
            } else if (action == "stop") {
                ok = motors_.stop_all();
                done = "stopped";
            } else {
                return error_reply(404, "Unknown drive action: " + action);
            }
        } catch (const std::exception& e) {
            std::cerr << "[Commands](drive) " << action << ": " << e.what() << "\n";
            return error_reply(500, e.what());
        }

        std::cout << "[Commands] " << action << " - speed " << motors_.speed() << "%\n";
        if (!ok) return error_reply(500, "GPIO write failed while " + done);
        return ok_reply({{"action", done}});
    }

    Reply CommandSurface::set_speed(const std::string& body) {
        int speed = 0;
        Reply err;
        if (!parse_speed(body, speed, err)) return err;

        const int before = motors_.speed();
        if (!motors_.set_speed_all(speed)) return error_reply(500, "Failed to apply speed");
        std::cout << "[Commands] speed changed: " << before << "% -> " << speed << "%\n";
        return ok_reply({{"speed", speed}});
    }

    Reply CommandSurface::set_side_speed(Side side, const std::string& body) {
        const char* name = side == Side::Left ? "left" : "right";
        int speed = 0;
        Reply err;
        if (!parse_speed(body, speed, err)) return err;

        if (!motors_.set_speed(side, speed)) return error_reply(500, "Failed to apply speed");
        std::cout << "[Commands] " << name << " motor speed set: " << speed << "%\n";
        return ok_reply({{"motor", name}, {"speed", speed}});
    }

    Reply CommandSurface::get_speed() const {
        return ok_reply({
            {"speed", motors_.speed()},
            {"left", motors_.speed(Side::Left)},
            {"right", motors_.speed(Side::Right)}
        });
    }

    void CommandSurface::quiet_playback_() {
        playback_.stop();
        if (!playback_.wait_idle(kQuietTimeout)) {
            std::cerr << "[Commands] playback still running, display may be overwritten\n";
        }
    }

    Reply CommandSurface::display_text(const std::string& body) {
        json req;
        if (!parse_body(body, req) || !req.contains("text") || !req["text"].is_string()) {
            return error_reply(400, "Missing text parameter");
        }
        const std::string text = req["text"].get<std::string>();
        const Rgb color = parse_rgb(req.value("color", json()), to_rgb(text_defaults_.color));
        const Rgb bg = parse_rgb(req.value("background", json()), to_rgb(text_defaults_.background));
        double scale = text_defaults_.scale;
        if (req.contains("scale") && req["scale"].is_number()) scale = req["scale"].get<double>();
        if (scale <= 0.0) return error_reply(400, "Scale must be positive");

        try {
            quiet_playback_();
            if (!display_.render_text(text, color, scale, bg)) {
                return error_reply(500, "Display rejected the frame");
            }
        } catch (const std::exception& e) {
            std::cerr << "[Commands](display_text) " << e.what() << "\n";
            return error_reply(500, e.what());
        }
        return ok_reply({{"action", "text displayed"}, {"text", text}});
    }

    Reply CommandSurface::display_clear() {
        try {
            quiet_playback_();
            if (!display_.clear()) return error_reply(500, "Display rejected the frame");
        } catch (const std::exception& e) {
            std::cerr << "[Commands](display_clear) " << e.what() << "\n";
            return error_reply(500, e.what());
        }
        return ok_reply({{"action", "display cleared"}});
    }

    Reply CommandSurface::media_play(const std::string& body) {
        json req;
        if (!parse_body(body, req) || !req.contains("path") || !req["path"].is_string()) {
            return error_reply(400, "Missing path parameter");
        }
        const std::string path = req["path"].get<std::string>();

        MediaKind kind = MediaKind::Video;
        if (req.contains("kind") && !req["kind"].is_string()) {
            return error_reply(400, "Kind must be 'video' or 'animation'");
        }
        const std::string kind_str = req.value("kind", std::string("video"));
        if (!parse_media_kind(kind_str, kind)) {
            return error_reply(400, "Kind must be 'video' or 'animation'");
        }

        const CommandStatus st = playback_.start(path, kind);
        if (!st.ok) {
            const int code = st.failure == Failure::NotFound ? 404 : 503;
            return error_reply(code, st.message);
        }
        return ok_reply({{"message", st.message}, {"kind", to_string(kind)}, {"path", path}});
    }

    Reply CommandSurface::media_stop() {
        const CommandStatus st = playback_.stop();
        return ok_reply({{"message", st.message}});
    }

    Reply CommandSurface::media_status() const {
        const PlaybackStatus s = playback_.status();
        json body{
            {"active", s.active},
            {"kind", s.kind},
            {"path", s.path},
            {"frames_rendered", s.frames_rendered}
        };
        if (!s.last_error.empty()) body["last_error"] = s.last_error;
        return ok_reply(std::move(body));
    }

    Reply CommandSurface::wakeword_start(const std::string& body) {
        DetectionCallback cb;
        json req;
        if (parse_body(body, req) && req.contains("callback_url")) {
            if (!req["callback_url"].is_string() || req["callback_url"].get<std::string>().empty()) {
                return error_reply(400, "callback_url must be a non-empty string");
            }
            cb = make_http_callback(req["callback_url"].get<std::string>());
        }

        const CommandStatus st = detection_.start(std::move(cb));
        if (!st.ok) return error_reply(503, st.message);
        return ok_reply({{"message", st.message}});
    }

    Reply CommandSurface::wakeword_stop() {
        const CommandStatus st = detection_.stop();
        if (!st.ok) return error_reply(503, st.message);
        return ok_reply({{"message", st.message}});
    }

    Reply CommandSurface::wakeword_reload() {
        const CommandStatus st = detection_.reload_model();
        if (!st.ok) return error_reply(503, st.message);
        return ok_reply({{"message", st.message}});
    }

    Reply CommandSurface::wakeword_status() const {
        const DetectionStatus s = detection_.status();
        json body{
            {"active", s.active},
            {"model_loaded", s.model_loaded},
            {"models", s.models},
            {"detections", s.detections}
        };
        if (s.last_detection_age_s >= 0.0) body["last_detection_age_s"] = s.last_detection_age_s;
        if (!s.last_error.empty()) body["last_error"] = s.last_error;
        return ok_reply(std::move(body));
    }

    Reply CommandSurface::wakeword_events() const {
        json events = json::array();
        for (const auto& e : detection_.recent_events()) {
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                e.at.time_since_epoch()).count();
            events.push_back({{"model", e.model}, {"score", e.score}, {"unix_ms", ms}});
        }
        return ok_reply({{"events", std::move(events)}});
    }
}
