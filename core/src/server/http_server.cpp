#include <server/http_server.hpp>

#include <chrono>
#include <iostream>
#include <utility>

#include <httplib.h>

#include <display/preview_display.hpp>
#include <server/command_surface.hpp>

namespace rd {
    struct HttpServer::Impl {
        httplib::Server svr;
    };

    namespace {
        void send(httplib::Response& res, const Reply& r) {
            res.status = r.status;
            res.set_content(r.body.dump(), "application/json");
            res.set_header("Cache-Control", "no-cache");
        }

        // Keeps a throwing handler from tearing down the listen thread.
        template <class Fn>
        void guarded(httplib::Response& res, const char* route, Fn&& fn) {
            try {
                send(res, fn());
            } catch (const std::exception& e) {
                std::cerr << "[HTTP](" << route << ") " << e.what() << "\n";
                send(res, error_reply(500, e.what()));
            }
        }
    } // namespace

    HttpServer::HttpServer(std::string host, int port, CommandSurface& commands, FrameHub* hub)
        : impl_(std::make_unique<Impl>()),
          host_(std::move(host)),
          port_(port),
          commands_(commands),
          hub_(hub) {}

    HttpServer::~HttpServer() {
        stop();
    }

    void HttpServer::register_routes_() {
        auto& svr = impl_->svr;
        CommandSurface& c = commands_;

        svr.Get("/api", [&c](const httplib::Request&, httplib::Response& res) {
            guarded(res, "/api", [&] { return c.api_info(); });
        });

        // drive commands accept both verbs
        const std::pair<const char*, const char*> drives[] = {
            {"/forward", "forward"},
            {"/backward", "backward"},
            {"/rotate/clockwise", "clockwise"},
            {"/rotate/anticlockwise", "anticlockwise"},
            {"/stop", "stop"}
        };
        for (const auto& d : drives) {
            const std::string action = d.second;
            const char* route = d.first;
            auto handler = [&c, action, route](const httplib::Request&, httplib::Response& res) {
                guarded(res, route, [&] { return c.drive(action); });
            };
            svr.Get(route, handler);
            svr.Post(route, handler);
        }

        svr.Post("/speed/set", [&c](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "/speed/set", [&] { return c.set_speed(req.body); });
        });
        svr.Get("/speed/get", [&c](const httplib::Request&, httplib::Response& res) {
            guarded(res, "/speed/get", [&] { return c.get_speed(); });
        });
        svr.Post("/speed/left", [&c](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "/speed/left", [&] { return c.set_side_speed(Side::Left, req.body); });
        });
        svr.Post("/speed/right", [&c](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "/speed/right", [&] { return c.set_side_speed(Side::Right, req.body); });
        });

        svr.Post("/display/text", [&c](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "/display/text", [&] { return c.display_text(req.body); });
        });
        svr.Post("/display/clear", [&c](const httplib::Request&, httplib::Response& res) {
            guarded(res, "/display/clear", [&] { return c.display_clear(); });
        });

        svr.Post("/media/play", [&c](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "/media/play", [&] { return c.media_play(req.body); });
        });
        svr.Post("/media/stop", [&c](const httplib::Request&, httplib::Response& res) {
            guarded(res, "/media/stop", [&] { return c.media_stop(); });
        });
        svr.Get("/media/status", [&c](const httplib::Request&, httplib::Response& res) {
            guarded(res, "/media/status", [&] { return c.media_status(); });
        });

        svr.Post("/wakeword/start", [&c](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "/wakeword/start", [&] { return c.wakeword_start(req.body); });
        });
        svr.Post("/wakeword/stop", [&c](const httplib::Request&, httplib::Response& res) {
            guarded(res, "/wakeword/stop", [&] { return c.wakeword_stop(); });
        });
        svr.Post("/wakeword/reload", [&c](const httplib::Request&, httplib::Response& res) {
            guarded(res, "/wakeword/reload", [&] { return c.wakeword_reload(); });
        });
        svr.Get("/wakeword/status", [&c](const httplib::Request&, httplib::Response& res) {
            guarded(res, "/wakeword/status", [&] { return c.wakeword_status(); });
        });
        svr.Get("/wakeword/events", [&c](const httplib::Request&, httplib::Response& res) {
            guarded(res, "/wakeword/events", [&] { return c.wakeword_events(); });
        });

        // /display/snapshot -> last panel frame once
        svr.Get("/display/snapshot", [this](const httplib::Request&, httplib::Response& res) {
            if (!hub_) { res.status = 404; return; }
            auto jpeg = hub_->latest();
            if (!jpeg || jpeg->empty()) { res.status = 204; return; }
            res.set_content(reinterpret_cast<const char *>(jpeg->data()), jpeg->size(), "image/jpeg");
            res.set_header("Cache-Control", "no-cache");
        });

        // /display/stream -> MJPEG of everything rendered to the panel
        svr.Get("/display/stream", [this](const httplib::Request&, httplib::Response& res) {
            if (!hub_) { res.status = 404; return; }

            res.set_header("Cache-Control", "no-cache");
            res.set_header("Pragma", "no-cache");
            res.set_header("Connection", "close");

            const std::string boundary = "frame";
            res.set_chunked_content_provider(
                "multipart/x-mixed-replace; boundary=" + boundary,
                [this, boundary](size_t /*offset*/, httplib::DataSink& sink) {
                    uint64_t last_sent = 0;
                    hub_->latest(&last_sent);
                    // show the current panel contents right away
                    if (last_sent != 0) --last_sent;

                    while (running_) {
                        std::shared_ptr<const std::vector<uint8_t>> jpeg;
                        const uint64_t seq = hub_->wait_newer(last_sent, std::chrono::milliseconds(500), jpeg);
                        if (hub_->closed()) break;
                        if (seq == last_sent) continue;
                        last_sent = seq;
                        if (!jpeg || jpeg->empty()) continue;

                        std::string header =
                            "--" + boundary + "\r\n"
                            "Content-Type: image/jpeg\r\n"
                            "Content-Length: " + std::to_string(jpeg->size()) + "\r\n\r\n";

                        if (!sink.write(header.data(), header.size())) return false;
                        if (!sink.write(reinterpret_cast<const char *>(jpeg->data()), jpeg->size())) return false;
                        if (!sink.write("\r\n", 2)) return false;
                    }

                    sink.done();
                    return true;
                }
            );
        });

        svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });
    }

    bool HttpServer::start() {
        if (running_) return true;

        register_routes_();
        if (!impl_->svr.bind_to_port(host_, port_)) {
            std::cerr << "[HTTP](start) cannot bind " << host_ << ":" << port_ << "\n";
            return false;
        }
        running_ = true;
        if (hub_) hub_->reopen();

        server_thread_ = std::thread([this] {
            std::cout << "[HTTP] Control API: http://" << host_ << ":" << port_ << "/api\n";
            if (hub_) std::cout << "[HTTP] Panel preview: http://" << host_ << ":" << port_ << "/display/stream\n";
            if (!impl_->svr.listen_after_bind()) {
                std::cerr << "[HTTP] listen loop ended with an error\n";
            }
        });
        return true;
    }

    void HttpServer::stop() {
        if (!running_) return;
        running_ = false;

        if (hub_) hub_->close();
        if (impl_) impl_->svr.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }
}
