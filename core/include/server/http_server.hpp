#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace rd {
    class CommandSurface;
    class FrameHub;

    class HttpServer {
    public:
        // `hub` may be null when the panel preview is disabled.
        HttpServer(std::string host, int port, CommandSurface& commands, FrameHub* hub);
        ~HttpServer();

        HttpServer(const HttpServer&) = delete;
        HttpServer& operator=(const HttpServer&) = delete;

        // Start http server in bg thread
        bool start();
        void stop();

        bool running() const { return running_; }

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;

        void register_routes_();

        std::string host_;
        int port_;
        CommandSurface& commands_;
        FrameHub* hub_;

        std::thread server_thread_;
        std::atomic<bool> running_{false};
    };
}
