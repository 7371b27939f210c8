#pragma once

#include <display/display_sink.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace rd {
    // Latest encoded panel frame, shared with HTTP readers.
    class FrameHub {
    public:
        void publish(std::shared_ptr<const std::vector<uint8_t>> jpeg);

        std::shared_ptr<const std::vector<uint8_t>> latest(uint64_t* seq = nullptr) const;

        // Blocks until a frame newer than `after` arrives, close() is called
        // or the timeout expires. Returns the sequence seen (== after on timeout).
        uint64_t wait_newer(uint64_t after,
                            std::chrono::milliseconds timeout,
                            std::shared_ptr<const std::vector<uint8_t>>& out) const;

        void close();
        void reopen();
        bool closed() const;

    private:
        mutable std::mutex mtx_;
        mutable std::condition_variable cv_;
        std::shared_ptr<const std::vector<uint8_t>> last_jpeg_;
        uint64_t seq_ = 0;
        bool closed_ = false;
    };

    // Mirrors every rendered frame into a FrameHub; forwards to `inner` when set.
    class PreviewDisplay : public IDisplaySink {
    public:
        PreviewDisplay(std::unique_ptr<IDisplaySink> inner,
                       int width,
                       int height,
                       ColorOrder order,
                       int jpeg_quality);

        int width() const override { return width_; }
        int height() const override { return height_; }
        ColorOrder color_order() const override { return order_; }

        FrameHub& hub() { return hub_; }

    protected:
        bool render_frame_(const cv::Mat& frame) override;

    private:
        std::unique_ptr<IDisplaySink> inner_;
        int width_;
        int height_;
        ColorOrder order_;
        int jpeg_quality_;
        FrameHub hub_;
    };
}
