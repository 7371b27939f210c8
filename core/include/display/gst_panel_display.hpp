#pragma once

#include <display/display_sink.hpp>

#include <cstdint>
#include <string>

struct _GstElement;
using GstElement = _GstElement;

namespace rd {
    // Pushes raw frames through appsrc into a framebuffer panel (fbtft / fbdevsink).
    class GstPanelDisplay : public IDisplaySink {
    public:
        GstPanelDisplay(std::string device, int width, int height, ColorOrder order);
        ~GstPanelDisplay() override;

        GstPanelDisplay(const GstPanelDisplay&) = delete;
        GstPanelDisplay& operator=(const GstPanelDisplay&) = delete;

        bool start();
        void stop();

        int width() const override { return width_; }
        int height() const override { return height_; }
        ColorOrder color_order() const override { return order_; }

    protected:
        bool render_frame_(const cv::Mat& frame) override;

    private:
        std::string device_;
        int width_;
        int height_;
        ColorOrder order_;

        GstElement* pipeline_ = nullptr;
        GstElement* appsrc_ = nullptr;
        uint64_t frame_no_ = 0;
    };
}
