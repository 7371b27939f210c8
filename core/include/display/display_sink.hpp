#pragma once

#include <mutex>
#include <opencv2/core.hpp>
#include <string>

#include <common/frame_ops.hpp>

namespace rd {
    // RGB triplet in the 0..255 range, independent of the panel's channel order.
    struct Rgb {
        int r = 0;
        int g = 0;
        int b = 0;
    };

    // A physical (or virtual) panel. Frames passed to render() are CV_8UC3,
    // already at width() x height() and in color_order().
    // render() is serialized: playback, detection notifications and HTTP
    // handlers may call it concurrently and each frame is pushed whole.
    class IDisplaySink {
    public:
        IDisplaySink() = default;
        virtual ~IDisplaySink() = default;

        IDisplaySink(const IDisplaySink&) = delete;
        IDisplaySink& operator=(const IDisplaySink&) = delete;

        virtual int width() const = 0;
        virtual int height() const = 0;
        virtual ColorOrder color_order() const = 0;

        bool render(const cv::Mat& frame);

        // Centered single-line text on a solid background.
        virtual bool render_text(const std::string& text,
                                 Rgb color,
                                 double scale,
                                 Rgb background);

        virtual bool clear();

    protected:
        // Called with the render lock held.
        virtual bool render_frame_(const cv::Mat& frame) = 0;

    private:
        std::mutex render_mtx_;
    };

    // Native-size frame with `text` centered, in the given channel order.
    cv::Mat make_text_frame(int width,
                            int height,
                            ColorOrder order,
                            const std::string& text,
                            Rgb color,
                            double scale,
                            Rgb background);
}
