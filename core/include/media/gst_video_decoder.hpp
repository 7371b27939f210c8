#pragma once

#include <media/video_decoder.hpp>
#include <string>

struct _GstElement;
using GstElement = _GstElement;

namespace rd {
    class GstVideoDecoder : public IVideoDecoder {
    public:
        explicit GstVideoDecoder(int open_timeout_ms = 5000);
        ~GstVideoDecoder() override;

        GstVideoDecoder(const GstVideoDecoder&) = delete;
        GstVideoDecoder& operator=(const GstVideoDecoder&) = delete;

        bool open(const std::string& path) override;
        double fps() const override { return fps_; }
        ReadStatus read(cv::Mat& bgr) override;
        bool rewind() override;
        void close() override;

    private:
        bool pipeline_error_();

        int open_timeout_ms_;
        std::string path_;
        double fps_ = 0.0;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;
    };
}
