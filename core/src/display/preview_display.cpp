#include <display/preview_display.hpp>

#include <iostream>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <utility>

namespace rd {
    void FrameHub::publish(std::shared_ptr<const std::vector<uint8_t>> jpeg) {
        {
            std::lock_guard lk(mtx_);
            last_jpeg_ = std::move(jpeg);
            ++seq_;
        }
        cv_.notify_all();
    }

    std::shared_ptr<const std::vector<uint8_t>> FrameHub::latest(uint64_t* seq) const {
        std::lock_guard lk(mtx_);
        if (seq) *seq = seq_;
        return last_jpeg_;
    }

    uint64_t FrameHub::wait_newer(uint64_t after,
                                  std::chrono::milliseconds timeout,
                                  std::shared_ptr<const std::vector<uint8_t>>& out) const {
        std::unique_lock lk(mtx_);
        if (!cv_.wait_for(lk, timeout, [&] { return seq_ != after || closed_; })) return after;
        if (closed_) return after;
        out = last_jpeg_;
        return seq_;
    }

    void FrameHub::close() {
        {
            std::lock_guard lk(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    void FrameHub::reopen() {
        std::lock_guard lk(mtx_);
        closed_ = false;
    }

    bool FrameHub::closed() const {
        std::lock_guard lk(mtx_);
        return closed_;
    }

    PreviewDisplay::PreviewDisplay(std::unique_ptr<IDisplaySink> inner,
                                   int width,
                                   int height,
                                   ColorOrder order,
                                   int jpeg_quality)
        : inner_(std::move(inner)),
          width_(width),
          height_(height),
          order_(order),
          jpeg_quality_(jpeg_quality) {}

    bool PreviewDisplay::render_frame_(const cv::Mat& frame) {
        bool ok = true;
        if (inner_) ok = inner_->render(frame);
        if (frame.empty() || frame.type() != CV_8UC3) return false;

        // imencode expects BGR
        cv::Mat bgr;
        if (order_ == ColorOrder::RGB) cv::cvtColor(frame, bgr, cv::COLOR_RGB2BGR);
        else bgr = frame;

        std::vector<uint8_t> tmp;
        std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality_};
        if (!cv::imencode(".jpg", bgr, tmp, params)) {
            std::cerr << "[Preview](render) imencode failed\n";
            return false;
        }
        hub_.publish(std::make_shared<const std::vector<uint8_t>>(std::move(tmp)));
        return ok;
    }
}
