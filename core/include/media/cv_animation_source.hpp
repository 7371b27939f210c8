#pragma once

#include <media/animation_source.hpp>

#include <vector>

namespace rd {
    // GIF / APNG / animated WebP through cv::imreadanimation, anything else
    // cv::imread can load as a single static frame.
    class CvAnimationSource : public IAnimationSource {
    public:
        bool open(const std::string& path) override;
        int frame_count() const override { return static_cast<int>(frames_.size()); }
        const cv::Mat& frame(int i) const override { return frames_.at(static_cast<size_t>(i)); }
        double duration_s(int i) const override;

    private:
        std::vector<cv::Mat> frames_;
        std::vector<int> durations_ms_;
    };
}
