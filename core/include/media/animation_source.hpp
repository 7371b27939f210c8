#pragma once

#include <opencv2/core.hpp>
#include <string>

namespace rd {
    struct IAnimationSource {
        virtual ~IAnimationSource() = default;
        virtual bool open(const std::string& path) = 0;
        // 1 for containers without multi-frame support.
        virtual int frame_count() const = 0;
        // BGR (or BGRA) frame `i`, 0 <= i < frame_count().
        virtual const cv::Mat& frame(int i) const = 0;
        // Declared duration of frame `i` in seconds; <= 0 when undeclared.
        virtual double duration_s(int i) const = 0;
    };
}
