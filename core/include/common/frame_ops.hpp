#pragma once

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <string>

namespace rd {
    enum class ColorOrder {
        RGB,
        BGR
    };

    inline ColorOrder color_order_from_str(const std::string& s) {
        return s == "BGR" ? ColorOrder::BGR : ColorOrder::RGB;
    }

    inline int interp_from_str(const std::string& s) {
        if (s == "nearest") return cv::INTER_NEAREST;
        if (s == "cubic") return cv::INTER_CUBIC;
        if (s == "area") return cv::INTER_AREA;
        return cv::INTER_LINEAR;
    }

    // Stretches to the panel size; no-op when it already matches.
    inline cv::Mat resize_frame(const cv::Mat& src, int target_w, int target_h, int interp) {
        if (target_w <= 0 || target_h <= 0 || src.empty()) return src;
        if (src.cols == target_w && src.rows == target_h) return src;

        cv::Mat dst;
        cv::resize(src, dst, {target_w, target_h}, 0, 0, interp);
        return dst;
    }

    // Decoders hand out BGR; panels want their own channel order.
    inline cv::Mat bgr_to_order(const cv::Mat& bgr, ColorOrder order) {
        if (order == ColorOrder::BGR) return bgr;
        cv::Mat out;
        cv::cvtColor(bgr, out, cv::COLOR_BGR2RGB);
        return out;
    }

    // Drops alpha (BGRA from animated containers) and expands grayscale.
    inline cv::Mat ensure_bgr(const cv::Mat& src) {
        if (src.empty() || src.type() == CV_8UC3) return src;
        cv::Mat out;
        if (src.channels() == 4) {
            cv::cvtColor(src, out, cv::COLOR_BGRA2BGR);
        } else if (src.channels() == 1) {
            cv::cvtColor(src, out, cv::COLOR_GRAY2BGR);
        } else {
            src.convertTo(out, CV_8UC3);
        }
        return out;
    }

    inline cv::Mat invert_frame(const cv::Mat& src) {
        cv::Mat out;
        cv::bitwise_not(src, out); // 255 - v per channel
        return out;
    }
}
