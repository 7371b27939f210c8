#include <media/cv_animation_source.hpp>

#include <iostream>
#include <opencv2/imgcodecs.hpp>

namespace rd {
    bool CvAnimationSource::open(const std::string& path) {
        frames_.clear();
        durations_ms_.clear();

        cv::Animation anim;
        bool multi = false;
        try {
            multi = cv::imreadanimation(path, anim);
        } catch (const cv::Exception& e) {
            std::cerr << "[Animation](open) " << path << ": " << e.what() << "\n";
            multi = false;
        }

        if (multi && !anim.frames.empty()) {
            frames_ = std::move(anim.frames);
            durations_ms_ = std::move(anim.durations);
            return true;
        }

        // static fallback
        cv::Mat still = cv::imread(path, cv::IMREAD_COLOR);
        if (still.empty()) {
            std::cerr << "[Animation](open) cannot decode " << path << "\n";
            return false;
        }
        frames_.push_back(std::move(still));
        return true;
    }

    double CvAnimationSource::duration_s(int i) const {
        if (i < 0 || static_cast<size_t>(i) >= durations_ms_.size()) return 0.0;
        return static_cast<double>(durations_ms_[static_cast<size_t>(i)]) / 1000.0;
    }
}
