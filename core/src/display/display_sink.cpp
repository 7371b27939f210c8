#include <display/display_sink.hpp>

#include <algorithm>
#include <opencv2/imgproc.hpp>

namespace rd {
    namespace {
        cv::Scalar to_scalar(Rgb c, ColorOrder order) {
            if (order == ColorOrder::BGR) return cv::Scalar(c.b, c.g, c.r);
            return cv::Scalar(c.r, c.g, c.b);
        }
    } // namespace

    cv::Mat make_text_frame(int width,
                            int height,
                            ColorOrder order,
                            const std::string& text,
                            Rgb color,
                            double scale,
                            Rgb background) {
        cv::Mat frame(height, width, CV_8UC3, to_scalar(background, order));
        if (text.empty()) return frame;

        const int font = cv::FONT_HERSHEY_SIMPLEX;
        double s = scale > 0.0 ? scale : 1.0;
        const int thickness = std::max(1, static_cast<int>(s * 2.0));

        int baseline = 0;
        cv::Size ts = cv::getTextSize(text, font, s, thickness, &baseline);

        // shrink until it fits the panel
        while ((ts.width > width || ts.height + baseline > height) && s > 0.2) {
            s *= 0.9;
            ts = cv::getTextSize(text, font, s, thickness, &baseline);
        }

        const cv::Point org((width - ts.width) / 2, (height + ts.height) / 2);
        cv::putText(frame, text, org, font, s, to_scalar(color, order), thickness, cv::LINE_AA);
        return frame;
    }

    bool IDisplaySink::render(const cv::Mat& frame) {
        std::lock_guard lk(render_mtx_);
        return render_frame_(frame);
    }

    bool IDisplaySink::render_text(const std::string& text,
                                   Rgb color,
                                   double scale,
                                   Rgb background) {
        return render(make_text_frame(width(), height(), color_order(), text, color, scale, background));
    }

    bool IDisplaySink::clear() {
        return render(cv::Mat(height(), width(), CV_8UC3, cv::Scalar::all(0)));
    }
}
