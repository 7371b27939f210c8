#include <display/display_factory.hpp>
#include <display/gst_panel_display.hpp>
#include <display/preview_display.hpp>

#include <stdexcept>

namespace rd {
    namespace {
        // Discards frames; used when the rover runs without a panel and no preview.
        class NullDisplay final : public IDisplaySink {
        public:
            NullDisplay(int w, int h, ColorOrder order) : w_(w), h_(h), order_(order) {}
            int width() const override { return w_; }
            int height() const override { return h_; }
            ColorOrder color_order() const override { return order_; }

        protected:
            bool render_frame_(const cv::Mat&) override { return true; }

        private:
            int w_;
            int h_;
            ColorOrder order_;
        };
    } // namespace

    std::unique_ptr<IDisplaySink> make_display(const DisplayConfig& cfg, FrameHub** hub) {
        if (hub) *hub = nullptr;
        const ColorOrder order = color_order_from_str(cfg.color_order);

        std::unique_ptr<IDisplaySink> panel;
        if (cfg.backend == "fbdev") {
            auto gst = std::make_unique<GstPanelDisplay>(cfg.device, cfg.width, cfg.height, order);
            if (!gst->start()) {
                throw std::runtime_error("failed to open display panel " + cfg.device);
            }
            panel = std::move(gst);
        } else if (cfg.backend != "none") {
            throw std::runtime_error("Unknown display backend " + cfg.backend);
        }

        if (!cfg.preview) {
            if (panel) return panel;
            return std::make_unique<NullDisplay>(cfg.width, cfg.height, order);
        }

        auto preview = std::make_unique<PreviewDisplay>(
            std::move(panel), cfg.width, cfg.height, order, cfg.jpeg_quality);
        if (hub) *hub = &preview->hub();
        return preview;
    }
}
