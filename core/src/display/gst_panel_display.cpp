#include <display/gst_panel_display.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsrc.h>

#include <cstring>
#include <iostream>
#include <mutex>
#include <utility>

namespace rd {
    GstPanelDisplay::GstPanelDisplay(std::string device, int width, int height, ColorOrder order)
        : device_(std::move(device)),
          width_(width),
          height_(height),
          order_(order) {}

    GstPanelDisplay::~GstPanelDisplay() {
        stop();
    }

    bool GstPanelDisplay::start() {
        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });

        const std::string pipeline_desc =
            "appsrc name=src is-live=true format=time do-timestamp=true block=false "
            "! videoconvert "
            "! fbdevsink device=" + device_ + " sync=false";

        GError* err = nullptr;
        pipeline_ = gst_parse_launch(pipeline_desc.c_str(), &err);
        if (!pipeline_) {
            std::cerr << "[Panel](start) Failed to create pipeline";
            if (err) {
                std::cerr << ": " << err->message;
                g_error_free(err);
            }
            std::cerr << "\n";
            return false;
        }

        appsrc_ = gst_bin_get_by_name(GST_BIN(pipeline_), "src");
        if (!appsrc_) {
            std::cerr << "[Panel](start) Missing appsrc.\n";
            stop();
            return false;
        }

        GstCaps* caps = gst_caps_new_simple(
            "video/x-raw",
            "format", G_TYPE_STRING, order_ == ColorOrder::BGR ? "BGR" : "RGB",
            "width", G_TYPE_INT, width_,
            "height", G_TYPE_INT, height_,
            "framerate", GST_TYPE_FRACTION, 0, 1,
            nullptr);
        gst_app_src_set_caps(GST_APP_SRC(appsrc_), caps);
        gst_caps_unref(caps);

        auto ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[Panel](start) Failed to set pipeline to PLAYING (" << device_ << ").\n";
            stop();
            return false;
        }

        std::cout << "[Panel] " << device_ << " " << width_ << "x" << height_ << "\n";
        return true;
    }

    void GstPanelDisplay::stop() {
        if (appsrc_) {
            gst_app_src_end_of_stream(GST_APP_SRC(appsrc_));
            gst_object_unref(appsrc_);
            appsrc_ = nullptr;
        }
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
    }

    bool GstPanelDisplay::render_frame_(const cv::Mat& frame) {
        if (!appsrc_ || frame.empty()) return false;
        if (frame.cols != width_ || frame.rows != height_ || frame.type() != CV_8UC3) {
            std::cerr << "[Panel](render) unexpected frame " << frame.cols << "x" << frame.rows << "\n";
            return false;
        }

        const cv::Mat packed = frame.isContinuous() ? frame : frame.clone();
        const size_t size = packed.total() * packed.elemSize();
        GstBuffer* buf = gst_buffer_new_allocate(nullptr, size, nullptr);

        GstMapInfo map;
        if (!gst_buffer_map(buf, &map, GST_MAP_WRITE)) {
            gst_buffer_unref(buf);
            return false;
        }
        std::memcpy(map.data, packed.data, size);
        gst_buffer_unmap(buf, &map);

        GST_BUFFER_OFFSET(buf) = frame_no_++;

        GstFlowReturn ret = gst_app_src_push_buffer(GST_APP_SRC(appsrc_), buf);
        if (ret != GST_FLOW_OK) {
            std::cerr << "[Panel](render) push_buffer failed. ret: " << ret << "\n";
            return false;
        }
        return true;
    }
}
