#include <media/gst_video_decoder.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>

#include <iostream>
#include <mutex>

namespace rd {
    namespace {
        constexpr const char* kSinkName = "play_sink";
        constexpr const char* kSourceName = "play_src";
        constexpr int kPullTimeoutMs = 1000;

        // location is set as a property, never spliced into the launch string
        std::string file_pipeline() {
            // no dropping: playback paces itself and must see every frame
            return "filesrc name=" + std::string(kSourceName) + " ! "
                   "decodebin ! videoconvert ! video/x-raw,format=BGR ! "
                   "appsink name=" + std::string(kSinkName) + " max-buffers=2 drop=false sync=false";
        }
    } // namespace

    GstVideoDecoder::GstVideoDecoder(int open_timeout_ms)
        : open_timeout_ms_(open_timeout_ms) {}

    GstVideoDecoder::~GstVideoDecoder() {
        close();
    }

    bool GstVideoDecoder::open(const std::string& path) {
        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });

        close();
        path_ = path;

        const std::string desc = file_pipeline();
        GError* err = nullptr;
        pipeline_ = gst_parse_launch(desc.c_str(), &err);
        if (!pipeline_) {
            if (err) {
                std::cerr << "[GStreamer](open) parse_launch error: " << err->message << "\n";
                g_error_free(err);
            } else {
                std::cerr << "[GStreamer](open) parse_launch failed (unk error)\n";
            }
            return false;
        }

        GstElement* src = gst_bin_get_by_name(GST_BIN(pipeline_), kSourceName);
        if (!src) {
            std::cerr << "[GStreamer](open) filesrc named " << kSourceName << " not found.\n";
            close();
            return false;
        }
        g_object_set(src, "location", path.c_str(), nullptr);
        gst_object_unref(src);

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), kSinkName);
        if (!sink_) {
            std::cerr << "[GStreamer](open) appsink named " << kSinkName << " not found.\n";
            close();
            return false;
        }

        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_drop(appsink, FALSE);
        gst_app_sink_set_max_buffers(appsink, 2);
        gst_app_sink_set_emit_signals(appsink, FALSE);

        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[GStreamer](open) Failed to set pipeline to PLAYING for " << path << "\n";
            close();
            return false;
        }

        GstState state = GST_STATE_NULL;
        auto ret = gst_element_get_state(pipeline_, &state, nullptr,
                                         static_cast<GstClockTime>(open_timeout_ms_) * GST_MSECOND);
        if (ret == GST_STATE_CHANGE_FAILURE || pipeline_error_()) {
            std::cerr << "[GStreamer](open) cannot decode " << path << "\n";
            close();
            return false;
        }

        // declared rate from the negotiated caps
        fps_ = 0.0;
        GstPad* pad = gst_element_get_static_pad(sink_, "sink");
        if (pad) {
            GstCaps* caps = gst_pad_get_current_caps(pad);
            if (caps) {
                GstStructure* st = gst_caps_get_structure(caps, 0);
                int num = 0, den = 0;
                if (gst_structure_get_fraction(st, "framerate", &num, &den) && den > 0) {
                    fps_ = static_cast<double>(num) / static_cast<double>(den);
                }
                gst_caps_unref(caps);
            }
            gst_object_unref(pad);
        }
        return true;
    }

    ReadStatus GstVideoDecoder::read(cv::Mat& bgr) {
        if (!sink_) return ReadStatus::Error;

        GstSample* sample = nullptr;
        while (!sample) {
            sample = gst_app_sink_try_pull_sample(GST_APP_SINK(sink_), kPullTimeoutMs * GST_MSECOND);
            if (sample) break;
            if (gst_app_sink_is_eos(GST_APP_SINK(sink_))) return ReadStatus::EndOfStream;
            if (pipeline_error_()) return ReadStatus::Error;
        }

        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) {
            gst_sample_unref(sample);
            return ReadStatus::Error;
        }

        GstStructure* st = gst_caps_get_structure(caps, 0);
        int width = 0, height = 0;
        gst_structure_get_int(st, "width", &width);
        gst_structure_get_int(st, "height", &height);
        if (width <= 0 || height <= 0) {
            gst_sample_unref(sample);
            return ReadStatus::Error;
        }

        GstMapInfo map;
        if (!gst_buffer_map(buffer, &map, GST_MAP_READ) || !map.data || map.size == 0) {
            gst_sample_unref(sample);
            return ReadStatus::Error;
        }

        GstVideoInfo vinfo;
        int stride = width * 3;
        if (gst_video_info_from_caps(&vinfo, caps)) {
            int s0 = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
            if (s0 > 0) stride = s0;
        }

        const size_t min_bytes = static_cast<size_t>(stride) * static_cast<size_t>(height);
        if (map.size < min_bytes) {
            gst_buffer_unmap(buffer, &map);
            gst_sample_unref(sample);
            return ReadStatus::Error;
        }

        cv::Mat tmp(height, width, CV_8UC3, (void*)map.data, stride);
        bgr = tmp.clone();

        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);
        return ReadStatus::Frame;
    }

    bool GstVideoDecoder::rewind() {
        if (!pipeline_) return false;
        const gboolean ok = gst_element_seek_simple(
            pipeline_,
            GST_FORMAT_TIME,
            static_cast<GstSeekFlags>(GST_SEEK_FLAG_FLUSH | GST_SEEK_FLAG_KEY_UNIT),
            0);
        if (!ok) {
            std::cerr << "[GStreamer](rewind) seek to start failed for " << path_ << "\n";
            return false;
        }
        return true;
    }

    bool GstVideoDecoder::pipeline_error_() {
        if (!pipeline_) return true;
        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return false;

        bool failed = false;
        GstMessage* msg = gst_bus_pop_filtered(bus, GST_MESSAGE_ERROR);
        if (msg) {
            GError* err = nullptr;
            gchar* dbg = nullptr;
            gst_message_parse_error(msg, &err, &dbg);
            std::cerr << "[GStreamer] error from " << GST_OBJECT_NAME(msg->src) << ": "
                      << (err ? err->message : "unknown") << "\n";
            if (err) g_error_free(err);
            if (dbg) g_free(dbg);
            gst_message_unref(msg);
            failed = true;
        }
        gst_object_unref(bus);
        return failed;
    }

    void GstVideoDecoder::close() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (sink_) {
                gst_object_unref(sink_);
                sink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
        fps_ = 0.0;
    }
}
