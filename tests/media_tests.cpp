#include <media/cv_animation_source.hpp>
#include <media/gst_video_decoder.hpp>
#include <media/media_factory.hpp>

#include <gst/gst.h>

#include <chrono>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>

#include <opencv2/imgcodecs.hpp>

#include "fakes.hpp"

using rd_test::check;

namespace {
    namespace fs = std::filesystem;

    fs::path temp_path(const std::string& name) {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        return fs::temp_directory_path() / (std::to_string(stamp) + "_" + name);
    }

    // Five 32x24 frames at 10 fps, MJPEG in AVI. False when the plugins are missing.
    bool write_test_clip(const std::string& path) {
        gst_init(nullptr, nullptr);

        GError* err = nullptr;
        GstElement* pipeline = gst_parse_launch(
            "videotestsrc num-buffers=5 ! video/x-raw,width=32,height=24,framerate=10/1 ! "
            "jpegenc ! avimux ! filesink name=out",
            &err);
        if (err) {
            std::cerr << "[media_tests] encoder pipeline: " << err->message << "\n";
            g_error_free(err);
        }
        if (!pipeline) return false;

        GstElement* sink = gst_bin_get_by_name(GST_BIN(pipeline), "out");
        if (!sink) {
            gst_object_unref(pipeline);
            return false;
        }
        g_object_set(sink, "location", path.c_str(), nullptr);
        gst_object_unref(sink);

        bool ok = gst_element_set_state(pipeline, GST_STATE_PLAYING) != GST_STATE_CHANGE_FAILURE;
        if (ok) {
            GstBus* bus = gst_element_get_bus(pipeline);
            GstMessage* msg = gst_bus_timed_pop_filtered(
                bus, 5 * GST_SECOND,
                static_cast<GstMessageType>(GST_MESSAGE_EOS | GST_MESSAGE_ERROR));
            ok = msg && GST_MESSAGE_TYPE(msg) == GST_MESSAGE_EOS;
            if (msg) gst_message_unref(msg);
            gst_object_unref(bus);
        }
        gst_element_set_state(pipeline, GST_STATE_NULL);
        gst_object_unref(pipeline);
        return ok && fs::exists(path);
    }

    void test_decoder_opens_path_with_quotes() {
        const fs::path clip = temp_path("clip \"quoted\" name.avi");
        if (!write_test_clip(clip.string())) {
            std::cout << "[SKIP] GStreamer test clip could not be written\n";
            return;
        }

        rd::GstVideoDecoder decoder(5000);
        check(decoder.open(clip.string()), "decoder opens a path containing quotes and spaces");
        check(std::abs(decoder.fps() - 10.0) < 0.5, "declared frame rate comes from the caps");

        cv::Mat frame;
        int frames = 0;
        rd::ReadStatus st = rd::ReadStatus::Frame;
        while ((st = decoder.read(frame)) == rd::ReadStatus::Frame) {
            check(frame.cols == 32 && frame.rows == 24 && frame.type() == CV_8UC3,
                  "decoded frame is BGR at source size");
            ++frames;
        }
        check(frames == 5, "every encoded frame is decoded");
        check(st == rd::ReadStatus::EndOfStream, "clip ends with end of stream");

        check(decoder.rewind(), "rewind seeks to the start");
        check(decoder.read(frame) == rd::ReadStatus::Frame, "frames flow again after rewind");
        decoder.close();

        std::error_code ec;
        fs::remove(clip, ec);
    }

    void test_decoder_rejects_missing_file() {
        rd::GstVideoDecoder decoder(2000);
        const fs::path missing = temp_path("missing.mp4");
        check(!decoder.open(missing.string()), "missing file does not open");
        cv::Mat frame;
        check(decoder.read(frame) == rd::ReadStatus::Error, "read after failed open is an error");
    }

    void test_static_image_is_single_frame_animation() {
        const fs::path png = temp_path("still.png");
        const cv::Mat img(6, 8, CV_8UC3, cv::Scalar(5, 100, 200));
        if (!cv::imwrite(png.string(), img)) {
            std::cout << "[SKIP] png encoder unavailable\n";
            return;
        }

        rd::CvAnimationSource src;
        check(src.open(png.string()), "static png opens as an animation");
        check(src.frame_count() == 1, "static image is one frame");
        check(src.frame(0).cols == 8 && src.frame(0).rows == 6, "frame keeps source size");
        check(src.duration_s(3) == 0.0, "out of range frame has no duration");

        rd::CvAnimationSource missing;
        check(!missing.open(temp_path("nothing.gif").string()), "missing animation does not open");

        std::error_code ec;
        fs::remove(png, ec);
    }

    void test_media_kind_names() {
        rd::MediaKind kind = rd::MediaKind::Animation;
        check(rd::parse_media_kind("video", kind) && kind == rd::MediaKind::Video, "video parses");
        check(rd::parse_media_kind("animation", kind) && kind == rd::MediaKind::Animation,
              "animation parses");
        check(rd::parse_media_kind("gif", kind) && kind == rd::MediaKind::Animation,
              "gif is an animation alias");
        check(!rd::parse_media_kind("Video", kind), "kind names are case sensitive");
        check(!rd::parse_media_kind("", kind), "empty kind is rejected");
        check(std::string(rd::to_string(rd::MediaKind::Video)) == "video", "video name");
    }
}

int main() {
    test_media_kind_names();
    test_static_image_is_single_frame_animation();
    test_decoder_rejects_missing_file();
    test_decoder_opens_path_with_quotes();
    return rd_test::finish("media");
}
