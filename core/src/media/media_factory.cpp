#include <media/media_factory.hpp>
#include <media/cv_animation_source.hpp>
#include <media/gst_video_decoder.hpp>

namespace rd {
    bool parse_media_kind(const std::string& s, MediaKind& out) {
        if (s == "video") {
            out = MediaKind::Video;
            return true;
        }
        if (s == "animation" || s == "gif") {
            out = MediaKind::Animation;
            return true;
        }
        return false;
    }

    const char* to_string(MediaKind k) {
        return k == MediaKind::Video ? "video" : "animation";
    }

    MediaFactory make_media_factory(int open_timeout_ms) {
        MediaFactory f;
        f.video = [open_timeout_ms]() -> std::unique_ptr<IVideoDecoder> {
            return std::make_unique<GstVideoDecoder>(open_timeout_ms);
        };
        f.animation = []() -> std::unique_ptr<IAnimationSource> {
            return std::make_unique<CvAnimationSource>();
        };
        return f;
    }
}
