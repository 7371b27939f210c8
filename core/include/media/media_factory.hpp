#pragma once

#include <functional>
#include <memory>
#include <string>

#include <media/animation_source.hpp>
#include <media/video_decoder.hpp>

namespace rd {
    enum class MediaKind {
        Video,
        Animation
    };

    // false for anything other than "video" / "animation"
    bool parse_media_kind(const std::string& s, MediaKind& out);
    const char* to_string(MediaKind k);

    // A fresh decoder per playback session.
    struct MediaFactory {
        std::function<std::unique_ptr<IVideoDecoder>()> video;
        std::function<std::unique_ptr<IAnimationSource>()> animation;
    };

    MediaFactory make_media_factory(int open_timeout_ms);
}
