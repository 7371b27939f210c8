#pragma once

#include <memory>

#include <common/config.hpp>
#include <display/display_sink.hpp>

namespace rd {
    class FrameHub;

    // Builds the configured panel. `hub` is set when the preview mirror is enabled.
    std::unique_ptr<IDisplaySink> make_display(const DisplayConfig& cfg, FrameHub** hub);
}
