#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rd {
    struct IAudioCapture {
        virtual ~IAudioCapture() = default;
        virtual bool open(int sample_rate, int channels, int chunk_frames) = 0;
        // Blocking read of exactly one chunk of interleaved S16 samples.
        virtual bool read(std::vector<int16_t>& chunk) = 0;
        virtual void close() = 0;
    };
}
