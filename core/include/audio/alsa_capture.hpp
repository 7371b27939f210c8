#pragma once

#include <audio/audio_capture.hpp>

#include <alsa/asoundlib.h>
#include <string>

namespace rd {
    class AlsaCapture : public IAudioCapture {
    public:
        explicit AlsaCapture(std::string device);
        ~AlsaCapture() override;

        AlsaCapture(const AlsaCapture&) = delete;
        AlsaCapture& operator=(const AlsaCapture&) = delete;

        bool open(int sample_rate, int channels, int chunk_frames) override;
        bool read(std::vector<int16_t>& chunk) override;
        void close() override;

    private:
        std::string device_;
        snd_pcm_t* pcm_ = nullptr;
        unsigned channels_ = 1;
        snd_pcm_uframes_t chunk_frames_ = 0;
    };
}
