#include <audio/alsa_capture.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace rd {
    namespace {
        bool check(int err, const char* what) {
            if (err < 0) {
                std::cerr << "[ALSA](open) " << what << ": " << snd_strerror(err) << "\n";
                return false;
            }
            return true;
        }
    } // namespace

    AlsaCapture::AlsaCapture(std::string device)
        : device_(std::move(device)) {}

    AlsaCapture::~AlsaCapture() {
        close();
    }

    bool AlsaCapture::open(int sample_rate, int channels, int chunk_frames) {
        close();
        if (sample_rate <= 0 || channels <= 0 || chunk_frames <= 0) return false;

        if (!check(snd_pcm_open(&pcm_, device_.c_str(), SND_PCM_STREAM_CAPTURE, 0), "snd_pcm_open")) {
            pcm_ = nullptr;
            return false;
        }

        snd_pcm_hw_params_t* hp;
        snd_pcm_hw_params_alloca(&hp);

        unsigned rate = static_cast<unsigned>(sample_rate);
        snd_pcm_uframes_t period = static_cast<snd_pcm_uframes_t>(chunk_frames);

        bool ok = check(snd_pcm_hw_params_any(pcm_, hp), "hw_params_any")
               && check(snd_pcm_hw_params_set_access(pcm_, hp, SND_PCM_ACCESS_RW_INTERLEAVED), "set_access")
               && check(snd_pcm_hw_params_set_format(pcm_, hp, SND_PCM_FORMAT_S16_LE), "set_format")
               && check(snd_pcm_hw_params_set_channels(pcm_, hp, static_cast<unsigned>(channels)), "set_channels")
               && check(snd_pcm_hw_params_set_rate(pcm_, hp, rate, 0), "set_rate")
               && check(snd_pcm_hw_params_set_period_size_near(pcm_, hp, &period, nullptr), "set_period")
               && check(snd_pcm_hw_params(pcm_, hp), "hw_params")
               && check(snd_pcm_prepare(pcm_), "prepare");
        if (!ok) {
            close();
            return false;
        }

        channels_ = static_cast<unsigned>(channels);
        chunk_frames_ = static_cast<snd_pcm_uframes_t>(chunk_frames);
        std::cout << "[ALSA] capturing " << device_ << " @ " << rate << " Hz, "
                  << channels_ << " ch, " << chunk_frames_ << " frames/chunk\n";
        return true;
    }

    bool AlsaCapture::read(std::vector<int16_t>& chunk) {
        if (!pcm_) return false;
        chunk.resize(chunk_frames_ * channels_);

        snd_pcm_uframes_t filled = 0;
        bool recovered = false;
        while (filled < chunk_frames_) {
            snd_pcm_sframes_t got = snd_pcm_readi(pcm_,
                                                  chunk.data() + filled * channels_,
                                                  chunk_frames_ - filled);
            if (got == -EPIPE) {
                // overrun: drop what the driver lost and keep reading
                const int err = snd_pcm_prepare(pcm_);
                if (err < 0) {
                    std::cerr << "[ALSA](read) prepare after overrun: " << snd_strerror(err) << "\n";
                    return false;
                }
                continue;
            }
            if (got == -EAGAIN) continue;
            if (got < 0) {
                if (recovered || snd_pcm_recover(pcm_, static_cast<int>(got), 1) < 0) {
                    std::cerr << "[ALSA](read) " << snd_strerror(static_cast<int>(got)) << "\n";
                    return false;
                }
                recovered = true;
                continue;
            }
            filled += static_cast<snd_pcm_uframes_t>(got);
        }
        return true;
    }

    void AlsaCapture::close() {
        if (pcm_) {
            snd_pcm_drop(pcm_);
            snd_pcm_close(pcm_);
            pcm_ = nullptr;
        }
    }
}
