#include <wakeword/ncnn_keyword_classifier.hpp>

#include <algorithm>
#include <array>
#include <deque>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include <ncnn/net.h>

namespace rd {
    namespace {
        constexpr int kMelBins = 32;
        constexpr int kMelContext = 480;  // 3 hops of 160 samples carried between chunks
        constexpr int kEmbWindow = 76;    // mel frames per embedding
        constexpr int kEmbStride = 8;
        constexpr int kEmbDim = 96;
        constexpr int kFeatWindow = 16;   // embeddings per keyword decision
        constexpr size_t kMaxMelFrames = 10 * 97;
        constexpr size_t kMaxEmbeddings = 120;

        std::string resolve_path_or_throw(const std::string& p) {
            namespace fs = std::filesystem;
            if (fs::exists(fs::path(p))) return p;
            const fs::path alt = fs::path("../") / p;
            if (fs::exists(alt)) return alt.string();
            throw std::runtime_error("Model path not found: " + p);
        }

        std::unique_ptr<ncnn::Net> load_net(const std::string& param_path,
                                            const std::string& bin_path,
                                            int threads) {
            auto net = std::make_unique<ncnn::Net>();
            net->opt.use_vulkan_compute = false;
            net->opt.num_threads = std::max(1, threads);

            const std::string param = resolve_path_or_throw(param_path);
            const std::string bin = resolve_path_or_throw(bin_path);
            if (net->load_param(param.c_str()) != 0) {
                throw std::runtime_error("Failed to load param: " + param);
            }
            if (net->load_model(bin.c_str()) != 0) {
                throw std::runtime_error("Failed to load weights: " + bin);
            }
            return net;
        }

        bool run_net(const ncnn::Net& net, const ncnn::Mat& in, ncnn::Mat& out) {
            ncnn::Extractor ex = net.create_extractor();
            ex.set_light_mode(true);
            if (ex.input("in0", in) != 0) return false;
            return ex.extract("out0", out) == 0;
        }
    } // namespace

    class NcnnKeywordClassifier::Impl {
    public:
        explicit Impl(const NcnnKeywordClassifierConfig& cfg) {
            melspec_ = load_net(cfg.melspec_param, cfg.melspec_bin, cfg.ncnn_threads);
            embedding_ = load_net(cfg.embedding_param, cfg.embedding_bin, cfg.ncnn_threads);
            for (const auto& m : cfg.models) {
                keywords_.push_back(load_net(m.param_path, m.bin_path, cfg.ncnn_threads));
            }
            reset();
        }

        void reset() {
            tail_.assign(kMelContext, 0.0f);
            mel_.clear();
            emb_.clear();
            pending_mel_ = 0;
        }

        std::vector<float> score(const int16_t* pcm, size_t n) {
            if (pcm && n > 0) {
                push_audio_(pcm, n);
                update_embeddings_();
            }

            std::vector<float> scores(keywords_.size(), 0.0f);
            if (emb_.size() < static_cast<size_t>(kFeatWindow)) return scores;

            ncnn::Mat feat(kEmbDim, kFeatWindow);
            const size_t first = emb_.size() - kFeatWindow;
            for (int r = 0; r < kFeatWindow; ++r) {
                std::copy(emb_[first + static_cast<size_t>(r)].begin(),
                          emb_[first + static_cast<size_t>(r)].end(),
                          feat.row(r));
            }

            for (size_t k = 0; k < keywords_.size(); ++k) {
                ncnn::Mat out;
                if (!run_net(*keywords_[k], feat, out) || out.total() == 0) continue;
                scores[k] = std::clamp(static_cast<const float*>(out.data)[0], 0.0f, 1.0f);
            }
            return scores;
        }

    private:
        void push_audio_(const int16_t* pcm, size_t n) {
            // the melspectrogram net takes raw int16-scaled floats
            ncnn::Mat in(static_cast<int>(tail_.size() + n));
            float* dst = in;
            std::copy(tail_.begin(), tail_.end(), dst);
            for (size_t i = 0; i < n; ++i) dst[tail_.size() + i] = static_cast<float>(pcm[i]);

            const size_t total = tail_.size() + n;
            tail_.assign(dst + (total - kMelContext), dst + total);

            ncnn::Mat out;
            if (!run_net(*melspec_, in, out) || out.w != kMelBins) return;

            for (int r = 0; r < out.h; ++r) {
                const float* row = out.row(r);
                std::array<float, kMelBins> frame{};
                for (int b = 0; b < kMelBins; ++b) frame[static_cast<size_t>(b)] = row[b] / 10.0f + 2.0f;
                mel_.push_back(frame);
                ++pending_mel_;
            }
            while (mel_.size() > kMaxMelFrames) mel_.pop_front();
        }

        void update_embeddings_() {
            // one embedding per kEmbStride new mel frames, oldest first
            while (pending_mel_ >= kEmbStride) {
                const size_t end = mel_.size() - static_cast<size_t>(pending_mel_ - kEmbStride);
                pending_mel_ -= kEmbStride;
                if (end < static_cast<size_t>(kEmbWindow)) continue;

                ncnn::Mat in(kMelBins, kEmbWindow);
                const size_t start = end - kEmbWindow;
                for (int r = 0; r < kEmbWindow; ++r) {
                    const auto& frame = mel_[start + static_cast<size_t>(r)];
                    std::copy(frame.begin(), frame.end(), in.row(r));
                }

                ncnn::Mat out;
                if (!run_net(*embedding_, in, out) || out.total() < static_cast<size_t>(kEmbDim)) continue;

                const float* e = static_cast<const float*>(out.data);
                emb_.emplace_back(e, e + kEmbDim);
                while (emb_.size() > kMaxEmbeddings) emb_.pop_front();
            }
        }

        std::unique_ptr<ncnn::Net> melspec_;
        std::unique_ptr<ncnn::Net> embedding_;
        std::vector<std::unique_ptr<ncnn::Net>> keywords_;

        std::vector<float> tail_;
        std::deque<std::array<float, kMelBins>> mel_;
        std::deque<std::vector<float>> emb_;
        int pending_mel_ = 0;
    };

    NcnnKeywordClassifier::NcnnKeywordClassifier(NcnnKeywordClassifierConfig cfg) {
        if (cfg.models.empty()) {
            throw std::runtime_error("No wake-word models configured");
        }
        for (const auto& m : cfg.models) names_.push_back(m.name);
        impl_ = std::make_unique<Impl>(cfg);
    }

    NcnnKeywordClassifier::~NcnnKeywordClassifier() = default;

    std::vector<KeywordScore> NcnnKeywordClassifier::score(const int16_t* pcm, size_t n) {
        const auto raw = impl_->score(pcm, n);
        std::vector<KeywordScore> out;
        out.reserve(names_.size());
        for (size_t i = 0; i < names_.size(); ++i) {
            out.push_back({names_[i], i < raw.size() ? raw[i] : 0.0f});
        }
        return out;
    }

    void NcnnKeywordClassifier::reset() {
        impl_->reset();
    }
}
