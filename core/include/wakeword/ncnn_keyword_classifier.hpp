#pragma once

#include <memory>
#include <string>
#include <vector>

#include <common/config.hpp>
#include <wakeword/keyword_classifier.hpp>

namespace rd {
    struct NcnnKeywordClassifierConfig {
        std::string melspec_param;
        std::string melspec_bin;
        std::string embedding_param;
        std::string embedding_bin;
        std::vector<KeywordModelConfig> models;
        int ncnn_threads = 1;
    };

    // Streaming keyword spotter: melspectrogram net -> embedding net ->
    // one small classifier net per keyword. Expects 16 kHz mono audio.
    class NcnnKeywordClassifier : public IKeywordClassifier {
    public:
        explicit NcnnKeywordClassifier(NcnnKeywordClassifierConfig cfg);
        ~NcnnKeywordClassifier() override;

        NcnnKeywordClassifier(const NcnnKeywordClassifier&) = delete;
        NcnnKeywordClassifier& operator=(const NcnnKeywordClassifier&) = delete;

        const std::vector<std::string>& model_names() const override { return names_; }
        std::vector<KeywordScore> score(const int16_t* pcm, size_t n) override;
        void reset() override;

    private:
        class Impl;
        std::vector<std::string> names_;
        std::unique_ptr<Impl> impl_;
    };
}
