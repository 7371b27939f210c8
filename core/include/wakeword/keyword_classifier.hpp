#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rd {
    struct KeywordScore {
        std::string name;
        float score = 0.0f; // [0, 1]
    };

    class IKeywordClassifier {
    public:
        virtual ~IKeywordClassifier() = default;

        // In load order; score() reports in the same order.
        virtual const std::vector<std::string>& model_names() const = 0;

        virtual std::vector<KeywordScore> score(const int16_t* pcm, size_t n) = 0;

        // Drops streaming context, e.g. between listening sessions.
        virtual void reset() {}
    };
}
