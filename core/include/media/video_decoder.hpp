#pragma once

#include <opencv2/core.hpp>
#include <string>

namespace rd {
    enum class ReadStatus {
        Frame,
        EndOfStream,
        Error
    };

    struct IVideoDecoder {
        virtual ~IVideoDecoder() = default;
        virtual bool open(const std::string& path) = 0;
        // Declared frame rate; <= 0 when the container does not declare one.
        virtual double fps() const = 0;
        virtual ReadStatus read(cv::Mat& bgr) = 0;
        // Seek back to the first frame.
        virtual bool rewind() = 0;
        virtual void close() = 0;
    };
}
