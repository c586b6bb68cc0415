#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

namespace cs {
    struct Frame {
        int64_t index = 0;        // 0-based decode order
        double timestamp_ms = 0.0; // index / fps * 1000
        cv::Mat bgr;              // empty when the frame was skipped without decoding
    };

    struct SourceInfo {
        double fps = 0.0;
        int64_t frame_count = 0; // estimated from duration; 0 if unknown
        double duration_ms = 0.0;
        int width = 0;
        int height = 0;
    };

    // A finite video read front to back exactly once.
    struct IFrameSource {
        virtual ~IFrameSource() = default;

        // Throws SourceError if the video cannot be opened.
        virtual void open() = 0;
        virtual void close() = 0;

        // Returns false at end of stream. With decode == false the frame is consumed
        // but its pixels are not copied out. Throws SourceError on decode failure.
        virtual bool read(Frame& out, bool decode = true) = 0;

        virtual const SourceInfo& info() const = 0;
        virtual const std::string& id() const = 0;
    };
}
