#pragma once

#include <memory>
#include <string>

#include <ingest/frame_source.hpp>

namespace cs {
    // Pipeline description decoding `path` to BGR frames into an appsink named `sink_name`.
    std::string file_pipeline(const std::string& path, const std::string& sink_name);

    // Unopened source for a video file; the caller owns open()/close().
    std::unique_ptr<IFrameSource> make_frame_source(const std::string& path);
}
