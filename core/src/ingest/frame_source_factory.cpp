#include <ingest/frame_source_factory.hpp>
#include <ingest/gst_file_source.hpp>

#include <filesystem>
#include <stdexcept>

namespace cs {
    std::string file_pipeline(const std::string& path, const std::string& sink_name) {
        return "filesrc location=\"" + path + "\" ! "
               "decodebin ! videoconvert ! video/x-raw,format=BGR ! "
               "appsink name=" + sink_name + " max-buffers=4 drop=false sync=false";
    }

    std::unique_ptr<IFrameSource> make_frame_source(const std::string& path) {
        if (path.empty()) {
            throw std::invalid_argument("video path is empty");
        }

        std::string id = std::filesystem::path(path).stem().string();
        if (id.empty()) id = "video";
        const std::string sink_name = "sink_scan";

        return std::make_unique<GstFileSource>(path, file_pipeline(path, sink_name), id, sink_name);
    }
}
