#pragma once

#include <ingest/frame_source.hpp>
#include <string>

struct _GstElement;
using GstElement = _GstElement;

namespace cs {
    class GstFileSource: public IFrameSource {
    public:
        GstFileSource(std::string path, std::string pipeline, std::string src_id, std::string sink_name);

        GstFileSource(const GstFileSource&) = delete;
        GstFileSource& operator=(const GstFileSource&) = delete;

        void open() override;
        void close() override;
        bool read(Frame& out, bool decode = true) override;
        const SourceInfo& info() const override { return info_; }
        const std::string& id() const override { return id_; }

        ~GstFileSource() override;

    private:
        void probe_stream_info_();
        void raise_bus_error_();

        std::string path_;
        std::string pipeline_str_;
        std::string id_;
        std::string sink_name_;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;

        SourceInfo info_;
        int64_t frame_index_ = 0;
        bool eos_ = false;
    };
}
