#include <ingest/gst_file_source.hpp>

#include <common/errors.hpp>
#include <common/log.hpp>
#include <common/timecode.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>
#include <opencv2/core.hpp>

#include <cmath>
#include <filesystem>
#include <mutex>
#include <utility>

namespace cs {
    namespace {
        constexpr int kPullTimeoutMs = 500;
        constexpr int kMaxStalledPulls = 60; // 30 s without a sample or EOS
        constexpr GstClockTime kPrerollTimeout = 10 * GST_SECOND;
    } // namespace

    GstFileSource::GstFileSource(std::string path, std::string pipeline, std::string id, std::string sink_name)
        : path_(std::move(path)),
          pipeline_str_(std::move(pipeline)),
          id_(std::move(id)),
          sink_name_(std::move(sink_name)) {}

    void GstFileSource::open() {
        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });

        if (pipeline_) close();

        if (!std::filesystem::exists(path_)) {
            throw SourceError("video not found: " + path_);
        }

        GError* err = nullptr;
        pipeline_ = gst_parse_launch(pipeline_str_.c_str(), &err);
        if (!pipeline_) {
            std::string msg = "parse_launch failed (unk error)";
            if (err) {
                msg = std::string("parse_launch error: ") + err->message;
                g_error_free(err);
            }
            throw SourceError("[GStreamer](open) " + path_ + ": " + msg);
        }
        if (err) {
            // recoverable warning, pipeline was still built
            CS_LOG(LogLevel::Warn, "[GStreamer](open) " << err->message);
            g_error_free(err);
        }

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), sink_name_.c_str());
        if (!sink_) {
            close();
            throw SourceError("[GStreamer](open) appsink named " + sink_name_ + " not found");
        }

        // Offline scan: every frame must arrive, so block upstream instead of dropping.
        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_drop(appsink, FALSE);
        gst_app_sink_set_max_buffers(appsink, 4);
        gst_app_sink_set_emit_signals(appsink, FALSE);

        if (gst_element_set_state(pipeline_, GST_STATE_PAUSED) == GST_STATE_CHANGE_FAILURE ||
            gst_element_get_state(pipeline_, nullptr, nullptr, kPrerollTimeout) == GST_STATE_CHANGE_FAILURE) {
            raise_bus_error_();
            close();
            throw SourceError("[GStreamer](open) cannot preroll " + path_);
        }

        try {
            probe_stream_info_();
        } catch (...) {
            close();
            throw;
        }

        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            close();
            throw SourceError("[GStreamer](open) Failed to set pipeline to PLAYING for " + path_);
        }

        frame_index_ = 0;
        eos_ = false;

        CS_LOG(LogLevel::Info, "[GStreamer](open) " << id_ << ": " << info_.width << "x" << info_.height
               << " @ " << info_.fps << " fps, ~" << info_.frame_count << " frames");
    }

    void GstFileSource::probe_stream_info_() {
        GstSample* preroll = gst_app_sink_try_pull_preroll(GST_APP_SINK(sink_), kPrerollTimeout);
        if (!preroll) {
            raise_bus_error_();
            throw SourceError("[GStreamer](open) no video frames in " + path_);
        }

        GstCaps* caps = gst_sample_get_caps(preroll);
        GstStructure* st = caps ? gst_caps_get_structure(caps, 0) : nullptr;

        int width = 0, height = 0, fps_n = 0, fps_d = 1;
        if (st) {
            gst_structure_get_int(st, "width", &width);
            gst_structure_get_int(st, "height", &height);
            gst_structure_get_fraction(st, "framerate", &fps_n, &fps_d);
        }
        gst_sample_unref(preroll);

        if (width <= 0 || height <= 0) {
            throw SourceError("[GStreamer](open) invalid frame size in " + path_);
        }
        if (fps_n <= 0 || fps_d <= 0) {
            throw SourceError("[GStreamer](open) unknown frame rate in " + path_);
        }

        info_ = SourceInfo{};
        info_.width = width;
        info_.height = height;
        info_.fps = static_cast<double>(fps_n) / static_cast<double>(fps_d);

        gint64 duration_ns = 0;
        if (gst_element_query_duration(pipeline_, GST_FORMAT_TIME, &duration_ns) && duration_ns > 0) {
            info_.duration_ms = static_cast<double>(duration_ns) / 1e6;
            info_.frame_count = static_cast<int64_t>(std::llround(info_.duration_ms / 1000.0 * info_.fps));
        }
    }

    void GstFileSource::raise_bus_error_() {
        if (!pipeline_) return;

        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return;
        GstMessage* msg = gst_bus_pop_filtered(bus, GST_MESSAGE_ERROR);
        gst_object_unref(bus);
        if (!msg) return;

        GError* err = nullptr;
        gchar* dbg = nullptr;
        gst_message_parse_error(msg, &err, &dbg);
        std::string what = err ? err->message : "unknown decode error";
        if (err) g_error_free(err);
        if (dbg) {
            CS_LOG(LogLevel::Debug, "[GStreamer](bus) " << dbg);
            g_free(dbg);
        }
        gst_message_unref(msg);

        throw SourceError("[GStreamer] " + path_ + ": " + what);
    }

    bool GstFileSource::read(Frame& out, bool decode) {
        if (!sink_ || eos_) return false;

        GstSample* sample = nullptr;
        for (int stalled = 0; !sample; ++stalled) {
            sample = gst_app_sink_try_pull_sample(
                GST_APP_SINK(sink_), kPullTimeoutMs * GST_MSECOND);
            if (sample) break;

            raise_bus_error_();
            if (gst_app_sink_is_eos(GST_APP_SINK(sink_))) {
                eos_ = true;
                return false;
            }
            if (stalled >= kMaxStalledPulls) {
                throw SourceError("[GStreamer](read) decoder stalled on " + path_);
            }
        }

        out.index = frame_index_++;
        out.timestamp_ms = frame_timestamp_ms(out.index, info_.fps);
        out.bgr.release();

        if (!decode) {
            gst_sample_unref(sample);
            return true;
        }

        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) {
            gst_sample_unref(sample);
            throw SourceError("[GStreamer](read) sample without buffer/caps in " + path_);
        }

        GstStructure* st = gst_caps_get_structure(caps, 0);
        int width = 0, height = 0;
        gst_structure_get_int(st, "width", &width);
        gst_structure_get_int(st, "height", &height);
        if (width <= 0 || height <= 0) {
            gst_sample_unref(sample);
            throw SourceError("[GStreamer](read) invalid frame size in " + path_);
        }

        GstMapInfo map;
        if (!gst_buffer_map(buffer, &map, GST_MAP_READ) || !map.data || map.size == 0) {
            gst_sample_unref(sample);
            throw SourceError("[GStreamer](read) cannot map frame buffer in " + path_);
        }

        GstVideoInfo vinfo;
        int stride = width * 3;
        if (gst_video_info_from_caps(&vinfo, caps)) {
            int s0 = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
            if (s0 > 0) stride = s0;
        }

        const size_t min_bytes = static_cast<size_t>(stride) * static_cast<size_t>(height);
        if (map.size < min_bytes) {
            gst_buffer_unmap(buffer, &map);
            gst_sample_unref(sample);
            throw SourceError("[GStreamer](read) truncated frame buffer in " + path_);
        }

        cv::Mat tmp(height, width, CV_8UC3, (void*)map.data, stride);
        out.bgr = tmp.clone();

        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);
        return true;
    }

    void GstFileSource::close() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (sink_) {
                gst_object_unref(sink_);
                sink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
        eos_ = true;
    }

    GstFileSource::~GstFileSource() {
        close();
    }
}
