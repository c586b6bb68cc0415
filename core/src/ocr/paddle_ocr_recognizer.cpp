#include <ocr/paddle_ocr_recognizer.hpp>

#include <ocr/ctc_decoder.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <ncnn/allocator.h>
#include <ncnn/net.h>
#include <opencv2/imgproc.hpp>

namespace cs {
    namespace {
        using Quad = std::array<cv::Point2f, 4>; // tl, tr, br, bl

        std::string resolve_path_or_throw(const std::string& p) {
            namespace fs = std::filesystem;
            if (fs::exists(fs::path(p))) return p;
            const fs::path alt = fs::path("../../../") / p;
            if (fs::exists(alt)) return alt.string();
            throw std::runtime_error("OCR model path not found: " + p);
        }

        void load_net_or_throw(ncnn::Net& net, const std::string& param, const std::string& bin, int threads) {
            net.opt.use_vulkan_compute = false;
            net.opt.num_threads = std::max(1, threads);

            const std::string param_path = resolve_path_or_throw(param);
            const std::string bin_path = resolve_path_or_throw(bin);
            if (net.load_param(param_path.c_str()) != 0) {
                throw std::runtime_error("Failed to load OCR param: " + param_path);
            }
            if (net.load_model(bin_path.c_str()) != 0) {
                throw std::runtime_error("Failed to load OCR weights: " + bin_path);
            }
        }

        Quad order_quad(const cv::RotatedRect& r) {
            cv::Point2f pts[4];
            r.points(pts);
            std::sort(pts, pts + 4, [](const cv::Point2f& a, const cv::Point2f& b) { return a.x < b.x; });

            const cv::Point2f& tl = pts[0].y <= pts[1].y ? pts[0] : pts[1];
            const cv::Point2f& bl = pts[0].y <= pts[1].y ? pts[1] : pts[0];
            const cv::Point2f& tr = pts[2].y <= pts[3].y ? pts[2] : pts[3];
            const cv::Point2f& br = pts[2].y <= pts[3].y ? pts[3] : pts[2];
            return {tl, tr, br, bl};
        }

        float box_score(const cv::Mat& prob, const std::vector<cv::Point>& contour) {
            const cv::Rect r = cv::boundingRect(contour) & cv::Rect(0, 0, prob.cols, prob.rows);
            if (r.empty()) return 0.0f;

            std::vector<cv::Point> shifted;
            shifted.reserve(contour.size());
            for (const auto& p : contour) shifted.push_back(p - r.tl());

            cv::Mat mask = cv::Mat::zeros(r.size(), CV_8UC1);
            cv::fillPoly(mask, std::vector<std::vector<cv::Point>>{shifted}, cv::Scalar(1));
            return static_cast<float>(cv::mean(prob(r), mask)[0]);
        }

        // Grow the shrunk DB kernel back to the text extent: offset = area * ratio / perimeter.
        cv::RotatedRect unclip(const cv::RotatedRect& r, float ratio) {
            const float w = r.size.width;
            const float h = r.size.height;
            const float perimeter = 2.0f * (w + h);
            if (perimeter <= 0.0f) return r;
            const float d = w * h * ratio / perimeter;
            return cv::RotatedRect(r.center, cv::Size2f(w + 2.0f * d, h + 2.0f * d), r.angle);
        }

        cv::Mat crop_quad(const cv::Mat& img, const Quad& q) {
            const double w = std::max(cv::norm(q[0] - q[1]), cv::norm(q[3] - q[2]));
            const double h = std::max(cv::norm(q[0] - q[3]), cv::norm(q[1] - q[2]));
            const int cw = std::max(1, static_cast<int>(std::lround(w)));
            const int ch = std::max(1, static_cast<int>(std::lround(h)));

            const cv::Point2f dst[4] = {
                {0.0f, 0.0f},
                {static_cast<float>(cw), 0.0f},
                {static_cast<float>(cw), static_cast<float>(ch)},
                {0.0f, static_cast<float>(ch)}
            };
            const cv::Mat m = cv::getPerspectiveTransform(q.data(), dst);

            cv::Mat out;
            cv::warpPerspective(img, out, m, cv::Size(cw, ch), cv::INTER_CUBIC, cv::BORDER_REPLICATE);
            if (out.rows >= out.cols * 1.5) {
                cv::rotate(out, out, cv::ROTATE_90_COUNTERCLOCKWISE);
            }
            return out;
        }
    } // namespace

    class PaddleOcrRecognizer::Impl {
    public:
        explicit Impl(const PaddleOcrConfig& cfg) {
            load_net_or_throw(det_, cfg.det_param_path, cfg.det_bin_path, cfg.ncnn_threads);
            load_net_or_throw(rec_, cfg.rec_param_path, cfg.rec_bin_path, cfg.ncnn_threads);

            const std::string dict = resolve_path_or_throw(cfg.dict_path);
            if (!decoder_.load_dictionary(dict)) {
                throw std::runtime_error("Failed to load OCR dictionary: " + dict);
            }

            blob_pool_allocator_.set_size_compare_ratio(0.0f);
            workspace_pool_allocator_.set_size_compare_ratio(0.0f);
        }

        std::vector<RecognizedText> recognize(const cv::Mat& bgr, const PaddleOcrConfig& cfg) {
            if (bgr.empty()) return {};

            cv::Mat img;
            if (bgr.channels() == 1) {
                cv::cvtColor(bgr, img, cv::COLOR_GRAY2BGR);
            } else {
                img = bgr.isContinuous() ? bgr : bgr.clone();
            }

            std::vector<RecognizedText> out;
            for (const Quad& q : detect_(img, cfg)) {
                const cv::Mat line = crop_quad(img, q);
                if (line.empty()) continue;

                CtcResult r = recognize_line_(line, cfg);
                if (r.text.empty()) continue;

                RecognizedText t;
                t.polygon.reserve(q.size());
                for (const auto& p : q) {
                    t.polygon.emplace_back(static_cast<int>(std::lround(p.x)),
                                           static_cast<int>(std::lround(p.y)));
                }
                t.text = std::move(r.text);
                t.confidence = r.confidence;
                out.push_back(std::move(t));
            }
            return out;
        }

    private:
        ncnn::Extractor make_extractor_(const ncnn::Net& net) {
            ncnn::Extractor ex = net.create_extractor();
            ex.set_light_mode(true);
            ex.set_blob_allocator(&blob_pool_allocator_);
            ex.set_workspace_allocator(&workspace_pool_allocator_);
            return ex;
        }

        std::vector<Quad> detect_(const cv::Mat& img, const PaddleOcrConfig& cfg) {
            const int w = img.cols;
            const int h = img.rows;
            const int longest = std::max(w, h);
            const float ratio = longest > cfg.det_max_side
                                    ? static_cast<float>(cfg.det_max_side) / static_cast<float>(longest)
                                    : 1.0f;

            // DB heads need sides divisible by 32
            const int tw = std::max(32, static_cast<int>(std::lround(w * ratio / 32.0f)) * 32);
            const int th = std::max(32, static_cast<int>(std::lround(h * ratio / 32.0f)) * 32);

            ncnn::Mat in = ncnn::Mat::from_pixels_resize(img.data, ncnn::Mat::PIXEL_BGR, w, h, tw, th);
            static const float kMean[3] = {0.485f * 255.0f, 0.456f * 255.0f, 0.406f * 255.0f};
            static const float kNorm[3] = {1.0f / (0.229f * 255.0f), 1.0f / (0.224f * 255.0f), 1.0f / (0.225f * 255.0f)};
            in.substract_mean_normalize(kMean, kNorm);

            ncnn::Extractor ex = make_extractor_(det_);
            if (ex.input(cfg.det_input.c_str(), in) != 0) {
                throw std::runtime_error("OCR detector rejected input blob " + cfg.det_input);
            }
            ncnn::Mat out;
            if (ex.extract(cfg.det_output.c_str(), out) != 0 || out.empty()) {
                throw std::runtime_error("OCR detector produced no " + cfg.det_output);
            }

            const cv::Mat prob = cv::Mat(out.h, out.w, CV_32FC1, out.channel(0).data).clone();
            const cv::Mat bitmap = prob > cfg.det_bin_thresh;

            std::vector<std::vector<cv::Point>> contours;
            cv::findContours(bitmap, contours, cv::RETR_LIST, cv::CHAIN_APPROX_SIMPLE);

            const float sx = static_cast<float>(w) / static_cast<float>(out.w);
            const float sy = static_cast<float>(h) / static_cast<float>(out.h);

            std::vector<Quad> quads;
            quads.reserve(contours.size());
            for (const auto& contour : contours) {
                if (contour.size() < 3) continue;

                cv::RotatedRect r = cv::minAreaRect(contour);
                if (std::min(r.size.width, r.size.height) < cfg.det_min_size) continue;
                if (box_score(prob, contour) < cfg.det_box_thresh) continue;

                r = unclip(r, cfg.det_unclip_ratio);
                if (std::min(r.size.width, r.size.height) < cfg.det_min_size + 2) continue;

                Quad q = order_quad(r);
                for (auto& p : q) {
                    p.x = std::clamp(p.x * sx, 0.0f, static_cast<float>(w - 1));
                    p.y = std::clamp(p.y * sy, 0.0f, static_cast<float>(h - 1));
                }
                quads.push_back(q);
            }
            return quads;
        }

        CtcResult recognize_line_(const cv::Mat& line, const PaddleOcrConfig& cfg) {
            const cv::Mat c = line.isContinuous() ? line : line.clone();
            const float aspect = static_cast<float>(c.cols) / static_cast<float>(c.rows);
            const int tw = std::clamp(static_cast<int>(std::ceil(cfg.rec_height * aspect)), 8, cfg.rec_max_width);

            ncnn::Mat in = ncnn::Mat::from_pixels_resize(c.data, ncnn::Mat::PIXEL_BGR, c.cols, c.rows, tw, cfg.rec_height);
            static const float kMean[3] = {127.5f, 127.5f, 127.5f};
            static const float kNorm[3] = {1.0f / 127.5f, 1.0f / 127.5f, 1.0f / 127.5f};
            in.substract_mean_normalize(kMean, kNorm);

            ncnn::Extractor ex = make_extractor_(rec_);
            if (ex.input(cfg.rec_input.c_str(), in) != 0) {
                throw std::runtime_error("OCR recognizer rejected input blob " + cfg.rec_input);
            }
            ncnn::Mat out;
            if (ex.extract(cfg.rec_output.c_str(), out) != 0 || out.empty()) {
                throw std::runtime_error("OCR recognizer produced no " + cfg.rec_output);
            }

            // [timesteps x classes]
            const int classes = out.w;
            const int timesteps = out.h;
            if (!classes_checked_) {
                if (!decoder_.fit_to_classes(classes)) {
                    throw std::runtime_error("OCR dictionary has " + std::to_string(decoder_.size()) +
                                             " entries, model emits " + std::to_string(classes) + " classes");
                }
                classes_checked_ = true;
            }
            return decoder_.decode(static_cast<const float*>(out.channel(0).data), timesteps, classes);
        }

        ncnn::Net det_;
        ncnn::Net rec_;
        CtcDecoder decoder_;
        bool classes_checked_ = false;

        ncnn::UnlockedPoolAllocator blob_pool_allocator_;
        ncnn::PoolAllocator workspace_pool_allocator_;
    };

    PaddleOcrRecognizer::PaddleOcrRecognizer(PaddleOcrConfig cfg)
        : cfg_(std::move(cfg)),
          impl_(std::make_unique<Impl>(cfg_)) {}

    PaddleOcrRecognizer::~PaddleOcrRecognizer() = default;

    std::vector<RecognizedText> PaddleOcrRecognizer::recognize(const cv::Mat& bgr) {
        return impl_->recognize(bgr, cfg_);
    }
}
