#include <matching/ssim.hpp>

#include <stdexcept>

#include <opencv2/imgproc.hpp>

namespace cs {
    namespace {
        cv::Mat window_mean(const cv::Mat& m, int win) {
            cv::Mat out;
            cv::blur(m, out, cv::Size(win, win), cv::Point(-1, -1), cv::BORDER_REFLECT);
            return out;
        }
    } // namespace

    double ssim(const cv::Mat& a, const cv::Mat& b, const SsimParams& p) {
        if (a.empty() || b.empty()) throw std::invalid_argument("ssim: empty image");
        if (a.size() != b.size()) throw std::invalid_argument("ssim: images differ in size");
        if (a.channels() != 1 || b.channels() != 1) {
            throw std::invalid_argument("ssim: expects single-channel images");
        }
        if (p.win_size < 3 || (p.win_size % 2) == 0) {
            throw std::invalid_argument("ssim: win_size must be odd and >= 3");
        }
        if (a.cols < p.win_size || a.rows < p.win_size) {
            throw std::invalid_argument("ssim: image smaller than the window");
        }

        cv::Mat x, y;
        a.convertTo(x, CV_64F);
        b.convertTo(y, CV_64F);

        const int win = p.win_size;
        const cv::Mat ux = window_mean(x, win);
        const cv::Mat uy = window_mean(y, win);
        const cv::Mat uxx = window_mean(x.mul(x), win);
        const cv::Mat uyy = window_mean(y.mul(y), win);
        const cv::Mat uxy = window_mean(x.mul(y), win);

        // unbiased estimate over the window
        const double np = static_cast<double>(win * win);
        const double cov_norm = np / (np - 1.0);
        const cv::Mat vx = cov_norm * (uxx - ux.mul(ux));
        const cv::Mat vy = cov_norm * (uyy - uy.mul(uy));
        const cv::Mat vxy = cov_norm * (uxy - ux.mul(uy));

        const double c1 = (p.k1 * p.data_range) * (p.k1 * p.data_range);
        const double c2 = (p.k2 * p.data_range) * (p.k2 * p.data_range);

        const cv::Mat a1 = 2.0 * ux.mul(uy) + c1;
        const cv::Mat a2 = 2.0 * vxy + c2;
        const cv::Mat b1 = ux.mul(ux) + uy.mul(uy) + c1;
        const cv::Mat b2 = vx + vy + c2;

        cv::Mat s;
        cv::divide(a1.mul(a2), b1.mul(b2), s);

        const int pad = (win - 1) / 2;
        const cv::Rect interior(pad, pad, s.cols - 2 * pad, s.rows - 2 * pad);
        return cv::mean(s(interior))[0];
    }
}
