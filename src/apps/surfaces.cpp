#include "apps/surfaces.hpp"

#include <stdexcept>
#include <utility>

#include <opencv2/highgui.hpp>  // cv::namedWindow, cv::imshow, cv::waitKey
#include <opencv2/imgproc.hpp>

namespace tfp {

HighGuiSurface::HighGuiSurface(SurfaceConfig cfg, std::atomic_bool& quit)
    : cfg_(std::move(cfg)), quit_(quit) {}

HighGuiSurface::~HighGuiSurface() {
  if (window_open_) cv::destroyWindow(cfg_.window_name);
}

void HighGuiSurface::present(const cv::Mat& pixels, int width, int height) {
  if (pixels.empty() || pixels.cols != width || pixels.rows != height) {
    throw std::invalid_argument("HighGuiSurface: payload does not match its declared size");
  }

  if (!window_open_) {
    cv::namedWindow(cfg_.window_name, cv::WINDOW_AUTOSIZE);
    window_open_ = true;
  }

  if (cfg_.pixel_format == PixelFormat::Prgb8) {
    // A,R,G,B -> B,G,R
    bgr_.create(pixels.rows, pixels.cols, CV_8UC3);
    const int from_to[] = {3, 0, 2, 1, 1, 2};
    cv::mixChannels(&pixels, 1, &bgr_, 1, from_to, 3);
  } else {
    cv::cvtColor(pixels, bgr_, cv::COLOR_RGBA2BGR);
  }

  cv::imshow(cfg_.window_name, bgr_);

  const int key = cv::waitKey(1);
  if (key == 'q' || key == 27) quit_.store(true, std::memory_order_relaxed);
}

void CountingSurface::present(const cv::Mat& pixels, int width, int height) {
  presents_.fetch_add(1, std::memory_order_relaxed);
  bytes_.fetch_add(static_cast<std::uint64_t>(pixels.total() * pixels.elemSize()), std::memory_order_relaxed);
  (void)width;
  (void)height;
}

} // namespace tfp
