#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/renderer.hpp"

namespace tfp {

// OpenCV HighGUI window. Converts the frame to BGR for imshow and polls the keyboard once per present.
// q / Esc set 'quit'. Must be presented from a single thread (the display loop)
class HighGuiSurface final : public PresentationSurface {
public:
  HighGuiSurface(SurfaceConfig cfg, std::atomic_bool& quit);
  ~HighGuiSurface() override;

  void present(const cv::Mat& pixels, int width, int height) override;

private:
  SurfaceConfig cfg_;
  std::atomic_bool& quit_;
  cv::Mat bgr_;
  bool window_open_{false};
};

// Headless surface: only counts presents and the bytes it was handed
class CountingSurface final : public PresentationSurface {
public:
  void present(const cv::Mat& pixels, int width, int height) override;

  std::uint64_t presents() const { return presents_.load(std::memory_order_relaxed); }
  std::uint64_t bytes() const { return bytes_.load(std::memory_order_relaxed); }

private:
  std::atomic<std::uint64_t> presents_{0};
  std::atomic<std::uint64_t> bytes_{0};
};

} // namespace tfp
