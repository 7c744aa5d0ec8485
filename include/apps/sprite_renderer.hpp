#pragma once

#include <cstddef>
#include <random>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/renderer.hpp"

namespace tfp {

// Demo renderer: a field of drifting sprites, a bouncing ball and a text overlay, drawn with OpenCV.
// Every worker builds the same sprite field from the config seed, so any worker can render any frame.
// Render time, failures and hangs are simulated from DemoConfig to exercise the pipeline.
class SpriteRenderer final : public Renderer {
public:
  SpriteRenderer(const DemoConfig& cfg, std::size_t worker_id);

  cv::Mat render(const RenderRequest& request) override;

  static RendererFactory Factory(const DemoConfig& cfg);

private:
  struct Sprite {
    float x, y;
    float vx, vy;
    int radius;
    cv::Vec3b rgb;
  };

  DemoConfig cfg_;
  std::size_t worker_id_;
  std::vector<Sprite> sprites_;
  std::mt19937 rng_;
};

} // namespace tfp
