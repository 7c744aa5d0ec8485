#include "apps/sprite_renderer.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>

#include <opencv2/imgproc.hpp>

namespace tfp {

// How long a "hung" render blocks. Long enough to trip any sane worker timeout
static constexpr int kHangMs = 2000;

static cv::Scalar Color(PixelFormat fmt, int r, int g, int b, int a = 255) {
  if (fmt == PixelFormat::Prgb8) {
    return cv::Scalar(a, r * a / 255, g * a / 255, b * a / 255);
  }
  return cv::Scalar(r, g, b, a);
}

// Wraps v into [0, range)
static float Wrap(float v, float range) {
  if (range <= 0.f) return 0.f;
  float w = std::fmod(v, range);
  return w < 0.f ? w + range : w;
}

SpriteRenderer::SpriteRenderer(const DemoConfig& cfg, std::size_t worker_id)
    : cfg_(cfg), worker_id_(worker_id), rng_(cfg.seed + static_cast<unsigned int>(worker_id) * 7919u) {
  // Same seed for every worker: the sprite field must not depend on who renders it
  std::mt19937 field(cfg.seed);
  std::uniform_real_distribution<float> pos(0.f, 4096.f);
  std::uniform_real_distribution<float> vel(-4.f, 4.f);
  std::uniform_int_distribution<int> rad(3, 14);
  std::uniform_int_distribution<int> chan(60, 255);

  sprites_.reserve(static_cast<std::size_t>(cfg.sprite_count));
  for (int i = 0; i < cfg.sprite_count; ++i) {
    Sprite s;
    s.x = pos(field);
    s.y = pos(field);
    s.vx = vel(field);
    s.vy = vel(field);
    s.radius = rad(field);
    s.rgb = cv::Vec3b(static_cast<uchar>(chan(field)), static_cast<uchar>(chan(field)), static_cast<uchar>(chan(field)));
    sprites_.push_back(s);
  }
}

cv::Mat SpriteRenderer::render(const RenderRequest& request) {
  const SceneState& scene = request.scene;
  if (scene.width <= 0 || scene.height <= 0) throw std::invalid_argument("scene has no size");

  // Simulated cost of the frame
  std::uniform_int_distribution<int> cost(cfg_.min_render_ms, cfg_.max_render_ms);
  std::uniform_real_distribution<float> chance(0.f, 1.f);
  const float roll = chance(rng_);

  if (roll < cfg_.hang_rate) {
    std::this_thread::sleep_for(std::chrono::milliseconds(kHangMs));
  } else {
    std::this_thread::sleep_for(std::chrono::milliseconds(cost(rng_)));
  }
  if (chance(rng_) < cfg_.failure_rate) {
    throw std::runtime_error("simulated render failure");
  }

  const PixelFormat fmt = scene.format;
  cv::Mat img(scene.height, scene.width, CV_8UC4, Color(fmt, 20, 20, 30));

  const float w = static_cast<float>(scene.width);
  const float h = static_cast<float>(scene.height);
  const float t = static_cast<float>(scene.frame_no);

  for (const Sprite& s : sprites_) {
    const cv::Point c(static_cast<int>(Wrap(s.x + s.vx * t, w)), static_cast<int>(Wrap(s.y + s.vy * t, h)));
    cv::circle(img, c, s.radius, Color(fmt, s.rgb[0], s.rgb[1], s.rgb[2], 200), cv::FILLED, cv::LINE_AA);
  }

  // Ball sweeping left to right, the easiest thing to spot a skipped or repeated frame on
  const int ball_x = static_cast<int>(Wrap(t * 3.f, w));
  cv::circle(img, cv::Point(ball_x, scene.height / 2), 40, Color(fmt, 0, 200, 255), cv::FILLED, cv::LINE_AA);

  char text[128];
  std::snprintf(text, sizeof(text), "FPS: %.0f  Frame: %llu  Worker: %zu", scene.display_fps,
                static_cast<unsigned long long>(request.index), worker_id_);
  cv::putText(img, text, cv::Point(10, scene.height - 12), cv::FONT_HERSHEY_SIMPLEX, 0.6,
              Color(fmt, 255, 255, 255), 1, cv::LINE_AA);

  return img;
}

RendererFactory SpriteRenderer::Factory(const DemoConfig& cfg) {
  return [cfg](std::size_t worker_id) -> std::unique_ptr<Renderer> {
    return std::make_unique<SpriteRenderer>(cfg, worker_id);
  };
}

} // namespace tfp
