#pragma once
#include <cstddef>
#include <string>

#include "core/pixel_format.hpp"

namespace tfp {

enum class DropPolicy {
  DropOldest,
  DropNewest
};

// The five tunables of the frame pipeline itself. Everything else in AppConfig belongs to the apps.
struct PipelineConfig {
  std::size_t worker_count = 4;
  double target_fps = 60.0;
  std::size_t queue_capacity = 8;
  int worker_timeout_ms = 250;
  int retry_limit = 2;
};

struct SurfaceConfig {
  int width = 800;
  int height = 600;
  PixelFormat pixel_format = PixelFormat::Rgba8;
  std::string window_name = "Triple Frame";
  bool show_window = true;
};

// Demo sprite renderer. Latency/failure/hang knobs let the apps exercise out-of-order completion
struct DemoConfig {
  int sprite_count = 200;
  int min_render_ms = 5;
  int max_render_ms = 40;
  float failure_rate = 0.0f;
  float hang_rate = 0.0f;
  unsigned int seed = 1234;
};

struct MetricsConfig {
  bool enable_console_log = true;
  int log_interval_ms = 1000;
  bool dashboard = false;
};

struct AppConfig {
  PipelineConfig pipeline{};
  SurfaceConfig surface{};
  DemoConfig demo{};
  MetricsConfig metrics{};
};

}
