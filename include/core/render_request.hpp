#pragma once

#include <cstdint>

#include "core/frame.hpp"

namespace tfp {

// Snapshot of whatever the renderer needs to draw one frame. Built by the scene source, never read by the pipeline
struct SceneState {
  std::uint64_t frame_no{0};
  double time_s{0.0};
  int width{0};
  int height{0};
  PixelFormat format{PixelFormat::Rgba8};

  // Display FPS measured when the request was issued, for the renderer's overlay
  double display_fps{0.0};
};

struct RenderRequest {
  std::uint64_t index{kNoFrame};
  SceneState scene{};
  TimePoint issued_time{};
};

} // namespace tfp
