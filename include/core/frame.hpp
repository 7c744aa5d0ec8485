#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

#include <opencv2/core.hpp>

#include "core/pixel_format.hpp"

/*
    Defines one fully rendered, indexed unit of output. A Frame is built once by the worker that rendered it
    and is only ever shared as FramePtr (pointer to const) afterwards, so the queue, the triple buffer and the
    display path can all hold it without copying or locking the pixels.
*/

namespace tfp {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Index 0 is never issued, it stands for "no frame"
inline constexpr std::uint64_t kNoFrame = 0;

struct Frame {
  // Render request order (monotonic, never reused)
  std::uint64_t index{kNoFrame};

  int width{0};
  int height{0};
  PixelFormat format{PixelFormat::Rgba8};

  // Pixel payload, CV_8UC4 (shared, ref-counted)
  cv::Mat pixels;

  TimePoint issued_time{};
  TimePoint completion_time{};

  std::size_t worker_id{0};
};

using FramePtr = std::shared_ptr<const Frame>;

// Takes ownership of 'pixels'. Width/height are read from the matrix
inline FramePtr MakeFrame(std::uint64_t index, cv::Mat pixels, PixelFormat format, std::size_t worker_id,
                          TimePoint issued_time, TimePoint completion_time = Clock::now()) {
  auto f = std::make_shared<Frame>();
  f->index = index;
  f->width = pixels.cols;
  f->height = pixels.rows;
  f->format = format;
  f->pixels = std::move(pixels);
  f->issued_time = issued_time;
  f->completion_time = completion_time;
  f->worker_id = worker_id;
  return f;
}

} // namespace tfp
