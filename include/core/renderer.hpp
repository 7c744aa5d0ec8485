#pragma once

#include <cstddef>
#include <functional>
#include <memory>

#include <opencv2/core.hpp>

#include "core/render_request.hpp"

/*
    The two external collaborators of the pipeline.

    Renderer runs inside a worker thread and turns a RenderRequest into pixels. Each worker gets its own
    Renderer from the factory, so implementations need no locking. Throwing from render() reports the
    request as failed.

    PresentationSurface is what the display loop hands the current frame to. present() is expected to return
    within a bounded copy/draw time.
*/

namespace tfp {

class Renderer {
public:
  virtual ~Renderer() = default;

  // Returns a CV_8UC4 image of scene.width x scene.height. The renderer must not write to the returned
  // image afterwards; clone a reused canvas before returning it
  virtual cv::Mat render(const RenderRequest& request) = 0;
};

using RendererFactory = std::function<std::unique_ptr<Renderer>(std::size_t worker_id)>;

class PresentationSurface {
public:
  virtual ~PresentationSurface() = default;

  virtual void present(const cv::Mat& pixels, int width, int height) = 0;
};

} // namespace tfp
