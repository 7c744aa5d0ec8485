#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "core/frame.hpp"

namespace tfp {

enum class WorkerEventKind {
  Completed,
  Failed
};

// What a worker posts back to the dispatcher once it is done with a request
struct WorkerEvent {
  WorkerEventKind kind{WorkerEventKind::Failed};
  std::size_t worker_id{0};
  std::uint64_t index{kNoFrame};
  FramePtr frame;       // set when Completed
  std::string error;    // set when Failed
};

} // namespace tfp
