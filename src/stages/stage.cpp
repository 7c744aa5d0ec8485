#include "stages/stage.hpp"
#include <iostream>

#include <utility>

namespace tfp {

Stage::Stage(std::string name)
    : name_(std::move(name)), runner_(name_) {}

Stage::~Stage() = default;

void Stage::start(StopToken global_stop) {
  std::cout << "[" << name_ << "] started" << std::endl;

  runner_.start(std::move(global_stop), [this](const StopToken& g, const std::atomic_bool& l) {
    run(g, l);
  });
}

void Stage::request_stop() {
  runner_.request_stop();
}

void Stage::stop() {
  if (!runner_.joinable()) return;

  runner_.request_stop();
  runner_.join();

  std::cout << "[" << name_ << "] stopped" << std::endl;
}

bool Stage::running() const {
  return runner_.joinable() && !runner_.finished();
}

} // namespace tfp
