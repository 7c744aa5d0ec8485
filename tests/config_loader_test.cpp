#include <iostream>
#include <stdexcept>
#include <string>

#include "core/config_loader.hpp"

#include "test_support.hpp"

using tfp_test::Check;

// Expects LoadConfigFromYamlString to throw, and the message to name 'key'
static bool RejectsWith(const std::string& yaml, const std::string& key) {
  try {
    tfp::LoadConfigFromYamlString(yaml);
  } catch (const std::runtime_error& e) {
    const bool named = std::string(e.what()).find(key) != std::string::npos;
    if (!named) std::cerr << "  unexpected message: " << e.what() << "\n";
    return named;
  }
  std::cerr << "  accepted:\n" << yaml << "\n";
  return false;
}

static void Defaults() {
  std::cout << "[config] empty document gives defaults\n";
  const tfp::AppConfig cfg = tfp::LoadConfigFromYamlString("");

  Check(cfg.pipeline.worker_count == 4, "cfg.pipeline.worker_count == 4", __LINE__);
  Check(cfg.pipeline.target_fps == 60.0, "cfg.pipeline.target_fps == 60.0", __LINE__);
  Check(cfg.pipeline.queue_capacity == 8, "cfg.pipeline.queue_capacity == 8", __LINE__);
  Check(cfg.pipeline.worker_timeout_ms == 250, "cfg.pipeline.worker_timeout_ms == 250", __LINE__);
  Check(cfg.pipeline.retry_limit == 2, "cfg.pipeline.retry_limit == 2", __LINE__);
  Check(cfg.surface.width == 800 && cfg.surface.height == 600, "cfg.surface.width == 800 && cfg.surface.height == 600", __LINE__);
  Check(cfg.surface.pixel_format == tfp::PixelFormat::Rgba8, "cfg.surface.pixel_format == tfp::PixelFormat::Rgba8", __LINE__);
}

static void Overrides() {
  std::cout << "[config] values are read per section\n";
  const tfp::AppConfig cfg = tfp::LoadConfigFromYamlString(
      "pipeline:\n"
      "  worker_count: 6\n"
      "  target_fps: 30\n"
      "  queue_capacity: 12\n"
      "  worker_timeout_ms: 500\n"
      "  retry_limit: 0\n"
      "surface:\n"
      "  width: 320\n"
      "  height: 240\n"
      "  pixel_format: prgb8\n"
      "  show_window: false\n"
      "demo:\n"
      "  failure_rate: 0.25\n"
      "  seed: 99\n"
      "metrics:\n"
      "  dashboard: true\n"
      "  log_interval_ms: 500\n");

  Check(cfg.pipeline.worker_count == 6, "cfg.pipeline.worker_count == 6", __LINE__);
  Check(cfg.pipeline.target_fps == 30.0, "cfg.pipeline.target_fps == 30.0", __LINE__);
  Check(cfg.pipeline.queue_capacity == 12, "cfg.pipeline.queue_capacity == 12", __LINE__);
  Check(cfg.pipeline.worker_timeout_ms == 500, "cfg.pipeline.worker_timeout_ms == 500", __LINE__);
  Check(cfg.pipeline.retry_limit == 0, "cfg.pipeline.retry_limit == 0", __LINE__);
  Check(cfg.surface.width == 320 && cfg.surface.height == 240, "cfg.surface.width == 320 && cfg.surface.height == 240", __LINE__);
  Check(cfg.surface.pixel_format == tfp::PixelFormat::Prgb8, "cfg.surface.pixel_format == tfp::PixelFormat::Prgb8", __LINE__);
  Check(!cfg.surface.show_window, "!cfg.surface.show_window", __LINE__);
  Check(cfg.demo.failure_rate > 0.24f && cfg.demo.failure_rate < 0.26f, "cfg.demo.failure_rate > 0.24f && cfg.demo.failure_rate < 0.26f", __LINE__);
  Check(cfg.demo.seed == 99u, "cfg.demo.seed == 99u", __LINE__);
  Check(cfg.metrics.dashboard, "cfg.metrics.dashboard", __LINE__);
  Check(cfg.metrics.log_interval_ms == 500, "cfg.metrics.log_interval_ms == 500", __LINE__);
}

static void InvalidValues() {
  std::cout << "[config] invalid values are rejected with the offending key\n";
  Check(RejectsWith("pipeline: {worker_count: 0}", "pipeline.worker_count"), "RejectsWith(\"pipeline: {worker_count: 0}\", \"pipeline.worker_count\")", __LINE__);
  Check(RejectsWith("pipeline: {worker_count: -2}", "pipeline.worker_count"), "RejectsWith(\"pipeline: {worker_count: -2}\", \"pipeline.worker_count\")", __LINE__);
  Check(RejectsWith("pipeline: {target_fps: 0}", "pipeline.target_fps"), "RejectsWith(\"pipeline: {target_fps: 0}\", \"pipeline.target_fps\")", __LINE__);
  Check(RejectsWith("pipeline: {target_fps: 5000}", "pipeline.target_fps"), "RejectsWith(\"pipeline: {target_fps: 5000}\", \"pipeline.target_fps\")", __LINE__);
  Check(RejectsWith("pipeline: {queue_capacity: 0}", "pipeline.queue_capacity"), "RejectsWith(\"pipeline: {queue_capacity: 0}\", \"pipeline.queue_capacity\")", __LINE__);
  Check(RejectsWith("pipeline: {worker_timeout_ms: 0}", "pipeline.worker_timeout_ms"), "RejectsWith(\"pipeline: {worker_timeout_ms: 0}\", \"pipeline.worker_timeout_ms\")", __LINE__);
  Check(RejectsWith("pipeline: {retry_limit: -1}", "pipeline.retry_limit"), "RejectsWith(\"pipeline: {retry_limit: -1}\", \"pipeline.retry_limit\")", __LINE__);
  Check(RejectsWith("surface: {width: 0}", "surface"), "RejectsWith(\"surface: {width: 0}\", \"surface\")", __LINE__);
  Check(RejectsWith("surface: {pixel_format: bgr24}", "surface.pixel_format"), "RejectsWith(\"surface: {pixel_format: bgr24}\", \"surface.pixel_format\")", __LINE__);
  Check(RejectsWith("demo: {min_render_ms: 20, max_render_ms: 10}", "demo.max_render_ms"), "RejectsWith(\"demo: {min_render_ms: 20, max_render_ms: 10}\", \"demo.max_render_ms\")", __LINE__);
  Check(RejectsWith("demo: {hang_rate: 1.5}", "demo.hang_rate"), "RejectsWith(\"demo: {hang_rate: 1.5}\", \"demo.hang_rate\")", __LINE__);
  Check(RejectsWith("metrics: {log_interval_ms: 0}", "metrics.log_interval_ms"), "RejectsWith(\"metrics: {log_interval_ms: 0}\", \"metrics.log_interval_ms\")", __LINE__);
}

static void TypeErrors() {
  std::cout << "[config] wrong types are reported with the key path\n";
  Check(RejectsWith("pipeline: {worker_count: many}", "pipeline.worker_count"), "RejectsWith(\"pipeline: {worker_count: many}\", \"pipeline.worker_count\")", __LINE__);
  Check(RejectsWith("pipeline: {target_fps: [1, 2]}", "pipeline.target_fps"), "RejectsWith(\"pipeline: {target_fps: [1, 2]}\", \"pipeline.target_fps\")", __LINE__);
  Check(RejectsWith("surface: {show_window: maybe}", "surface.show_window"), "RejectsWith(\"surface: {show_window: maybe}\", \"surface.show_window\")", __LINE__);
}

static void PipelineOnlyValidation() {
  std::cout << "[config] ValidatePipelineOrThrow\n";
  tfp::PipelineConfig c;
  bool ok = true;
  try {
    tfp::ValidatePipelineOrThrow(c);
  } catch (const std::runtime_error&) {
    ok = false;
  }
  Check(ok, "ok", __LINE__);

  c.queue_capacity = 0;
  bool threw = false;
  try {
    tfp::ValidatePipelineOrThrow(c);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  Check(threw, "threw", __LINE__);
}

static void MissingFile() {
  std::cout << "[config] missing file\n";
  bool threw = false;
  try {
    tfp::LoadConfigFromYamlFile("/nonexistent/tripleframe.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML file") != std::string::npos;
  }
  Check(threw, "threw", __LINE__);
}

int main() {
  Defaults();
  Overrides();
  InvalidValues();
  TypeErrors();
  PipelineOnlyValidation();
  MissingFile();
  return tfp_test::Finish("config_loader_test");
}
