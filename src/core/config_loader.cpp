#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

namespace tfp {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static PixelFormat ParsePixelFormatKey(const YAML::Node& parent, const char* key, const std::string& key_path, PixelFormat fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "rgba8") return PixelFormat::Rgba8;
  if (s == "prgb8") return PixelFormat::Prgb8;
  throw ConfigError(key_path, "unknown pixel_format '" + s + "'. Use: rgba8 | prgb8");
}

// worker_count and queue_capacity are unsigned; read them signed so "-1" is reported instead of wrapping
static std::size_t GetCountKey(const YAML::Node& parent, const char* key, const std::string& key_path, std::size_t fallback) {
  const long long v = GetOrKey<long long>(parent, key, key_path, static_cast<long long>(fallback));
  if (v < 0) throw ConfigError(key_path, "must be >= 0");
  return static_cast<std::size_t>(v);
}

static void LoadPipeline(const YAML::Node& root, PipelineConfig& cfg) {
  const YAML::Node pl = Child(root, "pipeline");
  if (!pl) return;
  const std::string p = "pipeline";

  cfg.worker_count = GetCountKey(pl, "worker_count", PathJoin(p, "worker_count"), cfg.worker_count);
  cfg.target_fps = GetOrKey<double>(pl, "target_fps", PathJoin(p, "target_fps"), cfg.target_fps);
  cfg.queue_capacity = GetCountKey(pl, "queue_capacity", PathJoin(p, "queue_capacity"), cfg.queue_capacity);
  cfg.worker_timeout_ms = GetOrKey<int>(pl, "worker_timeout_ms", PathJoin(p, "worker_timeout_ms"), cfg.worker_timeout_ms);
  cfg.retry_limit = GetOrKey<int>(pl, "retry_limit", PathJoin(p, "retry_limit"), cfg.retry_limit);
}

static void LoadSurface(const YAML::Node& root, SurfaceConfig& cfg) {
  const YAML::Node s = Child(root, "surface");
  if (!s) return;
  const std::string p = "surface";

  cfg.width = GetOrKey<int>(s, "width", PathJoin(p, "width"), cfg.width);
  cfg.height = GetOrKey<int>(s, "height", PathJoin(p, "height"), cfg.height);
  cfg.pixel_format = ParsePixelFormatKey(s, "pixel_format", PathJoin(p, "pixel_format"), cfg.pixel_format);
  cfg.window_name = GetOrKey<std::string>(s, "window_name", PathJoin(p, "window_name"), cfg.window_name);
  cfg.show_window = GetOrKey<bool>(s, "show_window", PathJoin(p, "show_window"), cfg.show_window);
}

static void LoadDemo(const YAML::Node& root, DemoConfig& cfg) {
  const YAML::Node d = Child(root, "demo");
  if (!d) return;
  const std::string p = "demo";

  cfg.sprite_count = GetOrKey<int>(d, "sprite_count", PathJoin(p, "sprite_count"), cfg.sprite_count);
  cfg.min_render_ms = GetOrKey<int>(d, "min_render_ms", PathJoin(p, "min_render_ms"), cfg.min_render_ms);
  cfg.max_render_ms = GetOrKey<int>(d, "max_render_ms", PathJoin(p, "max_render_ms"), cfg.max_render_ms);
  cfg.failure_rate = GetOrKey<float>(d, "failure_rate", PathJoin(p, "failure_rate"), cfg.failure_rate);
  cfg.hang_rate = GetOrKey<float>(d, "hang_rate", PathJoin(p, "hang_rate"), cfg.hang_rate);
  cfg.seed = GetOrKey<unsigned int>(d, "seed", PathJoin(p, "seed"), cfg.seed);
}

static void LoadMetrics(const YAML::Node& root, MetricsConfig& cfg) {
  const YAML::Node m = Child(root, "metrics");
  if (!m) return;
  const std::string p = "metrics";

  cfg.enable_console_log = GetOrKey<bool>(m, "enable_console_log", PathJoin(p, "enable_console_log"), cfg.enable_console_log);
  cfg.log_interval_ms = GetOrKey<int>(m, "log_interval_ms", PathJoin(p, "log_interval_ms"), cfg.log_interval_ms);
  cfg.dashboard = GetOrKey<bool>(m, "dashboard", PathJoin(p, "dashboard"), cfg.dashboard);
}

void ValidatePipelineOrThrow(const PipelineConfig& cfg) {
  if (cfg.worker_count < 1) throw ConfigError("pipeline.worker_count", "must be >= 1");
  if (!(cfg.target_fps > 0.0) || cfg.target_fps > 1000.0) throw ConfigError("pipeline.target_fps", "must be in (0, 1000]");
  if (cfg.queue_capacity < 1) throw ConfigError("pipeline.queue_capacity", "must be >= 1");
  if (cfg.worker_timeout_ms <= 0) throw ConfigError("pipeline.worker_timeout_ms", "must be > 0");
  if (cfg.retry_limit < 0) throw ConfigError("pipeline.retry_limit", "must be >= 0");
}

void ValidateOrThrow(const AppConfig& cfg) {
  ValidatePipelineOrThrow(cfg.pipeline);

  if (cfg.surface.width <= 0 || cfg.surface.height <= 0) throw ConfigError("surface", "width/height must be > 0");

  if (cfg.demo.sprite_count < 0) throw ConfigError("demo.sprite_count", "must be >= 0");
  if (cfg.demo.min_render_ms < 0) throw ConfigError("demo.min_render_ms", "must be >= 0");
  if (cfg.demo.max_render_ms < cfg.demo.min_render_ms)
    throw ConfigError("demo.max_render_ms", "must be >= demo.min_render_ms");
  if (cfg.demo.failure_rate < 0.f || cfg.demo.failure_rate > 1.f)
    throw ConfigError("demo.failure_rate", "must be in [0, 1]");
  if (cfg.demo.hang_rate < 0.f || cfg.demo.hang_rate > 1.f)
    throw ConfigError("demo.hang_rate", "must be in [0, 1]");

  if (cfg.metrics.log_interval_ms <= 0) throw ConfigError("metrics.log_interval_ms", "must be > 0");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;

  LoadPipeline(root, cfg.pipeline);
  LoadSurface(root, cfg.surface);
  LoadDemo(root, cfg.demo);
  LoadMetrics(root, cfg.metrics);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

} // namespace tfp
