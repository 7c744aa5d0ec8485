#include <iostream>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

#include "core/config_loader.hpp"
#include "core/render_request.hpp"

#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

#include "stages/pipeline.hpp"

#include "apps/ansi_dashboard.hpp"
#include "apps/sprite_renderer.hpp"
#include "apps/surfaces.hpp"

static std::atomic_bool g_sigint{false};

static void HandleSigint(int) {
  g_sigint.store(true, std::memory_order_relaxed);
}

// live_pipeline.cpp runs the whole pipeline against a window: sprite renderer workers -> dispatcher ->
// frame queue -> triple buffer -> display loop -> HighGUI window

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    tfp::AppConfig cfg = tfp::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    std::cout << "surface " << cfg.surface.width << "x" << cfg.surface.height << " "
              << tfp::ToString(cfg.surface.pixel_format)
              << (cfg.surface.show_window ? "" : " (headless)") << "\n";

    std::signal(SIGINT, HandleSigint);

    std::atomic_bool quit{false};
    std::unique_ptr<tfp::PresentationSurface> surface;
    if (cfg.surface.show_window) {
      surface = std::make_unique<tfp::HighGuiSurface>(cfg.surface, quit);
    } else {
      surface = std::make_unique<tfp::CountingSurface>();
    }

    tfp::Pipeline pipeline(cfg.pipeline, tfp::SpriteRenderer::Factory(cfg.demo), *surface);

    // Workers are kept busy by the dispatcher itself, up to queue_capacity requests outstanding
    const auto t0 = std::chrono::steady_clock::now();
    const tfp::SurfaceConfig surface_cfg = cfg.surface;
    pipeline.set_scene_source([&pipeline, surface_cfg, t0](std::uint64_t index) {
      tfp::SceneState s;
      s.frame_no = index;
      s.time_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
      s.width = surface_cfg.width;
      s.height = surface_cfg.height;
      s.format = surface_cfg.pixel_format;
      s.display_fps = pipeline.fps().current_fps();
      return s;
    });

    pipeline.start();

    tfp::StopSource ui_stop;
    tfp::ThreadRunner dashboard_thread("dashboard");
    std::unique_ptr<tfp::AnsiDashboard> dashboard;
    if (cfg.metrics.dashboard) {
      dashboard = std::make_unique<tfp::AnsiDashboard>(pipeline, quit);
      dashboard_thread.start(ui_stop.token(), [&dashboard](const tfp::StopToken& g, const std::atomic_bool&) {
        dashboard->run(g);
      });
    }

    const auto log_interval = std::chrono::milliseconds(cfg.metrics.log_interval_ms);
    auto next_log = std::chrono::steady_clock::now() + log_interval;

    while (true) {
      if (g_sigint.load(std::memory_order_relaxed)) {
        std::cout << "\nShutting down pipeline..." << std::endl;
        break;
      }
      if (quit.load(std::memory_order_relaxed)) {
        std::cout << "User exited. Shutting down pipeline..." << std::endl;
        break;
      }

      const auto now = std::chrono::steady_clock::now();
      if (!cfg.metrics.dashboard && cfg.metrics.enable_console_log && now >= next_log) {
        std::cout << tfp::StatsLine(pipeline.stats()) << std::endl;
        next_log = now + log_interval;
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    ui_stop.request_stop();
    dashboard_thread.join();

    pipeline.stop();
    std::cout << "Final: " << tfp::StatsLine(pipeline.stats()) << std::endl;

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
