#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "analyzer.hpp"
#include "governor.hpp"
#include "monitor.hpp"
#include "pipeline.hpp"
#include "platform.hpp"
#include "quality.hpp"
#include "util.hpp"

int main(int argc, char** argv) {
  CLI::App cli_app{"FrameGovernor: real-time frame admission and adaptive quality control"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  int run_seconds = 0;
  cli_app.add_option("-d,--duration", run_seconds, "Stop after N seconds (0 = until killed)")
      ->check(CLI::NonNegativeNumber);

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "FrameGovernor v1.0.0" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  spdlog::info("FrameGovernor starting (config: {})", cfg_path);

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const std::exception& e) {
    spdlog::error("Failed to load config '{}': {}", cfg_path, e.what());
    return 1;
  }
  apply_log_level(app.log_level);

  SteadyClock clock;
  ProcMemoryProbe memory_probe;
  std::unique_ptr<FrameGovernor> gov;
  try {
    gov = std::make_unique<FrameGovernor>(app.governor, clock, memory_probe);
  } catch (const std::invalid_argument& e) {
    spdlog::error("Invalid governor configuration: {}", e.what());
    return 1;
  }

  SimulatedAnalyzer analyzer(app.simulation);
  Pipeline pipe(app.pipeline, *gov, analyzer);
  GovernorMonitor monitor(*gov, app.monitor);

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/governor/stats", [&](const httplib::Request&, httplib::Response& res) {
    auto s = gov->snapshot();
    nlohmann::json j{{"avg_processing_ms", s.avg_processing_ms},
                     {"p95_processing_ms", s.p95_processing_ms},
                     {"estimated_fps", s.estimated_fps},
                     {"dropped_frame_pct", s.dropped_pct},
                     {"memory_bytes", s.memory_bytes},
                     {"quality", to_string(s.quality)},
                     {"throttling", s.throttling},
                     {"in_flight", s.in_flight},
                     {"frames_total", s.frames_total},
                     {"frames_dropped", s.frames_dropped},
                     {"buffered_frames", s.buffered_frames}};
    res.set_content(j.dump(2), "application/json");
  });

  svr.Post("/governor/reset", [&](const httplib::Request&, httplib::Response& res) {
    auto released = gov->reset();
    nlohmann::json j{{"reset", true}, {"released_frames", released.size()}};
    res.set_content(j.dump(), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(gov->prometheus_text(), "text/plain; version=0.0.4");
  });

  pipe.start();
  monitor.start();

  std::thread timer;
  if (run_seconds > 0) {
    timer = std::thread([&] {
      std::this_thread::sleep_for(std::chrono::seconds(run_seconds));
      svr.stop();
    });
  }

  spdlog::info("HTTP server listening on 0.0.0.0:{}", app.metrics_port);
  if (!svr.listen("0.0.0.0", app.metrics_port)) {
    spdlog::error("HTTP server failed on port {}", app.metrics_port);
  }

  if (timer.joinable()) timer.join();
  monitor.stop();
  pipe.stop();

  auto s = gov->snapshot();
  spdlog::info("Final: quality={} avg={:.2f}ms dropped={:.1f}% of {} frames",
               to_string(s.quality), s.avg_processing_ms, s.dropped_pct, s.frames_total);
  spdlog::info("Shutdown complete.");
  return 0;
}
