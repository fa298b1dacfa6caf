/**
 * @file main.cpp
 * @brief vigil_demo: drives a Monitor with simulated agent executions.
 *
 * **Bootstrap**
 * - Load config (`--config <file.json>`), or defaults; construct the Monitor; start maintenance.
 *
 * **Workload**
 * - N worker threads run agent executions through ExecutionScope/CallTimer and record
 *   response-time, error and category metrics. Every 7th execution fails.
 *
 * **Reporting**
 * - Print health, active alerts and a metrics digest through the "vigil" logger; clean shutdown.
 */

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "vigil/config/config_loader.hpp"
#include "vigil/obs/diagnostics.hpp"
#include "vigil/obs/execution_scope.hpp"
#include "vigil/obs/monitor.hpp"
#include "vigil/version.hpp"

namespace {

struct Options {
  std::string config_path;
  int threads{4};
  int executions{200};
};

Options parse_args(int argc, char** argv) {
  Options o;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--config" && i + 1 < argc) o.config_path = argv[++i];
    else if (arg == "--threads" && i + 1 < argc) o.threads = std::max(1, std::atoi(argv[++i]));
    else if (arg == "--executions" && i + 1 < argc) o.executions = std::max(1, std::atoi(argv[++i]));
  }
  return o;
}

void run_worker(vigil::obs::Monitor& mon, int worker, int count) {
  std::mt19937 rng(static_cast<unsigned>(worker) * 7919u + 1u);
  std::uniform_int_distribution<int> think_ms(1, 5);
  std::uniform_real_distribution<double> response_ms(200.0, 6000.0);

  for (int i = 0; i < count; ++i) {
    const auto id = "w" + std::to_string(worker) + "-exec-" + std::to_string(i);
    auto scope = vigil::obs::ExecutionScope::begin(mon, id, {{"agent_id", "agent-" + std::to_string(i % 3)},
                                                            {"worker", static_cast<int64_t>(worker)}});
    if (!scope) {
      vigil::obs::default_logger()->warn("could not start {}: {}", id, vigil::obs::to_string(scope.error()));
      continue;
    }
    {
      auto t = scope->time_call("agent_manager.execute_agent");
      std::this_thread::sleep_for(std::chrono::milliseconds(think_ms(rng)));
    }
    (void)mon.record_metric("agent_response_time_ms", response_ms(rng), {}, vigil::metrics::MetricKind::Timer);

    if (i % 7 == 6) {
      (void)mon.record_metric("agent_execution_error", 1, {{"agent_id", "agent-" + std::to_string(i % 3)}});
      (void)mon.record_metric("error_by_category", 1, {{"category", "llm"}});
      scope->fail("simulated agent failure");
    } else {
      scope->complete();
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  const Options opt = parse_args(argc, argv);
  auto log = vigil::obs::default_logger();
  log->info("vigil_demo {}", vigil::version_string);

  vigil::config::MonitorConfig cfg;
  if (!opt.config_path.empty()) {
    auto loaded = vigil::config::Loader::load_from_file(opt.config_path);
    if (!loaded) {
      log->error("config '{}' rejected: {}", opt.config_path, vigil::config::to_string(loaded.error()));
      return EXIT_FAILURE;
    }
    cfg = std::move(*loaded);
  }

  vigil::obs::Monitor mon(std::move(cfg));
  mon.start();

  std::vector<std::thread> workers;
  for (int w = 0; w < opt.threads; ++w) {
    workers.emplace_back(run_worker, std::ref(mon), w, opt.executions);
  }
  for (auto& t : workers) t.join();

  (void)mon.run_maintenance();
  const auto health = mon.get_system_health();
  log->info("health={} running={} completed={} error={}",
            vigil::health::to_string(health.status), health.executions.running,
            health.executions.completed, health.executions.error);
  for (const auto& a : health.active_alerts) {
    log->info("  alert {} [{}] {}", a.id, vigil::alerts::to_string(a.severity), a.message);
  }
  for (const auto& [key, m] : health.metrics) {
    log->info("  metric {} kind={} count={} value={:.2f} p95={:.2f}",
              key, vigil::metrics::to_string(m.kind), m.count, m.value, m.p95);
  }
  const auto d = mon.diagnostics();
  log->info("diagnostics: unknown={} terminal={} invalid={} repaired={}",
            d.unknown_execution, d.terminal_execution, d.invalid_argument, d.repaired_end);

  mon.stop();
  return EXIT_SUCCESS;
}
