#include "collectors/mev_share_collector.hpp"
#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "config/app_config.hpp"
#include "engine/engine.hpp"
#include "executors/mev_share_executor.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "strategy/blind_arb.hpp"
#include "strategy/mev_share_uni_arb.hpp"
#include "strategy/types.hpp"
#include "telemetry/structured_logger.hpp"
#include "wallet/signer.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <variant>

namespace {
void FlushSinks() {
  StructuredLogger::Instance().Shutdown();
  Logger::Shutdown();
}

bool IsCollectorTask(const TaskOutcome& outcome) {
  return outcome.name.rfind("collector:", 0) == 0;
}
}

int main() {
  try {
    const std::string env_path = ".env";
    bool env_loaded = ConfigManager::Initialize(env_path);
    LogSettings log = LoadLogSettings();
    Logger::Initialize(log.file, log.level);
    if (!env_loaded) Logger::Warning(".env file not found: " + env_path + " (using process environment only)");

    AppConfig cfg = LoadAppConfig();
    if (!cfg.metrics_file.empty()) StructuredLogger::Instance().Initialize(cfg.metrics_file);
    Logger::Info("backrunner starting: chain " + std::to_string(cfg.chain_id) + ", " +
                 std::to_string(cfg.relays.size()) + " relays, pools from " + cfg.pools_csv);

    HttpClientTuning http_tuning;
    http_tuning.enable_http2 = true;
    http_tuning.enable_tcp_keepalive = true;
    std::unique_ptr<HttpClient> http = CreateCurlHttpClient(http_tuning);

    auto tx_signer = std::make_shared<const Signer>(cfg.private_key);
    auto fb_signer = std::make_shared<const Signer>(cfg.flashbots_signer_key);
    Logger::Info("Searcher address " + tx_signer->Address() + ", relay identity " + fb_signer->Address());

    auto node = std::make_shared<RpcClient>(*http, cfg.rpc_url, tx_signer->Address(), cfg.rpc_auth_header, cfg.rpc_timeout_ms);

    EngineOptions options;
    options.failure_policy = cfg.fail_fast ? FailurePolicy::kAbortProcess : FailurePolicy::kDegrade;
    Engine<Event, Action> engine(options);

    // Collector
    engine.AddCollector(std::make_unique<CollectorMap<Event, MevShareEvent>>(
      std::make_unique<MevShareCollector>(cfg.mev_share_sse_url, ReconnectPolicy{}, http_tuning),
      [](MevShareEvent ev) { return Event{std::move(ev)}; }));

    // Strategy
    engine.AddStrategy(std::make_unique<MevShareUniArb>(
      node, tx_signer, std::make_unique<BlindArbContract>(cfg.arb_contract_address),
      cfg.pools_csv, cfg.BuildBundleOptions()));

    // One executor per relay, each seeing only the bundles of SubmitBundles actions
    for (auto& relay : BuildRelayExecutors(*http, fb_signer, cfg.relays, cfg.http_timeout_ms)) {
      engine.AddExecutor(std::make_unique<ExecutorMap<Action, Bundles>>(
        std::move(relay),
        [](const Action& action) -> std::optional<Bundles> {
          if (const auto* submit = std::get_if<SubmitBundles>(&action)) return submit->bundles;
          return std::nullopt;
        }));
    }

    size_t collectors_left = engine.CollectorCount();
    TaskSet tasks = engine.Run();
    size_t failures = 0;
    while (auto outcome = tasks.JoinNext()) {
      if (IsCollectorTask(*outcome) && collectors_left > 0 && --collectors_left == 0) {
        // Nothing can produce events any more; let the rest drain and finish.
        engine.Shutdown();
      }
      if (outcome->Ok()) {
        Logger::Info("Task " + outcome->name + " completed");
        continue;
      }
      ++failures;
      Logger::Error("Task " + outcome->name + " " + TaskStatusName(outcome->status) + ": " + outcome->error);
      if (engine.ShouldAbort(*outcome)) {
        Logger::Critical("FAIL_FAST is set, terminating");
        FlushSinks();
        // Live tasks are not awaited.
        std::quick_exit(2);
      }
    }

    Logger::Info("All tasks finished, " + std::to_string(failures) + " failed");
    FlushSinks();
    return failures == 0 ? 0 : 1;
  } catch (const std::exception& e) {
    Logger::Critical(std::string("Startup failed: ") + e.what());
    FlushSinks();
    std::cerr << "CRITICAL ERROR: " << e.what() << std::endl;
    return 1;
  }
}
