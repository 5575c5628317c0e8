#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/cancellation.hpp"

using streamlift::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  streamlift::observability::ShutdownLogging();
  streamlift::observability::ShutdownMetrics();
  streamlift::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: streamlift-worker <config.yaml> OR streamlift-worker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = streamlift::config::ConfigLoader::LoadFromYaml(config_path);

    streamlift::observability::InitializeTracing(config);
    streamlift::observability::InitializeMetrics(config);
    streamlift::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    streamlift::util::CancellationToken cancel;
    auto                                app = streamlift::factory::Build(config, cancel);

    // ------------------------------------------------------------
    // Start server and consumers
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    app.consumer->Start();
    STREAMLIFT_LOG_INFO("Streamlift worker started", {streamlift::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    // ------------------------------------------------------------
    // Shutdown: stop intake, drain, then cancel what is left
    // ------------------------------------------------------------
    STREAMLIFT_LOG_INFO("Shutting down streamlift worker",
                        {streamlift::observability::IntField("in_flight", static_cast<int64_t>(app.context.scheduler->InFlight()))});

    app.consumer->Stop();
    app.context.inbox->Close();
    server.Stop();

    const std::chrono::milliseconds grace(app.settings.shutdown_grace_ms);
    if (!app.context.scheduler->Drain(grace)) {
      STREAMLIFT_LOG_WARN("Grace period elapsed, cancelling in-flight jobs",
                          {streamlift::observability::IntField("grace_ms", static_cast<int64_t>(grace.count()))});
      cancel.Cancel();
    }
    app.context.scheduler->Stop();

    STREAMLIFT_LOG_INFO("Streamlift worker stopped");
    ShutdownObservability();
  } catch (const std::exception& e) {
    STREAMLIFT_LOG_ERROR("Fatal error", {streamlift::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
