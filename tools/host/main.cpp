// Repository: MirrorCast
// Component: Host Executable
// Purpose: Accepting device: control server, media relay, admin service and metrics.
// Copyright (c) 2025 MirrorCast

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "admin_service.h"
#include "mirrorcast/runtime/BroadcastFlag.h"
#include "mirrorcast/runtime/HostRuntime.h"
#include "mirrorcast/runtime/MirrorConfig.h"
#include "mirrorcast/telemetry/MetricsExporter.h"
#include "mirrorcast/timing/MasterClock.h"

namespace
{
  std::atomic<bool> g_shutdown{false};

  void HandleSignal(int)
  {
    g_shutdown.store(true);
  }

  void PrintUsage(const char *program)
  {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --control-port N           TCP control port (default 52345)\n"
              << "  --media-port N             UDP media port (default ephemeral)\n"
              << "  --mtu N                    Media datagram size (default 1200)\n"
              << "  --heartbeat-interval-ms N  Heartbeat interval (default 5000)\n"
              << "  --heartbeat-misses N       Missed heartbeats before teardown (default 3)\n"
              << "  --freshness-ms N           Media peer freshness window (default 6000)\n"
              << "  --auto-accept              Accept every valid handshake\n"
              << "  --admin-port N             PairingAdmin gRPC port, 0 disables (default 50061)\n"
              << "  --metrics-port N           Prometheus port, 0 disables (default 9308)\n"
              << "  --broadcast-file PATH      Shared broadcast flag file\n"
              << "  --broadcast-on             Start with broadcast on\n"
              << "  --test-stream              Feed the relay from a synthetic encoder\n"
              << "  --test-stream-fps N        Synthetic encoder rate (default 30)\n";
  }

  bool ParseArgs(int argc, char **argv, mirrorcast::runtime::MirrorConfig &config)
  {
    for (int i = 1; i < argc; ++i)
    {
      const std::string_view arg(argv[i]);
      if (arg == "--control-port" && i + 1 < argc)
      {
        config.control.port = static_cast<uint16_t>(std::stoi(argv[++i]));
      }
      else if (arg == "--media-port" && i + 1 < argc)
      {
        config.media.relay_port = static_cast<uint16_t>(std::stoi(argv[++i]));
      }
      else if (arg == "--mtu" && i + 1 < argc)
      {
        config.media.mtu = static_cast<std::size_t>(std::stoul(argv[++i]));
      }
      else if (arg == "--heartbeat-interval-ms" && i + 1 < argc)
      {
        config.control.heartbeat_interval_ms = std::stoll(argv[++i]);
      }
      else if (arg == "--heartbeat-misses" && i + 1 < argc)
      {
        config.control.heartbeat_misses = std::stoi(argv[++i]);
      }
      else if (arg == "--freshness-ms" && i + 1 < argc)
      {
        config.media.freshness_ms = std::stoll(argv[++i]);
      }
      else if (arg == "--auto-accept")
      {
        config.control.auto_accept = true;
      }
      else if (arg == "--admin-port" && i + 1 < argc)
      {
        config.admin_port = std::stoi(argv[++i]);
      }
      else if (arg == "--metrics-port" && i + 1 < argc)
      {
        config.metrics_port = std::stoi(argv[++i]);
      }
      else if (arg == "--broadcast-file" && i + 1 < argc)
      {
        config.broadcast_file = argv[++i];
      }
      else if (arg == "--broadcast-on")
      {
        config.broadcast_on = true;
      }
      else if (arg == "--test-stream")
      {
        config.test_stream = true;
      }
      else if (arg == "--test-stream-fps" && i + 1 < argc)
      {
        config.test_stream_fps = std::stoi(argv[++i]);
      }
      else
      {
        std::cerr << "Unknown or incomplete option: " << arg << std::endl;
        return false;
      }
    }
    return true;
  }

} // namespace

int main(int argc, char **argv)
{
  using namespace mirrorcast;

  runtime::MirrorConfig config;
  try
  {
    if (!ParseArgs(argc, argv, config))
    {
      PrintUsage(argv[0]);
      return EXIT_FAILURE;
    }
  }
  catch (const std::exception &e)
  {
    std::cerr << "Invalid option value: " << e.what() << std::endl;
    PrintUsage(argv[0]);
    return EXIT_FAILURE;
  }

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  auto clock = timing::MakeSystemMasterClock();

  std::shared_ptr<telemetry::MetricsExporter> metrics;
  if (config.metrics_port > 0)
  {
    metrics = std::make_shared<telemetry::MetricsExporter>(config.metrics_port);
    if (!metrics->Start())
    {
      std::cerr << "[mirrorcast_host] Metrics exporter failed to start" << std::endl;
      return EXIT_FAILURE;
    }
  }

  runtime::HostRuntime host(config, clock,
                            runtime::MakeBroadcastFlag(config.broadcast_file, config.broadcast_on),
                            metrics);
  if (!host.Start())
  {
    std::cerr << "[mirrorcast_host] Failed to start host runtime" << std::endl;
    return EXIT_FAILURE;
  }

  std::unique_ptr<admin::PairingAdminImpl> admin_service;
  std::unique_ptr<grpc::Server> admin_server;
  if (config.admin_port > 0)
  {
    const std::string address = "127.0.0.1:" + std::to_string(config.admin_port);
    admin_service = std::make_unique<admin::PairingAdminImpl>(&host, clock);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(admin_service.get());
    admin_server = builder.BuildAndStart();
    if (!admin_server)
    {
      std::cerr << "[mirrorcast_host] Failed to start PairingAdmin on " << address << std::endl;
      host.Stop();
      return EXIT_FAILURE;
    }
    std::cout << "[mirrorcast_host] PairingAdmin listening on " << address << std::endl;
  }

  std::cout << "[mirrorcast_host] Ready (auto_accept=" << std::boolalpha
            << config.control.auto_accept << ")" << std::endl;

  while (!g_shutdown.load())
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "[mirrorcast_host] Shutting down" << std::endl;
  if (admin_server)
  {
    admin_server->Shutdown();
  }
  host.Stop();
  if (metrics)
  {
    metrics->Stop();
  }
  return EXIT_SUCCESS;
}
