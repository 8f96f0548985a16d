// Repository: MirrorCast
// Component: Viewer Executable
// Purpose: Connecting device: pairs with a host and decodes its media stream.
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

#include "mirrorcast/common/Identifiers.h"
#include "mirrorcast/control/ControlClient.h"
#include "mirrorcast/decode/H264Decoder.h"
#include "mirrorcast/media/MediaReceiver.h"
#include "mirrorcast/runtime/MirrorConfig.h"
#include "mirrorcast/runtime/PeerDiscovery.h"
#include "mirrorcast/runtime/ViewerSession.h"
#include "mirrorcast/telemetry/MetricsExporter.h"
#include "mirrorcast/timing/MasterClock.h"

namespace
{
  constexpr auto kStatusInterval = std::chrono::seconds(5);

  std::atomic<bool> g_shutdown{false};

  void HandleSignal(int)
  {
    g_shutdown.store(true);
  }

  struct ParsedArgs
  {
    mirrorcast::runtime::MirrorConfig config;
    std::string peer;           // name=host:port, overrides --host/--control-port
    int64_t retry_ms = 3'000;   // 0 disables reconnect after a failure
  };

  void PrintUsage(const char *program)
  {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --host HOST                Host address (default 127.0.0.1)\n"
              << "  --control-port N           Host control port (default 52345)\n"
              << "  --peer NAME=HOST:PORT      Named peer, overrides --host/--control-port\n"
              << "  --code NNNN                Pairing code (default random)\n"
              << "  --heartbeat-interval-ms N  Heartbeat interval (default 5000)\n"
              << "  --heartbeat-misses N       Missed heartbeats before failure (default 3)\n"
              << "  --metrics-port N           Prometheus port, 0 disables (default 9308)\n"
              << "  --retry-ms N               Reconnect delay after failure, 0 disables\n";
  }

  bool ParseArgs(int argc, char **argv, ParsedArgs &args)
  {
    auto &config = args.config;
    config.metrics_port = 0;
    for (int i = 1; i < argc; ++i)
    {
      const std::string_view arg(argv[i]);
      if (arg == "--host" && i + 1 < argc)
      {
        config.host = argv[++i];
      }
      else if (arg == "--control-port" && i + 1 < argc)
      {
        config.control.port = static_cast<uint16_t>(std::stoi(argv[++i]));
      }
      else if (arg == "--peer" && i + 1 < argc)
      {
        args.peer = argv[++i];
      }
      else if (arg == "--code" && i + 1 < argc)
      {
        config.code = argv[++i];
      }
      else if (arg == "--heartbeat-interval-ms" && i + 1 < argc)
      {
        config.control.heartbeat_interval_ms = std::stoll(argv[++i]);
      }
      else if (arg == "--heartbeat-misses" && i + 1 < argc)
      {
        config.control.heartbeat_misses = std::stoi(argv[++i]);
      }
      else if (arg == "--metrics-port" && i + 1 < argc)
      {
        config.metrics_port = std::stoi(argv[++i]);
      }
      else if (arg == "--retry-ms" && i + 1 < argc)
      {
        args.retry_ms = std::stoll(argv[++i]);
      }
      else
      {
        std::cerr << "Unknown or incomplete option: " << arg << std::endl;
        return false;
      }
    }
    return true;
  }

  mirrorcast::telemetry::ViewerMetrics CollectMetrics(
      const mirrorcast::control::ControlClient &client,
      const mirrorcast::media::MediaReceiver &receiver,
      const mirrorcast::decode::H264Decoder &decoder)
  {
    mirrorcast::telemetry::ViewerMetrics metrics;
    metrics.pairing_phase = client.phase();
    const auto media = receiver.stats();
    metrics.frames_completed = media.frames_completed;
    metrics.frames_dropped = media.frames_dropped;
    metrics.malformed_datagrams = media.malformed_datagrams;
    metrics.fps = media.fps;
    metrics.kbps = media.kbps;
    const auto decoded = decoder.stats();
    metrics.frames_decoded = decoded.frames_decoded;
    metrics.decode_errors = decoded.decode_errors;
    return metrics;
  }

} // namespace

int main(int argc, char **argv)
{
  using namespace mirrorcast;

  ParsedArgs args;
  try
  {
    if (!ParseArgs(argc, argv, args))
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
  auto &config = args.config;

  runtime::StaticPeerDiscovery discovery;
  if (!args.peer.empty())
  {
    const auto parsed = runtime::ParseCandidatePeer(args.peer);
    if (!parsed)
    {
      std::cerr << "Invalid --peer value: " << args.peer << std::endl;
      return EXIT_FAILURE;
    }
    discovery.Upsert(*parsed);
  }
  else
  {
    discovery.Upsert(runtime::CandidatePeer{config.peer_name, config.host, config.control.port});
  }
  const runtime::CandidatePeer peer = discovery.ListCandidatePeers().front();

  if (config.code.empty())
  {
    config.code = GeneratePairingCode(config.control.code_length);
  }
  if (!IsValidPairingCode(config.code, config.control.code_length))
  {
    std::cerr << "Pairing code must be " << config.control.code_length << " digits" << std::endl;
    return EXIT_FAILURE;
  }
  std::cout << "[mirrorcast_viewer] Pairing code: " << config.code << std::endl;

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  auto clock = timing::MakeSystemMasterClock();

  std::shared_ptr<telemetry::MetricsExporter> metrics;
  if (config.metrics_port > 0)
  {
    metrics = std::make_shared<telemetry::MetricsExporter>(config.metrics_port);
    if (!metrics->Start())
    {
      std::cerr << "[mirrorcast_viewer] Metrics exporter failed to start" << std::endl;
      return EXIT_FAILURE;
    }
  }

  decode::H264Decoder decoder;
  media::MediaReceiver receiver(config.media, clock, &decoder);
  control::ControlClient client(config.control, clock);
  runtime::ViewerSession session(&client, &receiver);
  session.Attach();

  client.Connect(peer.name, peer.host, peer.port, config.code);

  auto last_status = std::chrono::steady_clock::now();
  auto failed_since = std::chrono::steady_clock::time_point{};
  while (!g_shutdown.load())
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    const auto now = std::chrono::steady_clock::now();

    if (client.phase() == control::PairingPhase::kFailed && args.retry_ms > 0)
    {
      if (failed_since == std::chrono::steady_clock::time_point{})
      {
        failed_since = now;
      }
      else if (now - failed_since >= std::chrono::milliseconds(args.retry_ms))
      {
        failed_since = {};
        client.Connect(peer.name, peer.host, peer.port, config.code);
      }
    }
    else
    {
      failed_since = {};
    }

    if (metrics)
    {
      metrics->SubmitViewerMetrics(CollectMetrics(client, receiver, decoder));
    }
    if (now - last_status >= kStatusInterval)
    {
      last_status = now;
      const auto media = receiver.stats();
      std::cout << "[mirrorcast_viewer] " << control::DescribeStatus(client.status())
                << " frames=" << media.frames_completed << " dropped=" << media.frames_dropped
                << " fps=" << media.fps << " kbps=" << media.kbps << std::endl;
    }
  }

  std::cout << "[mirrorcast_viewer] Shutting down" << std::endl;
  session.Detach();
  client.Disconnect();
  receiver.Stop();
  if (metrics)
  {
    metrics->Stop();
  }
  return EXIT_SUCCESS;
}
