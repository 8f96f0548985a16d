#include <sys/socket.h>
#include <netinet/in.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "fixtures/LinePeer.h"
#include "fixtures/Polling.h"
#include "fixtures/RecordingFrameSink.h"
#include "mirrorcast/control/ControlClient.h"
#include "mirrorcast/control/ControlMessages.h"
#include "mirrorcast/media/FrameFragmenter.h"
#include "mirrorcast/media/MediaReceiver.h"
#include "mirrorcast/media/MediaRelay.h"
#include "mirrorcast/media/TestPatternSource.h"
#include "mirrorcast/net/SocketUtil.h"
#include "mirrorcast/runtime/BroadcastFlag.h"
#include "mirrorcast/runtime/HostRuntime.h"
#include "mirrorcast/runtime/MirrorConfig.h"
#include "mirrorcast/runtime/ViewerSession.h"
#include "mirrorcast/timing/MasterClock.h"

namespace mirrorcast::tests::integration
{
namespace
{

using fixtures::LinePeer;
using fixtures::RecordingFrameSink;
using fixtures::WaitUntil;

runtime::MediaConfig LoopbackMediaConfig()
{
  runtime::MediaConfig config;
  config.bind_host = "127.0.0.1";
  config.relay_port = 0;
  config.mtu = 1200;
  config.freshness_ms = 2'000;
  config.keepalive_interval_ms = 50;
  config.sweep_interval_ms = 50;
  return config;
}

runtime::MirrorConfig LoopbackHostConfig()
{
  runtime::MirrorConfig config;
  config.control.bind_host = "127.0.0.1";
  config.control.port = 0;
  config.control.auto_accept = true;
  config.control.heartbeat_interval_ms = 200;
  config.control.heartbeat_misses = 5;
  config.control.broadcast_poll_ms = 20;
  config.media = LoopbackMediaConfig();
  config.admin_port = 0;
  config.metrics_port = 0;
  return config;
}

media::TestPatternSource SmallPattern()
{
  media::TestPatternConfig pattern;
  pattern.width = 320;
  pattern.height = 240;
  pattern.keyframe_interval = 10;
  pattern.keyframe_bytes = 4'000;
  pattern.delta_bytes = 700;
  return media::TestPatternSource(pattern);
}

}  // namespace

TEST(MediaPathIntegration, RelayDeliversFramesToTrackedReceiver)
{
  auto clock = timing::MakeSystemMasterClock();
  const auto config = LoopbackMediaConfig();

  media::MediaRelay relay(config, clock);
  ASSERT_TRUE(relay.Start());
  relay.Arm();

  RecordingFrameSink sink;
  media::MediaReceiver receiver(config, clock, &sink);
  ASSERT_TRUE(receiver.Start("127.0.0.1", relay.port()));
  ASSERT_TRUE(WaitUntil([&] { return relay.ActivePeer().has_value(); }));

  const auto source = SmallPattern();
  const auto key = source.MakeFrame(0);
  const auto delta = source.MakeFrame(1);
  EXPECT_TRUE(relay.SubmitFrame(key));
  ASSERT_TRUE(WaitUntil([&] { return sink.count() >= 1; }));
  EXPECT_TRUE(relay.SubmitFrame(delta));
  ASSERT_TRUE(WaitUntil([&] { return sink.count() >= 2; }));

  const auto frames = sink.frames();
  EXPECT_TRUE(frames[0].is_keyframe);
  EXPECT_EQ(frames[0].payload, key.payload);
  ASSERT_TRUE(frames[0].param_sets.has_value());
  EXPECT_EQ(*frames[0].param_sets, *key.param_sets);
  EXPECT_FALSE(frames[1].is_keyframe);
  EXPECT_EQ(frames[1].payload, delta.payload);

  const auto stats = relay.stats();
  EXPECT_EQ(stats.frames_sent, 2u);
  EXPECT_EQ(stats.next_seq, 2u);
  EXPECT_GE(stats.keepalives_received, 1u);
  EXPECT_EQ(receiver.stats().frames_completed, 2u);

  receiver.Stop();
  relay.Stop();
}

TEST(MediaPathIntegration, RelayForwardsLocalPrepacketizedDatagrams)
{
  auto clock = timing::MakeSystemMasterClock();
  const auto config = LoopbackMediaConfig();

  media::MediaRelay relay(config, clock);
  ASSERT_TRUE(relay.Start());
  relay.Arm();

  RecordingFrameSink sink;
  media::MediaReceiver receiver(config, clock, &sink);
  ASSERT_TRUE(receiver.Start("127.0.0.1", relay.port()));
  ASSERT_TRUE(WaitUntil([&] { return relay.ActivePeer().has_value(); }));

  // A separate encoder process on this machine.
  int encoder = net::OpenUdpSocket("127.0.0.1", 0, nullptr);
  ASSERT_NE(encoder, net::kInvalidSocket);
  sockaddr_in relay_addr{};
  ASSERT_TRUE(net::ResolveIPv4("127.0.0.1", relay.port(), &relay_addr));

  const auto frame = SmallPattern().MakeFrame(0);
  uint32_t seq = 700;
  const auto datagrams = media::FrameFragmenter(config.mtu).Fragment(frame, seq);
  ASSERT_GT(datagrams.size(), 1u);
  for (const auto& datagram : datagrams)
  {
    ASSERT_GT(sendto(encoder, datagram.data(), datagram.size(), 0,
                     reinterpret_cast<const sockaddr*>(&relay_addr), sizeof(relay_addr)),
              0);
  }

  ASSERT_TRUE(WaitUntil([&] { return sink.count() >= 1; }));
  EXPECT_EQ(sink.frames()[0].payload, frame.payload);
  EXPECT_EQ(receiver.stats().last_completed_seq, 700u);
  EXPECT_TRUE(WaitUntil([&] { return relay.stats().datagrams_forwarded == datagrams.size(); }));
  EXPECT_EQ(relay.stats().frames_sent, 0u);

  net::CloseSocket(encoder);
  receiver.Stop();
  relay.Stop();
}

TEST(MediaPathIntegration, DisarmedRelayTracksNobodyAndSendsNothing)
{
  auto clock = timing::MakeSystemMasterClock();
  const auto config = LoopbackMediaConfig();

  media::MediaRelay relay(config, clock);
  ASSERT_TRUE(relay.Start());
  EXPECT_FALSE(relay.armed());

  RecordingFrameSink sink;
  media::MediaReceiver receiver(config, clock, &sink);
  ASSERT_TRUE(receiver.Start("127.0.0.1", relay.port()));
  ASSERT_TRUE(WaitUntil([&] { return relay.stats().keepalives_received >= 2; }));
  EXPECT_FALSE(relay.ActivePeer().has_value());

  EXPECT_FALSE(relay.SubmitFrame(SmallPattern().MakeFrame(0)));
  EXPECT_EQ(relay.stats().frames_unsent, 1u);
  EXPECT_EQ(relay.stats().datagrams_sent, 0u);

  relay.Arm();
  ASSERT_TRUE(WaitUntil([&] { return relay.ActivePeer().has_value(); }));
  relay.Disarm();
  EXPECT_FALSE(relay.ActivePeer().has_value());

  receiver.Stop();
  relay.Stop();
}

TEST(MediaPathIntegration, ViewerMediaFollowsHostBroadcastFlag)
{
  auto clock = timing::MakeSystemMasterClock();
  const auto config = LoopbackHostConfig();

  runtime::HostRuntime host(config, clock, runtime::MakeBroadcastFlag("", false));
  ASSERT_TRUE(host.Start());
  EXPECT_FALSE(host.relay().armed());

  control::ControlClient client(config.control, clock);
  RecordingFrameSink sink;
  media::MediaReceiver receiver(config.media, clock, &sink);
  runtime::ViewerSession session(&client, &receiver);
  session.Attach();

  ASSERT_TRUE(client.Connect("host", "127.0.0.1", host.control_server().port(), "2468"));
  ASSERT_TRUE(WaitUntil([&] { return client.broadcast_on().has_value(); }));
  EXPECT_EQ(client.phase(), control::PairingPhase::kPaired);
  EXPECT_EQ(client.media_port().value_or(0), host.relay().port());
  EXPECT_FALSE(session.media_active()) << "Pairing alone must not start media";

  host.SetBroadcastOn(true);
  EXPECT_TRUE(host.relay().armed());
  ASSERT_TRUE(WaitUntil([&] { return session.media_active(); }));
  ASSERT_TRUE(WaitUntil([&] { return host.relay().ActivePeer().has_value(); }));

  const auto frame = SmallPattern().MakeFrame(0);
  EXPECT_TRUE(host.relay().SubmitFrame(frame));
  ASSERT_TRUE(WaitUntil([&] { return sink.count() >= 1; }));
  EXPECT_EQ(sink.frames()[0].payload, frame.payload);

  const auto metrics = host.CollectMetrics();
  EXPECT_EQ(metrics.sessions, 1u);
  EXPECT_TRUE(metrics.broadcast_on);
  EXPECT_TRUE(metrics.relay_armed);
  EXPECT_TRUE(metrics.peer_tracked);
  EXPECT_EQ(metrics.frames_sent, 1u);

  host.SetBroadcastOn(false);
  EXPECT_FALSE(host.relay().armed());
  ASSERT_TRUE(WaitUntil([&] { return !session.media_active(); }));
  EXPECT_FALSE(host.relay().SubmitFrame(frame));
  EXPECT_EQ(session.media_starts(), 1u);
  EXPECT_EQ(client.phase(), control::PairingPhase::kPaired);

  session.Detach();
  client.Disconnect();
  host.Stop();
}

TEST(MediaPathIntegration, MediaStaysStoppedWhenClientFailsAsBroadcastTurnsOn)
{
  auto clock = timing::MakeSystemMasterClock();
  const auto media_config = LoopbackMediaConfig();
  runtime::ControlConfig control_config;
  control_config.heartbeat_interval_ms = 30;
  control_config.heartbeat_misses = 1;
  control_config.handshake_timeout_ms = 3'000;
  control_config.connect_timeout_ms = 1'000;

  uint16_t media_port = 0;
  int media_socket = net::OpenUdpSocket("127.0.0.1", 0, &media_port);
  ASSERT_NE(media_socket, net::kInvalidSocket);

  // The broadcast push lands at varying offsets around the host-silence
  // timeout, so the client's reader and timer threads reconcile concurrently.
  for (int attempt = 0; attempt < 20; ++attempt)
  {
    LinePeer host;
    ASSERT_TRUE(host.Listen());

    control::ControlClient client(control_config, clock);
    media::MediaReceiver receiver(media_config, clock, nullptr);
    runtime::ViewerSession session(&client, &receiver);
    session.Attach();

    ASSERT_TRUE(client.Connect("host", "127.0.0.1", host.port(), "1234"));
    ASSERT_TRUE(host.AcceptOne(1'000));
    ASSERT_TRUE(host.ReadMessage(1'000).has_value());

    control::HandshakeResponse accepted;
    accepted.ok = true;
    accepted.session_id = "session-" + std::to_string(attempt);
    accepted.udp_port = media_port;
    ASSERT_TRUE(host.Send(accepted));

    std::this_thread::sleep_for(std::chrono::milliseconds(20 + attempt));
    control::BroadcastStatus on;
    on.on = true;
    // The client may already have given up and closed the connection.
    static_cast<void>(host.Send(on));

    ASSERT_TRUE(WaitUntil([&] { return client.phase() == control::PairingPhase::kFailed; }))
        << "attempt " << attempt;
    EXPECT_TRUE(WaitUntil([&] { return !session.media_active(); })) << "attempt " << attempt;

    session.Detach();
    client.Disconnect();
  }

  net::CloseSocket(media_socket);
}

}  // namespace mirrorcast::tests::integration
