#include <chrono>
#include <memory>
#include <string>
#include <variant>

#include <gtest/gtest.h>

#include "fixtures/LinePeer.h"
#include "fixtures/Polling.h"
#include "mirrorcast/control/ControlClient.h"
#include "mirrorcast/control/ControlMessages.h"
#include "mirrorcast/control/ControlServer.h"
#include "mirrorcast/runtime/BroadcastFlag.h"
#include "mirrorcast/runtime/MirrorConfig.h"
#include "mirrorcast/timing/MasterClock.h"

namespace mirrorcast::tests::integration
{
namespace
{

using fixtures::LinePeer;
using fixtures::WaitUntil;

runtime::ControlConfig LoopbackControlConfig()
{
  runtime::ControlConfig config;
  config.bind_host = "127.0.0.1";
  config.port = 0;
  config.heartbeat_interval_ms = 200;
  config.heartbeat_misses = 5;
  config.handshake_timeout_ms = 3'000;
  config.connect_timeout_ms = 1'000;
  config.broadcast_poll_ms = 20;
  return config;
}

std::string FailureReason(const control::ControlClient& client)
{
  const auto status = client.status();
  if (const auto* failed = std::get_if<control::Failed>(&status))
  {
    return failed->reason;
  }
  return "";
}

control::HandshakeRequest ViewerHandshake(const std::string& code)
{
  control::HandshakeRequest request;
  request.code = code;
  return request;
}

class PairingIntegrationTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    clock_ = timing::MakeSystemMasterClock();
    config_ = LoopbackControlConfig();
  }

  std::unique_ptr<control::ControlServer> StartServer()
  {
    auto server = std::make_unique<control::ControlServer>(config_, clock_, &flag_);
    if (!server->Start())
    {
      return nullptr;
    }
    return server;
  }

  std::shared_ptr<timing::MasterClock> clock_;
  runtime::ControlConfig config_;
  runtime::InMemoryBroadcastFlag flag_;
};

}  // namespace

TEST_F(PairingIntegrationTest, AutoAcceptPairsAndDeliversMediaParams)
{
  config_.auto_accept = true;
  auto server = StartServer();
  ASSERT_NE(server, nullptr);
  server->SetMediaPort(50123);

  control::ControlClient client(config_, clock_);
  ASSERT_TRUE(client.Connect("living-room", "127.0.0.1", server->port(), "1234"));
  ASSERT_TRUE(WaitUntil([&] { return client.phase() == control::PairingPhase::kPaired; }));

  const auto sessions = server->registry().Sessions();
  ASSERT_EQ(sessions.size(), 1u);
  const auto status = client.status();
  ASSERT_TRUE(std::holds_alternative<control::Paired>(status));
  EXPECT_EQ(std::get<control::Paired>(status).session_id, sessions[0].id);
  EXPECT_EQ(client.media_port().value_or(0), 50123);

  ASSERT_TRUE(WaitUntil([&] { return client.broadcast_on().has_value(); }));
  EXPECT_FALSE(*client.broadcast_on());
  EXPECT_TRUE(server->registry().PendingPairs().empty());

  client.Disconnect();
  EXPECT_EQ(client.phase(), control::PairingPhase::kIdle);
  EXPECT_TRUE(WaitUntil([&] { return server->registry().Sessions().empty(); }));
}

TEST_F(PairingIntegrationTest, OperatorAcceptCompletesPendingPair)
{
  auto server = StartServer();
  ASSERT_NE(server, nullptr);

  control::ControlClient client(config_, clock_);
  ASSERT_TRUE(client.Connect("den", "127.0.0.1", server->port(), "4321"));
  ASSERT_TRUE(WaitUntil([&] { return server->registry().PendingPairs().size() == 1; }));
  EXPECT_EQ(client.phase(), control::PairingPhase::kWaitingAcceptance);

  const auto pending = server->registry().PendingPairs();
  EXPECT_EQ(pending[0].code, "4321");
  EXPECT_TRUE(server->registry().Sessions().empty());

  const auto session = server->registry().Accept(pending[0].id, clock_->now_utc_us());
  ASSERT_TRUE(session.has_value());
  ASSERT_TRUE(WaitUntil([&] { return client.phase() == control::PairingPhase::kPaired; }));
  EXPECT_EQ(std::get<control::Paired>(client.status()).session_id, session->id);
  EXPECT_FALSE(client.media_port().has_value());
  EXPECT_TRUE(server->registry().PendingPairs().empty());

  // Pushed once the port becomes known.
  server->SetMediaPort(40001);
  EXPECT_TRUE(WaitUntil([&] { return client.media_port().value_or(0) == 40001; }));
}

TEST_F(PairingIntegrationTest, OperatorDeclineFailsViewerAndClosesConnection)
{
  auto server = StartServer();
  ASSERT_NE(server, nullptr);

  control::ControlClient client(config_, clock_);
  ASSERT_TRUE(client.Connect("den", "127.0.0.1", server->port(), "9876"));
  ASSERT_TRUE(WaitUntil([&] { return server->registry().PendingPairs().size() == 1; }));

  EXPECT_TRUE(server->registry().Decline(server->registry().PendingPairs()[0].id));
  ASSERT_TRUE(WaitUntil([&] { return client.phase() == control::PairingPhase::kFailed; }));
  EXPECT_EQ(FailureReason(client), "Declined");
  EXPECT_TRUE(server->registry().Sessions().empty());
  EXPECT_TRUE(WaitUntil([&] { return server->connection_count() == 0; }));
}

TEST_F(PairingIntegrationTest, InvalidHandshakeIsRejectedWithMessage)
{
  auto server = StartServer();
  ASSERT_NE(server, nullptr);

  LinePeer bad_code;
  ASSERT_TRUE(bad_code.Connect(server->port()));
  ASSERT_TRUE(bad_code.Send(ViewerHandshake("12")));
  auto reply = bad_code.ReadMessage(2'000);
  ASSERT_TRUE(reply.has_value());
  ASSERT_TRUE(std::holds_alternative<control::HandshakeResponse>(*reply));
  const auto& response = std::get<control::HandshakeResponse>(*reply);
  EXPECT_FALSE(response.ok);
  EXPECT_EQ(response.message.value_or(""), "Invalid code");
  EXPECT_TRUE(bad_code.WaitForClose(2'000));

  LinePeer bad_version;
  ASSERT_TRUE(bad_version.Connect(server->port()));
  ASSERT_TRUE(bad_version.SendRaw(
      "{\"app\":\"mirrorcast\",\"code\":\"1234\",\"role\":\"viewer\",\"ver\":2}\n"));
  reply = bad_version.ReadMessage(2'000);
  ASSERT_TRUE(reply.has_value());
  EXPECT_EQ(std::get<control::HandshakeResponse>(*reply).message.value_or(""),
            "Unsupported protocol version");
  EXPECT_TRUE(bad_version.WaitForClose(2'000));

  // 2^32 + 1 must not pass for version 1.
  LinePeer wide_version;
  ASSERT_TRUE(wide_version.Connect(server->port()));
  ASSERT_TRUE(wide_version.SendRaw(
      "{\"app\":\"mirrorcast\",\"code\":\"1234\",\"role\":\"viewer\",\"ver\":4294967297}\n"));
  reply = wide_version.ReadMessage(2'000);
  ASSERT_TRUE(reply.has_value());
  EXPECT_EQ(std::get<control::HandshakeResponse>(*reply).message.value_or(""),
            "Unsupported protocol version");
  EXPECT_TRUE(wide_version.WaitForClose(2'000));

  EXPECT_EQ(server->stats().handshake_rejections, 3u);
  EXPECT_TRUE(server->registry().PendingPairs().empty());
}

TEST_F(PairingIntegrationTest, ProtocolErrorClosesOnlyThatConnection)
{
  config_.auto_accept = true;
  config_.heartbeat_interval_ms = 1'000;
  auto server = StartServer();
  ASSERT_NE(server, nullptr);

  LinePeer good;
  ASSERT_TRUE(good.Connect(server->port()));
  ASSERT_TRUE(good.Send(ViewerHandshake("1111")));
  ASSERT_TRUE(good.ReadMessage(2'000).has_value());
  ASSERT_TRUE(WaitUntil([&] { return server->registry().Sessions().size() == 1; }));

  LinePeer garbage;
  ASSERT_TRUE(garbage.Connect(server->port()));
  ASSERT_TRUE(garbage.SendRaw("this is not json\n"));
  EXPECT_TRUE(garbage.WaitForClose(2'000));

  LinePeer wrong_direction;
  ASSERT_TRUE(wrong_direction.Connect(server->port()));
  ASSERT_TRUE(wrong_direction.Send(control::BroadcastStatus{true}));
  EXPECT_TRUE(wrong_direction.WaitForClose(2'000));

  EXPECT_TRUE(WaitUntil([&] { return server->stats().protocol_errors == 2; }));
  EXPECT_EQ(server->registry().Sessions().size(), 1u);

  ASSERT_TRUE(good.Send(control::Heartbeat{}));
  EXPECT_FALSE(good.WaitForClose(100));
}

TEST_F(PairingIntegrationTest, HostClosesSilentViewerAfterMissedHeartbeats)
{
  config_.auto_accept = true;
  config_.heartbeat_interval_ms = 50;
  config_.heartbeat_misses = 2;
  auto server = StartServer();
  ASSERT_NE(server, nullptr);

  LinePeer silent;
  ASSERT_TRUE(silent.Connect(server->port()));
  ASSERT_TRUE(silent.Send(ViewerHandshake("2222")));
  ASSERT_TRUE(silent.ReadMessage(2'000).has_value());

  EXPECT_TRUE(silent.WaitForClose(3'000));
  EXPECT_TRUE(WaitUntil([&] { return server->stats().heartbeat_timeouts >= 1; }));
  EXPECT_TRUE(server->registry().Sessions().empty());
}

TEST_F(PairingIntegrationTest, ViewerFailsWhenHostGoesSilent)
{
  config_.heartbeat_interval_ms = 100;
  config_.heartbeat_misses = 3;

  LinePeer fake_host;
  ASSERT_TRUE(fake_host.Listen());

  control::ControlClient client(config_, clock_);
  ASSERT_TRUE(client.Connect("host", "127.0.0.1", fake_host.port(), "3333"));
  ASSERT_TRUE(fake_host.AcceptOne(2'000));

  auto request = fake_host.ReadMessage(2'000);
  ASSERT_TRUE(request.has_value());
  ASSERT_TRUE(std::holds_alternative<control::HandshakeRequest>(*request));
  EXPECT_EQ(std::get<control::HandshakeRequest>(*request).code, "3333");

  control::HandshakeResponse accept;
  accept.ok = true;
  accept.session_id = "session-1";
  ASSERT_TRUE(fake_host.Send(accept));

  ASSERT_TRUE(WaitUntil([&] { return client.phase() == control::PairingPhase::kFailed; }));
  EXPECT_EQ(FailureReason(client), "heartbeat timeout");

  const auto snapshot = client.state_machine().Snapshot();
  const auto paired_to_failed = snapshot.transitions.find(
      {control::PairingPhase::kPaired, control::PairingPhase::kFailed});
  ASSERT_NE(paired_to_failed, snapshot.transitions.end());
  EXPECT_EQ(paired_to_failed->second, 1u);
}

TEST_F(PairingIntegrationTest, ViewerGivesUpWhenHandshakeIsNeverAnswered)
{
  config_.heartbeat_interval_ms = 5'000;
  config_.handshake_timeout_ms = 150;

  LinePeer fake_host;
  ASSERT_TRUE(fake_host.Listen());

  control::ControlClient client(config_, clock_);
  ASSERT_TRUE(client.Connect("host", "127.0.0.1", fake_host.port(), "5555"));
  ASSERT_TRUE(fake_host.AcceptOne(2'000));
  ASSERT_TRUE(fake_host.ReadMessage(2'000).has_value());

  ASSERT_TRUE(WaitUntil([&] { return client.phase() == control::PairingPhase::kFailed; }));
  EXPECT_EQ(FailureReason(client), "handshake timeout");
  EXPECT_TRUE(fake_host.WaitForClose(2'000));
}

TEST_F(PairingIntegrationTest, ConnectFailureCanBeRetried)
{
  config_.auto_accept = true;
  uint16_t dead_port = 0;
  {
    auto gone = StartServer();
    ASSERT_NE(gone, nullptr);
    dead_port = gone->port();
    gone->Stop();
  }

  control::ControlClient client(config_, clock_);
  EXPECT_FALSE(client.Connect("host", "127.0.0.1", dead_port, "7777"));
  EXPECT_EQ(client.phase(), control::PairingPhase::kFailed);
  EXPECT_EQ(FailureReason(client).rfind("connect failed", 0), 0u);

  auto server = StartServer();
  ASSERT_NE(server, nullptr);
  ASSERT_TRUE(client.Connect("host", "127.0.0.1", server->port(), "7777"));
  EXPECT_TRUE(WaitUntil([&] { return client.phase() == control::PairingPhase::kPaired; }));
}

TEST_F(PairingIntegrationTest, BroadcastChangesArePushedToPairedViewers)
{
  config_.auto_accept = true;
  auto server = StartServer();
  ASSERT_NE(server, nullptr);

  control::ControlClient client(config_, clock_);
  ASSERT_TRUE(client.Connect("host", "127.0.0.1", server->port(), "8080"));
  ASSERT_TRUE(WaitUntil([&] { return client.broadcast_on().has_value(); }));
  EXPECT_FALSE(*client.broadcast_on());

  flag_.SetBroadcastOn(true);
  EXPECT_TRUE(WaitUntil([&] { return client.broadcast_on() == std::optional<bool>(true); }));

  flag_.SetBroadcastOn(false);
  EXPECT_TRUE(WaitUntil([&] { return client.broadcast_on() == std::optional<bool>(false); }));
  EXPECT_GE(server->stats().broadcast_pushes, 2u);
  EXPECT_EQ(client.phase(), control::PairingPhase::kPaired);
}

}  // namespace mirrorcast::tests::integration
