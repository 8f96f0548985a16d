#include <memory>
#include <string>
#include <variant>

#include <grpcpp/grpcpp.h>
#include <gtest/gtest.h>

#include "admin_service.h"
#include "fixtures/LinePeer.h"
#include "fixtures/Polling.h"
#include "mirrorcast/control/ControlMessages.h"
#include "mirrorcast/runtime/BroadcastFlag.h"
#include "mirrorcast/runtime/HostRuntime.h"
#include "mirrorcast/timing/MasterClock.h"

namespace mirrorcast::tests::integration
{
namespace
{

using fixtures::LinePeer;
using fixtures::WaitUntil;

runtime::MirrorConfig AdminHostConfig()
{
  runtime::MirrorConfig config;
  config.control.bind_host = "127.0.0.1";
  config.control.port = 0;
  config.control.heartbeat_interval_ms = 1'000;
  config.control.broadcast_poll_ms = 20;
  config.media.bind_host = "127.0.0.1";
  config.media.relay_port = 0;
  return config;
}

control::HandshakeRequest ViewerHandshake(const std::string& code)
{
  control::HandshakeRequest request;
  request.code = code;
  return request;
}

class AdminServiceIntegrationTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    clock_ = timing::MakeSystemMasterClock();
    host_ = std::make_unique<runtime::HostRuntime>(AdminHostConfig(), clock_,
                                                   runtime::MakeBroadcastFlag("", false));
    ASSERT_TRUE(host_->Start());
    service_ = std::make_unique<admin::PairingAdminImpl>(host_.get(), clock_);
  }

  void TearDown() override
  {
    service_.reset();
    host_->Stop();
  }

  std::shared_ptr<timing::MasterClock> clock_;
  std::unique_ptr<runtime::HostRuntime> host_;
  std::unique_ptr<admin::PairingAdminImpl> service_;
};

}  // namespace

TEST_F(AdminServiceIntegrationTest, ReportsApiVersion)
{
  grpc::ServerContext context;
  admin::ApiVersionRequest request;
  admin::ApiVersion response;
  ASSERT_TRUE(service_->GetVersion(&context, &request, &response).ok());
  EXPECT_EQ(response.version(), "1.0.0");
}

TEST_F(AdminServiceIntegrationTest, AcceptsAndDeclinesPendingViewers)
{
  LinePeer first;
  ASSERT_TRUE(first.Connect(host_->control_server().port()));
  ASSERT_TRUE(first.Send(ViewerHandshake("1357")));
  LinePeer second;
  ASSERT_TRUE(second.Connect(host_->control_server().port()));
  ASSERT_TRUE(second.Send(ViewerHandshake("2468")));
  ASSERT_TRUE(WaitUntil(
      [&] { return host_->control_server().registry().PendingPairs().size() == 2; }));

  grpc::ServerContext list_context;
  admin::ListPendingPairsRequest list_request;
  admin::ListPendingPairsResponse pending;
  ASSERT_TRUE(service_->ListPendingPairs(&list_context, &list_request, &pending).ok());
  ASSERT_EQ(pending.pending_size(), 2);

  std::string first_id;
  std::string second_id;
  for (const auto& pair : pending.pending())
  {
    EXPECT_FALSE(pair.remote().empty());
    EXPECT_GT(pair.requested_utc_us(), 0);
    if (pair.code() == "1357")
    {
      first_id = pair.id();
    }
    else if (pair.code() == "2468")
    {
      second_id = pair.id();
    }
  }
  ASSERT_FALSE(first_id.empty());
  ASSERT_FALSE(second_id.empty());

  grpc::ServerContext accept_context;
  admin::AcceptPairRequest accept_request;
  accept_request.set_pending_id(first_id);
  admin::AcceptPairResponse accepted;
  ASSERT_TRUE(service_->AcceptPair(&accept_context, &accept_request, &accepted).ok());
  EXPECT_FALSE(accepted.session().id().empty());

  auto reply = first.ReadMessage(2'000);
  ASSERT_TRUE(reply.has_value());
  ASSERT_TRUE(std::holds_alternative<control::HandshakeResponse>(*reply));
  const auto& response = std::get<control::HandshakeResponse>(*reply);
  EXPECT_TRUE(response.ok);
  EXPECT_EQ(response.session_id.value_or(""), accepted.session().id());
  EXPECT_EQ(response.udp_port.value_or(0), host_->relay().port());

  grpc::ServerContext decline_context;
  admin::DeclinePairRequest decline_request;
  decline_request.set_pending_id(second_id);
  admin::DeclinePairResponse declined;
  ASSERT_TRUE(service_->DeclinePair(&decline_context, &decline_request, &declined).ok());
  reply = second.ReadMessage(2'000);
  ASSERT_TRUE(reply.has_value());
  EXPECT_FALSE(std::get<control::HandshakeResponse>(*reply).ok);
  EXPECT_TRUE(second.WaitForClose(2'000));

  grpc::ServerContext sessions_context;
  admin::ListSessionsRequest sessions_request;
  admin::ListSessionsResponse sessions;
  ASSERT_TRUE(service_->ListSessions(&sessions_context, &sessions_request, &sessions).ok());
  ASSERT_EQ(sessions.sessions_size(), 1);
  EXPECT_EQ(sessions.sessions(0).id(), accepted.session().id());
}

TEST_F(AdminServiceIntegrationTest, UnknownPendingIdIsNotFound)
{
  grpc::ServerContext accept_context;
  admin::AcceptPairRequest accept_request;
  accept_request.set_pending_id("no-such-pair");
  admin::AcceptPairResponse accepted;
  const auto accept_status = service_->AcceptPair(&accept_context, &accept_request, &accepted);
  EXPECT_EQ(accept_status.error_code(), grpc::StatusCode::NOT_FOUND);

  grpc::ServerContext decline_context;
  admin::DeclinePairRequest decline_request;
  decline_request.set_pending_id("no-such-pair");
  admin::DeclinePairResponse declined;
  const auto decline_status =
      service_->DeclinePair(&decline_context, &decline_request, &declined);
  EXPECT_EQ(decline_status.error_code(), grpc::StatusCode::NOT_FOUND);
}

TEST_F(AdminServiceIntegrationTest, AutoAcceptAndBroadcastSwitches)
{
  grpc::ServerContext auto_context;
  admin::SetAutoAcceptRequest auto_request;
  auto_request.set_enabled(true);
  admin::SetAutoAcceptResponse auto_response;
  ASSERT_TRUE(service_->SetAutoAccept(&auto_context, &auto_request, &auto_response).ok());
  EXPECT_TRUE(auto_response.enabled());
  EXPECT_TRUE(host_->control_server().registry().auto_accept());

  LinePeer viewer;
  ASSERT_TRUE(viewer.Connect(host_->control_server().port()));
  ASSERT_TRUE(viewer.Send(ViewerHandshake("4444")));
  auto reply = viewer.ReadMessage(2'000);
  ASSERT_TRUE(reply.has_value());
  EXPECT_TRUE(std::get<control::HandshakeResponse>(*reply).ok);

  grpc::ServerContext broadcast_context;
  admin::SetBroadcastRequest broadcast_request;
  broadcast_request.set_on(true);
  admin::SetBroadcastResponse broadcast_response;
  ASSERT_TRUE(
      service_->SetBroadcast(&broadcast_context, &broadcast_request, &broadcast_response).ok());
  EXPECT_TRUE(broadcast_response.on());

  grpc::ServerContext status_context;
  admin::GetMediaStatusRequest status_request;
  admin::MediaStatus status;
  ASSERT_TRUE(service_->GetMediaStatus(&status_context, &status_request, &status).ok());
  EXPECT_EQ(status.media_port(), host_->relay().port());
  EXPECT_TRUE(status.broadcast_on());
  EXPECT_TRUE(status.relay_armed());
  EXPECT_FALSE(status.peer_tracked());
  EXPECT_EQ(status.frames_sent(), 0u);

  // The paired viewer hears about the change on the control channel.
  bool saw_on = false;
  while (!saw_on)
  {
    auto message = viewer.ReadMessage(2'000);
    ASSERT_TRUE(message.has_value());
    if (const auto* broadcast = std::get_if<control::BroadcastStatus>(&*message))
    {
      saw_on = broadcast->on;
    }
  }
  EXPECT_TRUE(saw_on);
}

}  // namespace mirrorcast::tests::integration
