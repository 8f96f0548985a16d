// Repository: MirrorCast
// Component: PairingAdmin gRPC Service Implementation
// Purpose: Implements the PairingAdmin service for operator accept/decline and broadcast control.
// Copyright (c) 2025 MirrorCast

#include "admin_service.h"

#include <iostream>
#include <string>
#include <utility>

namespace mirrorcast
{
  namespace admin
  {

    namespace
    {
      constexpr char kApiVersion[] = "1.0.0";

      void FillSession(const control::Session &session, Session *out)
      {
        out->set_id(session.id);
        out->set_remote(session.remote_description);
        out->set_started_utc_us(session.started_utc_us);
      }
    } // namespace

    PairingAdminImpl::PairingAdminImpl(runtime::HostRuntime *host,
                                       std::shared_ptr<timing::MasterClock> master_clock)
        : host_(host),
          master_clock_(std::move(master_clock))
    {
      std::cout << "[PairingAdminImpl] Service initialized (API version: " << kApiVersion
                << ")" << std::endl;
    }

    PairingAdminImpl::~PairingAdminImpl()
    {
      std::cout << "[PairingAdminImpl] Service shutting down" << std::endl;
    }

    grpc::Status PairingAdminImpl::ListPendingPairs(grpc::ServerContext *context,
                                                    const ListPendingPairsRequest *request,
                                                    ListPendingPairsResponse *response)
    {
      for (const auto &pending : host_->control_server().registry().PendingPairs())
      {
        auto *out = response->add_pending();
        out->set_id(pending.id);
        out->set_code(pending.code);
        out->set_remote(pending.remote_description);
        out->set_requested_utc_us(pending.requested_utc_us);
      }
      return grpc::Status::OK;
    }

    grpc::Status PairingAdminImpl::AcceptPair(grpc::ServerContext *context,
                                              const AcceptPairRequest *request,
                                              AcceptPairResponse *response)
    {
      const std::string &pending_id = request->pending_id();
      std::cout << "[AcceptPair] Request received: pending_id=" << pending_id << std::endl;

      auto session =
          host_->control_server().registry().Accept(pending_id, master_clock_->now_utc_us());
      if (!session)
      {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "Pending pair not found");
      }

      FillSession(*session, response->mutable_session());
      std::cout << "[AcceptPair] Session " << session->id << " created" << std::endl;
      return grpc::Status::OK;
    }

    grpc::Status PairingAdminImpl::DeclinePair(grpc::ServerContext *context,
                                               const DeclinePairRequest *request,
                                               DeclinePairResponse *response)
    {
      const std::string &pending_id = request->pending_id();
      std::cout << "[DeclinePair] Request received: pending_id=" << pending_id << std::endl;

      if (!host_->control_server().registry().Decline(pending_id))
      {
        return grpc::Status(grpc::StatusCode::NOT_FOUND, "Pending pair not found");
      }
      return grpc::Status::OK;
    }

    grpc::Status PairingAdminImpl::ListSessions(grpc::ServerContext *context,
                                                const ListSessionsRequest *request,
                                                ListSessionsResponse *response)
    {
      for (const auto &session : host_->control_server().registry().Sessions())
      {
        FillSession(session, response->add_sessions());
      }
      return grpc::Status::OK;
    }

    grpc::Status PairingAdminImpl::SetAutoAccept(grpc::ServerContext *context,
                                                 const SetAutoAcceptRequest *request,
                                                 SetAutoAcceptResponse *response)
    {
      auto &registry = host_->control_server().registry();
      registry.SetAutoAccept(request->enabled());
      response->set_enabled(registry.auto_accept());
      std::cout << "[SetAutoAccept] auto_accept=" << std::boolalpha << response->enabled()
                << std::endl;
      return grpc::Status::OK;
    }

    grpc::Status PairingAdminImpl::SetBroadcast(grpc::ServerContext *context,
                                                const SetBroadcastRequest *request,
                                                SetBroadcastResponse *response)
    {
      host_->SetBroadcastOn(request->on());
      response->set_on(host_->broadcast_flag().IsBroadcastOn());
      std::cout << "[SetBroadcast] broadcast=" << (response->on() ? "on" : "off") << std::endl;
      return grpc::Status::OK;
    }

    grpc::Status PairingAdminImpl::GetMediaStatus(grpc::ServerContext *context,
                                                  const GetMediaStatusRequest *request,
                                                  MediaStatus *response)
    {
      auto &relay = host_->relay();
      const auto stats = relay.stats();
      const auto peer = relay.ActivePeer();

      response->set_media_port(relay.port());
      response->set_broadcast_on(host_->broadcast_flag().IsBroadcastOn());
      response->set_relay_armed(relay.armed());
      response->set_peer_tracked(peer.has_value());
      if (peer)
      {
        response->set_peer(peer->ToString());
      }
      response->set_frames_sent(stats.frames_sent);
      response->set_frames_unsent(stats.frames_unsent);
      response->set_datagrams_sent(stats.datagrams_sent);
      response->set_datagrams_forwarded(stats.datagrams_forwarded);
      response->set_next_seq(stats.next_seq);
      return grpc::Status::OK;
    }

    grpc::Status PairingAdminImpl::GetVersion(grpc::ServerContext *context,
                                              const ApiVersionRequest *request,
                                              ApiVersion *response)
    {
      response->set_version(kApiVersion);
      return grpc::Status::OK;
    }

  } // namespace admin
} // namespace mirrorcast
