// Repository: MirrorCast
// Component: PairingAdmin gRPC Service Implementation
// Purpose: Implements the PairingAdmin service for operator accept/decline and broadcast control.
// Copyright (c) 2025 MirrorCast

#ifndef MIRRORCAST_ADMIN_SERVICE_H_
#define MIRRORCAST_ADMIN_SERVICE_H_

#include <memory>

#include <grpcpp/grpcpp.h>

#include "mirrorcast/admin.grpc.pb.h"
#include "mirrorcast/runtime/HostRuntime.h"
#include "mirrorcast/timing/MasterClock.h"

namespace mirrorcast {
namespace admin {

// PairingAdminImpl implements the gRPC service defined in admin.proto.
// All state lives in the HostRuntime; the service only translates.
class PairingAdminImpl final : public PairingAdmin::Service {
 public:
  PairingAdminImpl(runtime::HostRuntime* host,
                   std::shared_ptr<timing::MasterClock> master_clock);
  ~PairingAdminImpl() override;

  // Disable copy and move
  PairingAdminImpl(const PairingAdminImpl&) = delete;
  PairingAdminImpl& operator=(const PairingAdminImpl&) = delete;

  // RPC implementations
  grpc::Status ListPendingPairs(grpc::ServerContext* context,
                                const ListPendingPairsRequest* request,
                                ListPendingPairsResponse* response) override;

  grpc::Status AcceptPair(grpc::ServerContext* context,
                          const AcceptPairRequest* request,
                          AcceptPairResponse* response) override;

  grpc::Status DeclinePair(grpc::ServerContext* context,
                           const DeclinePairRequest* request,
                           DeclinePairResponse* response) override;

  grpc::Status ListSessions(grpc::ServerContext* context,
                            const ListSessionsRequest* request,
                            ListSessionsResponse* response) override;

  grpc::Status SetAutoAccept(grpc::ServerContext* context,
                             const SetAutoAcceptRequest* request,
                             SetAutoAcceptResponse* response) override;

  grpc::Status SetBroadcast(grpc::ServerContext* context,
                            const SetBroadcastRequest* request,
                            SetBroadcastResponse* response) override;

  grpc::Status GetMediaStatus(grpc::ServerContext* context,
                              const GetMediaStatusRequest* request,
                              MediaStatus* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const ApiVersionRequest* request,
                          ApiVersion* response) override;

 private:
  runtime::HostRuntime* host_;
  std::shared_ptr<timing::MasterClock> master_clock_;
};

}  // namespace admin
}  // namespace mirrorcast

#endif  // MIRRORCAST_ADMIN_SERVICE_H_
