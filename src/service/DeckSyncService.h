// Repository: DeckSync
// Component: DeckSync gRPC Service
// Purpose: Exposes the DeckAuthority over gRPC: commands, subscriptions and snapshots.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SERVICE_DECKSYNC_SERVICE_H_
#define DECKSYNC_SERVICE_DECKSYNC_SERVICE_H_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "decksync.grpc.pb.h"
#include "decksync.pb.h"
#include "decksync/runtime/DeckAuthority.h"

namespace decksync {
namespace service {

// DeckSyncServiceImpl is a thin adapter over DeckAuthority. Protocol
// failures are reported inside CommandAck with Status::OK; a non-OK status
// means the transport itself failed.
class DeckSyncServiceImpl final : public v1::DeckSync::Service {
 public:
  // A subscriber that falls this many messages behind is disconnected and
  // must resubscribe (which re-sends a full resync).
  static constexpr std::size_t kMaxSubscriberBacklog = 4096;

  explicit DeckSyncServiceImpl(std::shared_ptr<runtime::DeckAuthority> authority);
  ~DeckSyncServiceImpl() override;

  DeckSyncServiceImpl(const DeckSyncServiceImpl&) = delete;
  DeckSyncServiceImpl& operator=(const DeckSyncServiceImpl&) = delete;

  grpc::Status SendCommand(grpc::ServerContext* context,
                           const v1::DeckCommand* request,
                           v1::CommandAck* response) override;

  grpc::Status Subscribe(grpc::ServerContext* context,
                         const v1::SubscribeRequest* request,
                         grpc::ServerWriter<v1::ServerMessage>* writer) override;

  grpc::Status GetState(grpc::ServerContext* context,
                        const v1::GetStateRequest* request,
                        v1::FullStateResync* response) override;

  // Ends every open Subscribe stream. Call before Server::Shutdown().
  void Shutdown();

  [[nodiscard]] std::size_t SubscriberCount() const;

 private:
  struct Subscriber {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<runtime::DeckBroadcast> backlog;
    bool overflowed = false;
    bool closed = false;
  };

  std::shared_ptr<runtime::DeckAuthority> authority_;
  std::atomic<bool> shutdown_{false};

  mutable std::mutex subscribers_mutex_;
  std::vector<std::shared_ptr<Subscriber>> subscribers_;
};

}  // namespace service
}  // namespace decksync

#endif  // DECKSYNC_SERVICE_DECKSYNC_SERVICE_H_
