// Repository: DeckSync
// Component: DeckSync gRPC Client
// Purpose: Carries one client's commands to the authority and its broadcasts back onto the dispatch queue.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SERVICE_DECKSYNC_CLIENT_H_
#define DECKSYNC_SERVICE_DECKSYNC_CLIENT_H_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "decksync.grpc.pb.h"
#include "decksync.pb.h"
#include "decksync/runtime/DispatchQueue.h"
#include "decksync/runtime/Messages.h"
#include "decksync/timeline/DeckTypes.hpp"

namespace decksync {
namespace service {

struct ClientConfig {
  std::string target = "127.0.0.1:50061";
  std::string client_id;
  timeline::ClientRole role = timeline::ClientRole::kController;
  // SendCommand attempts after the first, on UNAVAILABLE only.
  int max_send_retries = 3;
  int send_retry_backoff_ms = 100;
  int reconnect_initial_backoff_ms = 100;
  int reconnect_max_backoff_ms = 5000;
};

// DeckSyncClient owns two threads: a sender that issues unary SendCommand /
// GetState calls in order, and a subscriber that keeps one Subscribe stream
// open, reconnecting with exponential backoff. Everything received is posted
// onto the DispatchQueue; handlers never run on a gRPC thread.
class DeckSyncClient {
 public:
  struct Handlers {
    std::function<void(const runtime::ServerMessage&)> on_message;
    std::function<void(const runtime::CommandResult&)> on_ack;
  };

  DeckSyncClient(ClientConfig config,
                 std::shared_ptr<runtime::DispatchQueue> queue,
                 Handlers handlers);
  ~DeckSyncClient();

  DeckSyncClient(const DeckSyncClient&) = delete;
  DeckSyncClient& operator=(const DeckSyncClient&) = delete;

  void Send(const runtime::DeckCommand& command);
  // Fetches a FullStateResync through GetState and delivers it as a
  // server message.
  void RequestResync();

  [[nodiscard]] bool subscribed() const {
    return subscribed_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] uint64_t send_failures_total() const {
    return send_failures_.load(std::memory_order_relaxed);
  }

 private:
  struct Outbound {
    bool resync = false;
    runtime::DeckCommand command;
  };

  void SenderLoop();
  void Deliver(const Outbound& item);
  void ConnectionLoop();
  bool RunOneSubscription();
  void PostMessage(runtime::ServerMessage message);

  ClientConfig config_;
  std::shared_ptr<runtime::DispatchQueue> queue_;
  Handlers handlers_;

  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<v1::DeckSync::Stub> stub_;

  std::atomic<bool> shutdown_{false};
  std::atomic<bool> subscribed_{false};
  std::atomic<uint64_t> send_failures_{0};

  std::mutex send_mutex_;
  std::condition_variable send_cv_;
  std::deque<Outbound> send_queue_;

  std::mutex stream_mutex_;
  std::condition_variable stream_cv_;
  grpc::ClientContext* stream_context_ = nullptr;

  std::thread sender_thread_;
  std::thread connection_thread_;
};

}  // namespace service
}  // namespace decksync

#endif  // DECKSYNC_SERVICE_DECKSYNC_CLIENT_H_
