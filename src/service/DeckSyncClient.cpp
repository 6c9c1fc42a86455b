// Repository: DeckSync
// Component: DeckSync gRPC Client
// Purpose: Carries one client's commands to the authority and its broadcasts back onto the dispatch queue.
// Copyright (c) 2025 DeckSync

#include "service/DeckSyncClient.h"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

#include "decksync/util/Identifiers.hpp"
#include "decksync/util/Logger.hpp"
#include "decksync/wire/ProtoCodec.hpp"

namespace decksync {
namespace service {

using wire::ProtoCodec;

DeckSyncClient::DeckSyncClient(ClientConfig config,
                               std::shared_ptr<runtime::DispatchQueue> queue,
                               Handlers handlers)
    : config_(std::move(config)),
      queue_(std::move(queue)),
      handlers_(std::move(handlers)),
      channel_(grpc::CreateChannel(config_.target,
                                   grpc::InsecureChannelCredentials())),
      stub_(v1::DeckSync::NewStub(channel_)) {
  if (config_.client_id.empty()) {
    config_.client_id = util::GenerateUuidV4();
  }
  sender_thread_ = std::thread([this] { SenderLoop(); });
  connection_thread_ = std::thread([this] { ConnectionLoop(); });
}

DeckSyncClient::~DeckSyncClient() {
  shutdown_.store(true, std::memory_order_release);
  send_cv_.notify_all();
  {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (stream_context_ != nullptr) {
      stream_context_->TryCancel();
    }
    stream_cv_.notify_all();
  }
  if (sender_thread_.joinable()) sender_thread_.join();
  if (connection_thread_.joinable()) connection_thread_.join();
  // Anything still queued for the dispatch thread refers to this client.
  queue_->CancelOwner(this);
}

void DeckSyncClient::Send(const runtime::DeckCommand& command) {
  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    Outbound item;
    item.command = command;
    send_queue_.push_back(std::move(item));
  }
  send_cv_.notify_one();
}

void DeckSyncClient::RequestResync() {
  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    // One outstanding resync is enough.
    const bool queued = std::any_of(send_queue_.begin(), send_queue_.end(),
                                    [](const Outbound& o) { return o.resync; });
    if (queued) return;
    Outbound item;
    item.resync = true;
    send_queue_.push_back(std::move(item));
  }
  send_cv_.notify_one();
}

void DeckSyncClient::PostMessage(runtime::ServerMessage message) {
  queue_->Post(
      [this, message = std::move(message)] {
        if (handlers_.on_message) handlers_.on_message(message);
      },
      this);
}

// ---------------------------------------------------------------------------
// Sender: unary calls, in order, with bounded retry
// ---------------------------------------------------------------------------

void DeckSyncClient::SenderLoop() {
  while (!shutdown_.load(std::memory_order_acquire)) {
    Outbound item;
    {
      std::unique_lock<std::mutex> lock(send_mutex_);
      send_cv_.wait(lock, [this] {
        return !send_queue_.empty() || shutdown_.load(std::memory_order_relaxed);
      });
      if (shutdown_.load(std::memory_order_relaxed)) break;
      item = std::move(send_queue_.front());
      send_queue_.pop_front();
    }
    Deliver(item);
  }
}

void DeckSyncClient::Deliver(const Outbound& item) {
  int backoff_ms = config_.send_retry_backoff_ms;
  for (int attempt = 0; attempt <= config_.max_send_retries; ++attempt) {
    if (attempt > 0) {
      std::unique_lock<std::mutex> lock(send_mutex_);
      send_cv_.wait_for(lock, std::chrono::milliseconds(backoff_ms), [this] {
        return shutdown_.load(std::memory_order_relaxed);
      });
      if (shutdown_.load(std::memory_order_relaxed)) return;
      backoff_ms *= 2;
    }

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() +
                         std::chrono::seconds(5));
    grpc::Status status;
    if (item.resync) {
      v1::FullStateResync response;
      status = stub_->GetState(&context, v1::GetStateRequest(), &response);
      if (status.ok()) {
        auto decoded = ProtoCodec::Decode(response);
        if (!decoded.ok) {
          util::Logger::Error("[DeckSyncClient] RESYNC_MALFORMED reason=" +
                              decoded.message);
          return;
        }
        PostMessage(runtime::ServerMessage(std::move(decoded.value)));
        return;
      }
    } else {
      v1::CommandAck ack;
      status = stub_->SendCommand(
          &context, ProtoCodec::ToProto(item.command, config_.role), &ack);
      if (status.ok()) {
        auto decoded = ProtoCodec::Decode(ack);
        if (!decoded.ok) {
          util::Logger::Error("[DeckSyncClient] ACK_MALFORMED cmd=" +
                              item.command.intent.command_id +
                              " reason=" + decoded.message);
          return;
        }
        queue_->Post(
            [this, result = std::move(decoded.value)] {
              if (handlers_.on_ack) handlers_.on_ack(result);
            },
            this);
        return;
      }
    }

    if (status.error_code() != grpc::StatusCode::UNAVAILABLE) {
      send_failures_.fetch_add(1, std::memory_order_relaxed);
      std::ostringstream oss;
      oss << "[DeckSyncClient] SEND_FAILED code=" << status.error_code()
          << " reason=" << status.error_message();
      util::Logger::Warn(oss.str());
      return;
    }
  }
  send_failures_.fetch_add(1, std::memory_order_relaxed);
  std::ostringstream oss;
  oss << "[DeckSyncClient] SEND_GAVE_UP retries=" << config_.max_send_retries
      << " resync=" << (item.resync ? 1 : 0);
  util::Logger::Warn(oss.str());
}

// ---------------------------------------------------------------------------
// Subscription: reconnect with backoff
// ---------------------------------------------------------------------------

void DeckSyncClient::ConnectionLoop() {
  int backoff_ms = config_.reconnect_initial_backoff_ms;

  while (!shutdown_.load(std::memory_order_acquire)) {
    const bool ok = RunOneSubscription();
    subscribed_.store(false, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire)) break;
    if (ok) {
      backoff_ms = config_.reconnect_initial_backoff_ms;
    }

    std::unique_lock<std::mutex> lock(stream_mutex_);
    stream_cv_.wait_for(lock, std::chrono::milliseconds(backoff_ms), [this] {
      return shutdown_.load(std::memory_order_relaxed);
    });
    backoff_ms = std::min(backoff_ms * 2, config_.reconnect_max_backoff_ms);
  }
}

// True when the stream delivered at least its initial resync.
bool DeckSyncClient::RunOneSubscription() {
  grpc::ClientContext context;
  {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (shutdown_.load(std::memory_order_relaxed)) return false;
    stream_context_ = &context;
  }

  v1::SubscribeRequest request;
  request.set_client_id(config_.client_id);
  request.set_role(ProtoCodec::ToProto(config_.role));
  auto reader = stub_->Subscribe(&context, request);

  bool received = false;
  v1::ServerMessage message;
  while (reader->Read(&message)) {
    auto decoded = ProtoCodec::Decode(message);
    if (!decoded.ok) {
      util::Logger::Warn("[DeckSyncClient] MESSAGE_MALFORMED reason=" +
                         decoded.message);
      continue;
    }
    if (!received) {
      received = true;
      subscribed_.store(true, std::memory_order_relaxed);
      util::Logger::Info("[DeckSyncClient] SUBSCRIBED target=" + config_.target);
    }
    PostMessage(std::move(decoded.value));
  }
  const grpc::Status status = reader->Finish();

  {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    stream_context_ = nullptr;
  }
  if (!shutdown_.load(std::memory_order_relaxed)) {
    std::ostringstream oss;
    oss << "[DeckSyncClient] STREAM_CLOSED code=" << status.error_code()
        << " reason=" << status.error_message();
    util::Logger::Warn(oss.str());
  }
  return received;
}

}  // namespace service
}  // namespace decksync
