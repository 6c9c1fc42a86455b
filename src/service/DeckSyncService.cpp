// Repository: DeckSync
// Component: DeckSync gRPC Service
// Purpose: Exposes the DeckAuthority over gRPC: commands, subscriptions and snapshots.
// Copyright (c) 2025 DeckSync

#include "service/DeckSyncService.h"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

#include "decksync/util/Logger.hpp"
#include "decksync/wire/ProtoCodec.hpp"

namespace decksync {
namespace service {

using wire::ProtoCodec;

DeckSyncServiceImpl::DeckSyncServiceImpl(
    std::shared_ptr<runtime::DeckAuthority> authority)
    : authority_(std::move(authority)) {}

DeckSyncServiceImpl::~DeckSyncServiceImpl() { Shutdown(); }

void DeckSyncServiceImpl::Shutdown() {
  shutdown_.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  for (auto& subscriber : subscribers_) {
    std::lock_guard<std::mutex> sub_lock(subscriber->mutex);
    subscriber->closed = true;
    subscriber->cv.notify_all();
  }
}

std::size_t DeckSyncServiceImpl::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(subscribers_mutex_);
  return subscribers_.size();
}

grpc::Status DeckSyncServiceImpl::SendCommand(grpc::ServerContext* context,
                                              const v1::DeckCommand* request,
                                              v1::CommandAck* response) {
  (void)context;
  auto decoded = ProtoCodec::Decode(*request);
  if (!decoded.ok) {
    std::ostringstream oss;
    oss << "[DeckSyncService] COMMAND_MALFORMED cmd=" << request->command_id()
        << " reason=" << decoded.message;
    util::Logger::Warn(oss.str());
    response->set_accepted(false);
    response->set_code(ProtoCodec::ToProto(decoded.code));
    response->set_message(decoded.message);
    response->set_deck(request->deck());
    response->set_command_id(request->command_id());
    return grpc::Status::OK;
  }
  const runtime::CommandResult result =
      authority_->Apply(decoded.value.command, decoded.value.role);
  *response = ProtoCodec::ToProto(result);
  return grpc::Status::OK;
}

grpc::Status DeckSyncServiceImpl::Subscribe(
    grpc::ServerContext* context, const v1::SubscribeRequest* request,
    grpc::ServerWriter<v1::ServerMessage>* writer) {
  if (shutdown_.load(std::memory_order_acquire)) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE, "service shutting down");
  }

  auto subscriber = std::make_shared<Subscriber>();
  auto subscription = authority_->Subscribe(
      [subscriber](const runtime::DeckBroadcast& broadcast) {
        std::lock_guard<std::mutex> lock(subscriber->mutex);
        if (subscriber->backlog.size() >= kMaxSubscriberBacklog) {
          subscriber->overflowed = true;
        } else {
          subscriber->backlog.push_back(broadcast);
        }
        subscriber->cv.notify_one();
      });
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.push_back(subscriber);
  }
  {
    std::ostringstream oss;
    oss << "[DeckSyncService] SUBSCRIBED client=" << request->client_id()
        << " epoch=" << subscription.resync.authority_epoch;
    util::Logger::Info(oss.str());
  }

  grpc::Status status = grpc::Status::OK;
  v1::ServerMessage first;
  *first.mutable_resync() = ProtoCodec::ToProto(subscription.resync);
  bool open = writer->Write(first);

  while (open && !context->IsCancelled()) {
    std::deque<runtime::DeckBroadcast> batch;
    {
      std::unique_lock<std::mutex> lock(subscriber->mutex);
      subscriber->cv.wait_for(lock, std::chrono::milliseconds(100), [&] {
        return !subscriber->backlog.empty() || subscriber->overflowed ||
               subscriber->closed;
      });
      if (subscriber->closed) {
        break;
      }
      if (subscriber->overflowed) {
        status = grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED,
                              "subscriber fell behind; resubscribe");
        break;
      }
      batch.swap(subscriber->backlog);
    }
    for (const auto& broadcast : batch) {
      if (!writer->Write(ProtoCodec::ToProto(runtime::ServerMessage(broadcast)))) {
        open = false;
        break;
      }
    }
  }

  authority_->Unsubscribe(subscription.id);
  {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.erase(
        std::remove(subscribers_.begin(), subscribers_.end(), subscriber),
        subscribers_.end());
  }
  std::ostringstream oss;
  oss << "[DeckSyncService] UNSUBSCRIBED client=" << request->client_id()
      << " status=" << status.error_code();
  util::Logger::Info(oss.str());
  return status;
}

grpc::Status DeckSyncServiceImpl::GetState(grpc::ServerContext* context,
                                           const v1::GetStateRequest* request,
                                           v1::FullStateResync* response) {
  (void)context;
  (void)request;
  *response = ProtoCodec::ToProto(authority_->Snapshot());
  return grpc::Status::OK;
}

}  // namespace service
}  // namespace decksync
