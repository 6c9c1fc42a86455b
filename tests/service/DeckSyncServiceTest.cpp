// Repository: DeckSync
// Component: DeckSync gRPC service tests
// Purpose: In-process gRPC round trips against the authority.
// Copyright (c) 2025 DeckSync

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "decksync.pb.h"
#include "decksync/runtime/DeckAuthority.h"
#include "decksync/runtime/DispatchQueue.h"
#include "decksync/timing/WallClock.h"
#include "service/DeckSyncClient.h"
#include "service/DeckSyncService.h"

namespace decksync::service {
namespace {

class DeckSyncServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    runtime::AuthorityConfig config;
    config.epoch = "svc-epoch";
    authority_ = std::make_shared<runtime::DeckAuthority>(
        timing::MakeSystemWallClock(), config);
    service_ = std::make_unique<DeckSyncServiceImpl>(authority_);

    grpc::ServerBuilder builder;
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(),
                             &port_);
    builder.RegisterService(service_.get());
    server_ = builder.BuildAndStart();
    ASSERT_NE(server_, nullptr);
    ASSERT_GT(port_, 0);
  }

  void TearDown() override {
    service_->Shutdown();
    if (server_) {
      server_->Shutdown(std::chrono::system_clock::now() +
                        std::chrono::seconds(2));
    }
  }

  ClientConfig MakeClientConfig(const std::string& id,
                                timeline::ClientRole role) const {
    ClientConfig config;
    config.target = "127.0.0.1:" + std::to_string(port_);
    config.client_id = id;
    config.role = role;
    return config;
  }

  // Drains the queue until `done` holds or five seconds pass.
  bool WaitFor(const std::function<bool()>& done) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
      queue_->RunDue();
      if (done()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  }

  static v1::DeckCommand PlayCommand(const std::string& id,
                                     v1::ClientRole role) {
    v1::DeckCommand command;
    command.set_deck(v1::DECK_KEY_A);
    command.set_command_id(id);
    command.set_role(role);
    command.mutable_play();
    return command;
  }

  std::shared_ptr<runtime::DeckAuthority> authority_;
  std::unique_ptr<DeckSyncServiceImpl> service_;
  std::unique_ptr<grpc::Server> server_;
  int port_ = 0;
  std::shared_ptr<runtime::DispatchQueue> queue_ =
      std::make_shared<runtime::DispatchQueue>(timing::MakeSystemWallClock());
};

// -----------------------------------------------------------------------------
// Protocol failures travel inside the ack; the RPC itself succeeds
// -----------------------------------------------------------------------------
TEST_F(DeckSyncServiceTest, MalformedCommandAckedAsInvalidPayload) {
  v1::DeckCommand request;
  request.set_deck(v1::DECK_KEY_B);
  request.set_command_id("cmd-empty");
  request.set_role(v1::CLIENT_ROLE_CONTROLLER);
  v1::CommandAck response;
  grpc::ServerContext context;

  const grpc::Status status =
      service_->SendCommand(&context, &request, &response);
  EXPECT_TRUE(status.ok());
  EXPECT_FALSE(response.accepted());
  EXPECT_EQ(response.code(), v1::ERROR_CODE_INVALID_PAYLOAD);
  EXPECT_EQ(response.command_id(), "cmd-empty");
  EXPECT_EQ(authority_->State(timeline::DeckKey::kB).version, 0u);
}

TEST_F(DeckSyncServiceTest, RoleEnforcedOnSendCommand) {
  v1::CommandAck response;
  grpc::ServerContext viewer_context;
  const auto viewer = PlayCommand("cmd-viewer", v1::CLIENT_ROLE_UNSPECIFIED);
  ASSERT_TRUE(service_->SendCommand(&viewer_context, &viewer, &response).ok());
  EXPECT_FALSE(response.accepted());
  EXPECT_EQ(response.code(), v1::ERROR_CODE_FORBIDDEN);

  grpc::ServerContext controller_context;
  const auto controller = PlayCommand("cmd-ctl", v1::CLIENT_ROLE_CONTROLLER);
  ASSERT_TRUE(
      service_->SendCommand(&controller_context, &controller, &response).ok());
  EXPECT_TRUE(response.accepted());
  EXPECT_EQ(response.state().version(), 1u);
  EXPECT_EQ(response.state().command_id(), "cmd-ctl");
}

TEST_F(DeckSyncServiceTest, GetStateReturnsEveryDeck) {
  v1::GetStateRequest request;
  v1::FullStateResync response;
  grpc::ServerContext context;
  ASSERT_TRUE(service_->GetState(&context, &request, &response).ok());
  EXPECT_EQ(response.authority_epoch(), "svc-epoch");
  EXPECT_EQ(response.decks_size(), 4);
}

// -----------------------------------------------------------------------------
// End to end over a loopback channel
// -----------------------------------------------------------------------------
TEST_F(DeckSyncServiceTest, SubscriberGetsResyncThenBroadcasts) {
  std::vector<runtime::ServerMessage> viewer_messages;
  std::vector<runtime::CommandResult> controller_acks;
  std::vector<runtime::CommandResult> viewer_acks;

  DeckSyncClient viewer(
      MakeClientConfig("viewer-1", timeline::ClientRole::kViewer), queue_,
      {[&](const runtime::ServerMessage& m) { viewer_messages.push_back(m); },
       [&](const runtime::CommandResult& r) { viewer_acks.push_back(r); }});
  ASSERT_TRUE(WaitFor([&] { return !viewer_messages.empty(); }));
  const auto* resync =
      std::get_if<runtime::FullStateResync>(&viewer_messages.front());
  ASSERT_NE(resync, nullptr);
  EXPECT_EQ(resync->authority_epoch, "svc-epoch");
  ASSERT_TRUE(WaitFor([&] { return service_->SubscriberCount() == 1u; }));

  DeckSyncClient controller(
      MakeClientConfig("controller-1", timeline::ClientRole::kController),
      queue_,
      {nullptr,
       [&](const runtime::CommandResult& r) { controller_acks.push_back(r); }});

  runtime::DeckCommand command;
  command.deck = timeline::DeckKey::kA;
  command.intent.command_id = "cmd-play";
  command.intent.payload = timeline::SourceIntent{std::string("a.mp4"), false};
  controller.Send(command);

  ASSERT_TRUE(WaitFor([&] { return !controller_acks.empty(); }));
  EXPECT_TRUE(controller_acks[0].accepted);
  EXPECT_EQ(controller_acks[0].command_id, "cmd-play");

  ASSERT_TRUE(WaitFor([&] { return viewer_messages.size() >= 2u; }));
  const auto* broadcast =
      std::get_if<runtime::DeckBroadcast>(&viewer_messages[1]);
  ASSERT_NE(broadcast, nullptr);
  EXPECT_EQ(broadcast->deck, timeline::DeckKey::kA);
  EXPECT_EQ(broadcast->state.version, 1u);
  EXPECT_EQ(broadcast->state.src, std::optional<std::string>("a.mp4"));

  // The viewer's own command is refused by role.
  command.intent.command_id = "cmd-viewer";
  viewer.Send(command);
  ASSERT_TRUE(WaitFor([&] { return !viewer_acks.empty(); }));
  EXPECT_FALSE(viewer_acks[0].accepted);
  EXPECT_EQ(viewer_acks[0].code, timeline::ErrorCode::kForbidden);

  // A resync request is answered with a full snapshot.
  const std::size_t before = viewer_messages.size();
  viewer.RequestResync();
  ASSERT_TRUE(WaitFor([&] { return viewer_messages.size() > before; }));
  const auto* snapshot =
      std::get_if<runtime::FullStateResync>(&viewer_messages.back());
  ASSERT_NE(snapshot, nullptr);
  EXPECT_EQ(snapshot->decks[timeline::DeckIndex(timeline::DeckKey::kA)].version,
            1u);
}

TEST_F(DeckSyncServiceTest, ClientDisconnectUnsubscribes) {
  std::vector<runtime::ServerMessage> messages;
  {
    DeckSyncClient client(
        MakeClientConfig("viewer-2", timeline::ClientRole::kViewer), queue_,
        {[&](const runtime::ServerMessage& m) { messages.push_back(m); },
         nullptr});
    ASSERT_TRUE(WaitFor([&] { return service_->SubscriberCount() == 1u; }));
  }
  // The client cancelled its stream on destruction.
  EXPECT_TRUE(WaitFor([&] { return service_->SubscriberCount() == 0u; }));
}

}  // namespace
}  // namespace decksync::service
