// Repository: DeckSync
// Component: Proto codec unit tests
// Purpose: Mapping between domain types and their protobuf messages.
// Copyright (c) 2025 DeckSync

#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "decksync/wire/ProtoCodec.hpp"

namespace decksync::wire {
namespace {

// -----------------------------------------------------------------------------
// Optional fields stay absent instead of turning into zero values
// -----------------------------------------------------------------------------
TEST(ProtoCodecTest, AbsentOptionalStateFieldsStayAbsent) {
  v1::DeckTimelineState wire;
  wire.set_version(4);
  wire.set_is_playing(true);
  const timeline::DeckTimelineState state = ProtoCodec::FromProto(wire);
  EXPECT_FALSE(state.src.has_value());
  EXPECT_FALSE(state.duration.has_value());
  EXPECT_FALSE(state.command_id.has_value());
  EXPECT_EQ(state.version, 4u);
  EXPECT_TRUE(state.is_playing);

  v1::DeckTimelineState out;
  ProtoCodec::ToProto(state, &out);
  EXPECT_FALSE(out.has_src());
  EXPECT_FALSE(out.has_duration());
  EXPECT_FALSE(out.has_command_id());
}

TEST(ProtoCodecTest, ZeroDurationIsDistinctFromUnknown) {
  timeline::DeckTimelineState state;
  state.src = "a.mp4";
  state.duration = 0.0;
  v1::DeckTimelineState wire;
  ProtoCodec::ToProto(state, &wire);
  ASSERT_TRUE(wire.has_duration());
  const auto decoded = ProtoCodec::FromProto(wire);
  ASSERT_TRUE(decoded.duration.has_value());
  EXPECT_DOUBLE_EQ(*decoded.duration, 0.0);
}

TEST(ProtoCodecTest, LoadGenerationTravelsWithState) {
  timeline::DeckTimelineState state;
  state.src = "a.mp4";
  state.load_generation = 7;
  v1::DeckTimelineState wire;
  ProtoCodec::ToProto(state, &wire);
  EXPECT_EQ(wire.load_generation(), 7u);
  EXPECT_EQ(ProtoCodec::FromProto(wire).load_generation, 7u);
}

// -----------------------------------------------------------------------------
// Commands
// -----------------------------------------------------------------------------
TEST(ProtoCodecTest, CommandCarriesIntentVersionAndRole) {
  runtime::DeckCommand command;
  command.deck = timeline::DeckKey::kC;
  command.intent.command_id = "cmd-7";
  command.intent.payload = timeline::SeekIntent{12.5, false};
  command.expected_version = 9;

  const v1::DeckCommand wire =
      ProtoCodec::ToProto(command, timeline::ClientRole::kController);
  EXPECT_EQ(wire.intent_case(), v1::DeckCommand::kSeek);

  const auto decoded = ProtoCodec::Decode(wire);
  ASSERT_TRUE(decoded.ok) << decoded.message;
  EXPECT_EQ(decoded.value.role, timeline::ClientRole::kController);
  EXPECT_EQ(decoded.value.command.deck, timeline::DeckKey::kC);
  EXPECT_EQ(decoded.value.command.intent.command_id, "cmd-7");
  ASSERT_TRUE(decoded.value.command.expected_version.has_value());
  EXPECT_EQ(*decoded.value.command.expected_version, 9u);
  const auto* seek =
      std::get_if<timeline::SeekIntent>(&decoded.value.command.intent.payload);
  ASSERT_NE(seek, nullptr);
  EXPECT_DOUBLE_EQ(seek->position, 12.5);
  ASSERT_TRUE(seek->resume.has_value());
  EXPECT_FALSE(*seek->resume);
}

TEST(ProtoCodecTest, ClearSourceEncodedWithoutSrc) {
  runtime::DeckCommand command;
  command.intent.command_id = "cmd-clear";
  command.intent.payload = timeline::SourceIntent{std::nullopt, false};
  const auto decoded = ProtoCodec::Decode(
      ProtoCodec::ToProto(command, timeline::ClientRole::kController));
  ASSERT_TRUE(decoded.ok);
  const auto* source =
      std::get_if<timeline::SourceIntent>(&decoded.value.command.intent.payload);
  ASSERT_NE(source, nullptr);
  EXPECT_FALSE(source->src.has_value());
}

TEST(ProtoCodecTest, PatchKeepsOnlyPresentFields) {
  v1::DeckCommand wire;
  wire.set_deck(v1::DECK_KEY_B);
  wire.set_command_id("report-1");
  wire.set_role(v1::CLIENT_ROLE_CONTROLLER);
  wire.mutable_state()->set_duration(31.0);
  const auto decoded = ProtoCodec::Decode(wire);
  ASSERT_TRUE(decoded.ok);
  const auto* patch =
      std::get_if<timeline::StatePatch>(&decoded.value.command.intent.payload);
  ASSERT_NE(patch, nullptr);
  ASSERT_TRUE(patch->duration.has_value());
  EXPECT_DOUBLE_EQ(*patch->duration, 31.0);
  EXPECT_FALSE(patch->is_playing.has_value());
  EXPECT_FALSE(patch->is_loading.has_value());
  EXPECT_FALSE(patch->error_message.has_value());
}

TEST(ProtoCodecTest, UnspecifiedRoleDecodesAsViewer) {
  v1::DeckCommand wire;
  wire.set_deck(v1::DECK_KEY_A);
  wire.set_command_id("cmd-1");
  wire.mutable_play();
  const auto decoded = ProtoCodec::Decode(wire);
  ASSERT_TRUE(decoded.ok);
  EXPECT_EQ(decoded.value.role, timeline::ClientRole::kViewer);
}

TEST(ProtoCodecTest, MalformedCommandsRejectedAsInvalidPayload) {
  v1::DeckCommand no_deck;
  no_deck.set_command_id("cmd-1");
  no_deck.mutable_play();
  auto decoded = ProtoCodec::Decode(no_deck);
  EXPECT_FALSE(decoded.ok);
  EXPECT_EQ(decoded.code, timeline::ErrorCode::kInvalidPayload);

  v1::DeckCommand no_intent;
  no_intent.set_deck(v1::DECK_KEY_A);
  no_intent.set_command_id("cmd-2");
  decoded = ProtoCodec::Decode(no_intent);
  EXPECT_FALSE(decoded.ok);
  EXPECT_EQ(decoded.code, timeline::ErrorCode::kInvalidPayload);
}

// -----------------------------------------------------------------------------
// Acks and server messages
// -----------------------------------------------------------------------------
TEST(ProtoCodecTest, AckPreservesRejectionDetail) {
  runtime::CommandResult result;
  result.accepted = false;
  result.code = timeline::ErrorCode::kRevisionMismatch;
  result.message = "expected version 3 but deck is at 5";
  result.deck = timeline::DeckKey::kD;
  result.command_id = "cmd-9";
  result.state.version = 5;

  const auto decoded = ProtoCodec::Decode(ProtoCodec::ToProto(result));
  ASSERT_TRUE(decoded.ok);
  EXPECT_FALSE(decoded.value.accepted);
  EXPECT_EQ(decoded.value.code, timeline::ErrorCode::kRevisionMismatch);
  EXPECT_EQ(decoded.value.message, result.message);
  EXPECT_EQ(decoded.value.deck, timeline::DeckKey::kD);
  EXPECT_EQ(decoded.value.state.version, 5u);
}

TEST(ProtoCodecTest, UnknownErrorCodeMapsToInvalidPayload) {
  EXPECT_EQ(ProtoCodec::FromProto(static_cast<v1::ErrorCode>(42)),
            timeline::ErrorCode::kInvalidPayload);
}

TEST(ProtoCodecTest, ResyncCarriesEveryDeckInOrder) {
  runtime::FullStateResync resync;
  resync.authority_epoch = "epoch-3";
  resync.decks[timeline::DeckIndex(timeline::DeckKey::kB)].version = 8;
  resync.decks[timeline::DeckIndex(timeline::DeckKey::kD)].src = "d.mp4";

  const v1::ServerMessage wire = ProtoCodec::ToProto(runtime::ServerMessage{resync});
  ASSERT_EQ(wire.payload_case(), v1::ServerMessage::kResync);
  EXPECT_EQ(wire.resync().decks_size(), 4);

  const auto decoded = ProtoCodec::Decode(wire);
  ASSERT_TRUE(decoded.ok) << decoded.message;
  const auto* out = std::get_if<runtime::FullStateResync>(&decoded.value);
  ASSERT_NE(out, nullptr);
  EXPECT_EQ(out->authority_epoch, "epoch-3");
  EXPECT_EQ(out->decks[timeline::DeckIndex(timeline::DeckKey::kB)].version, 8u);
  EXPECT_EQ(out->decks[timeline::DeckIndex(timeline::DeckKey::kD)].src,
            std::optional<std::string>("d.mp4"));
}

TEST(ProtoCodecTest, ResyncWithMissingOrRepeatedDeckRejected) {
  v1::FullStateResync wire = ProtoCodec::ToProto(runtime::FullStateResync{});
  wire.mutable_decks()->RemoveLast();
  EXPECT_FALSE(ProtoCodec::Decode(wire).ok);

  wire = ProtoCodec::ToProto(runtime::FullStateResync{});
  wire.mutable_decks(3)->set_deck(v1::DECK_KEY_A);
  const auto decoded = ProtoCodec::Decode(wire);
  EXPECT_FALSE(decoded.ok);
  EXPECT_EQ(decoded.code, timeline::ErrorCode::kInvalidPayload);
}

TEST(ProtoCodecTest, EmptyServerMessageRejected) {
  EXPECT_FALSE(ProtoCodec::Decode(v1::ServerMessage{}).ok);
}

}  // namespace
}  // namespace decksync::wire
