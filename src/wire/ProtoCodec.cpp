// Repository: DeckSync
// Component: Proto Codec
// Purpose: Converts protocol messages between decksync.v1 protobuf and native types.
// Copyright (c) 2025 DeckSync

#include "decksync/wire/ProtoCodec.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace decksync::wire {

namespace {

template <typename T>
DecodeResult<T> Invalid(std::string message) {
  DecodeResult<T> result;
  result.code = timeline::ErrorCode::kInvalidPayload;
  result.message = std::move(message);
  return result;
}

void PatchToProto(const timeline::StatePatch& patch, v1::StatePatch* out) {
  if (patch.is_playing) out->set_is_playing(*patch.is_playing);
  if (patch.base_position) out->set_base_position(*patch.base_position);
  if (patch.play_rate) out->set_play_rate(*patch.play_rate);
  if (patch.duration) out->set_duration(*patch.duration);
  if (patch.is_loading) out->set_is_loading(*patch.is_loading);
  if (patch.error) out->set_error(*patch.error);
  if (patch.error_message) out->set_error_message(*patch.error_message);
}

timeline::StatePatch PatchFromProto(const v1::StatePatch& in) {
  timeline::StatePatch patch;
  if (in.has_is_playing()) patch.is_playing = in.is_playing();
  if (in.has_base_position()) patch.base_position = in.base_position();
  if (in.has_play_rate()) patch.play_rate = in.play_rate();
  if (in.has_duration()) patch.duration = in.duration();
  if (in.has_is_loading()) patch.is_loading = in.is_loading();
  if (in.has_error()) patch.error = in.error();
  if (in.has_error_message()) patch.error_message = in.error_message();
  return patch;
}

// Visitor filling the intent oneof of an outgoing DeckCommand.
struct IntentWriter {
  v1::DeckCommand* out;

  void operator()(const timeline::ToggleIntent&) const { out->mutable_toggle(); }
  void operator()(const timeline::PlayIntent&) const { out->mutable_play(); }
  void operator()(const timeline::PauseIntent&) const { out->mutable_pause(); }
  void operator()(const timeline::SeekIntent& seek) const {
    auto* msg = out->mutable_seek();
    msg->set_position(seek.position);
    if (seek.resume) msg->set_resume(*seek.resume);
  }
  void operator()(const timeline::RateIntent& rate) const {
    out->mutable_rate()->set_value(rate.value);
  }
  void operator()(const timeline::SourceIntent& source) const {
    auto* msg = out->mutable_source();
    if (source.src) msg->set_src(*source.src);
    msg->set_reload(source.reload);
  }
  void operator()(const timeline::StatePatch& patch) const {
    PatchToProto(patch, out->mutable_state());
  }
};

}  // namespace

// ---------------------------------------------------------------------------
// Enums
// ---------------------------------------------------------------------------

v1::DeckKey ProtoCodec::ToProto(timeline::DeckKey deck) {
  switch (deck) {
    case timeline::DeckKey::kA: return v1::DECK_KEY_A;
    case timeline::DeckKey::kB: return v1::DECK_KEY_B;
    case timeline::DeckKey::kC: return v1::DECK_KEY_C;
    case timeline::DeckKey::kD: return v1::DECK_KEY_D;
  }
  return v1::DECK_KEY_UNSPECIFIED;
}

bool ProtoCodec::FromProto(v1::DeckKey in, timeline::DeckKey* out) {
  switch (in) {
    case v1::DECK_KEY_A: *out = timeline::DeckKey::kA; return true;
    case v1::DECK_KEY_B: *out = timeline::DeckKey::kB; return true;
    case v1::DECK_KEY_C: *out = timeline::DeckKey::kC; return true;
    case v1::DECK_KEY_D: *out = timeline::DeckKey::kD; return true;
    default: return false;
  }
}

v1::ClientRole ProtoCodec::ToProto(timeline::ClientRole role) {
  switch (role) {
    case timeline::ClientRole::kController: return v1::CLIENT_ROLE_CONTROLLER;
    case timeline::ClientRole::kPreview: return v1::CLIENT_ROLE_PREVIEW;
    case timeline::ClientRole::kViewer: return v1::CLIENT_ROLE_VIEWER;
  }
  return v1::CLIENT_ROLE_UNSPECIFIED;
}

bool ProtoCodec::FromProto(v1::ClientRole in, timeline::ClientRole* out) {
  switch (in) {
    case v1::CLIENT_ROLE_CONTROLLER:
      *out = timeline::ClientRole::kController;
      return true;
    case v1::CLIENT_ROLE_PREVIEW:
      *out = timeline::ClientRole::kPreview;
      return true;
    case v1::CLIENT_ROLE_VIEWER:
      *out = timeline::ClientRole::kViewer;
      return true;
    default:
      return false;
  }
}

v1::ErrorCode ProtoCodec::ToProto(timeline::ErrorCode code) {
  switch (code) {
    case timeline::ErrorCode::kNone: return v1::ERROR_CODE_NONE;
    case timeline::ErrorCode::kInvalidPayload: return v1::ERROR_CODE_INVALID_PAYLOAD;
    case timeline::ErrorCode::kInvalidCommand: return v1::ERROR_CODE_INVALID_COMMAND;
    case timeline::ErrorCode::kRevisionMismatch: return v1::ERROR_CODE_REVISION_MISMATCH;
    case timeline::ErrorCode::kForbidden: return v1::ERROR_CODE_FORBIDDEN;
    case timeline::ErrorCode::kDeckLoad: return v1::ERROR_CODE_DECK_LOAD;
  }
  return v1::ERROR_CODE_NONE;
}

timeline::ErrorCode ProtoCodec::FromProto(v1::ErrorCode code) {
  switch (code) {
    case v1::ERROR_CODE_NONE: return timeline::ErrorCode::kNone;
    case v1::ERROR_CODE_INVALID_PAYLOAD: return timeline::ErrorCode::kInvalidPayload;
    case v1::ERROR_CODE_INVALID_COMMAND: return timeline::ErrorCode::kInvalidCommand;
    case v1::ERROR_CODE_REVISION_MISMATCH: return timeline::ErrorCode::kRevisionMismatch;
    case v1::ERROR_CODE_FORBIDDEN: return timeline::ErrorCode::kForbidden;
    case v1::ERROR_CODE_DECK_LOAD: return timeline::ErrorCode::kDeckLoad;
    default: return timeline::ErrorCode::kInvalidPayload;
  }
}

// ---------------------------------------------------------------------------
// State
// ---------------------------------------------------------------------------

void ProtoCodec::ToProto(const timeline::DeckTimelineState& state,
                         v1::DeckTimelineState* out) {
  out->Clear();
  if (state.src) out->set_src(*state.src);
  out->set_is_playing(state.is_playing);
  out->set_base_position(state.base_position);
  out->set_play_rate(state.play_rate);
  out->set_updated_at(state.updated_at);
  out->set_version(state.version);
  if (state.duration) out->set_duration(*state.duration);
  out->set_is_loading(state.is_loading);
  out->set_error(state.error);
  out->set_error_message(state.error_message);
  if (state.command_id) out->set_command_id(*state.command_id);
  out->set_load_generation(state.load_generation);
}

timeline::DeckTimelineState ProtoCodec::FromProto(
    const v1::DeckTimelineState& in) {
  timeline::DeckTimelineState state;
  if (in.has_src()) state.src = in.src();
  state.is_playing = in.is_playing();
  state.base_position = in.base_position();
  state.play_rate = in.play_rate();
  state.updated_at = in.updated_at();
  state.version = in.version();
  if (in.has_duration()) state.duration = in.duration();
  state.is_loading = in.is_loading();
  state.error = in.error();
  state.error_message = in.error_message();
  if (in.has_command_id()) state.command_id = in.command_id();
  state.load_generation = in.load_generation();
  return state;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

v1::DeckCommand ProtoCodec::ToProto(const runtime::DeckCommand& command,
                                    timeline::ClientRole role) {
  v1::DeckCommand out;
  out.set_deck(ToProto(command.deck));
  out.set_command_id(command.intent.command_id);
  std::visit(IntentWriter{&out}, command.intent.payload);
  if (command.expected_version) {
    out.set_expected_version(*command.expected_version);
  }
  out.set_role(ToProto(role));
  return out;
}

DecodeResult<DecodedCommand> ProtoCodec::Decode(const v1::DeckCommand& in) {
  DecodeResult<DecodedCommand> result;
  auto& command = result.value.command;
  if (!FromProto(in.deck(), &command.deck)) {
    return Invalid<DecodedCommand>("unknown deck");
  }
  // Unspecified role gets the least privilege.
  if (!FromProto(in.role(), &result.value.role)) {
    result.value.role = timeline::ClientRole::kViewer;
  }
  command.intent.command_id = in.command_id();
  if (in.has_expected_version()) {
    command.expected_version = in.expected_version();
  }

  switch (in.intent_case()) {
    case v1::DeckCommand::kToggle:
      command.intent.payload = timeline::ToggleIntent{};
      break;
    case v1::DeckCommand::kPlay:
      command.intent.payload = timeline::PlayIntent{};
      break;
    case v1::DeckCommand::kPause:
      command.intent.payload = timeline::PauseIntent{};
      break;
    case v1::DeckCommand::kSeek: {
      timeline::SeekIntent seek;
      seek.position = in.seek().position();
      if (in.seek().has_resume()) seek.resume = in.seek().resume();
      command.intent.payload = seek;
      break;
    }
    case v1::DeckCommand::kRate:
      command.intent.payload = timeline::RateIntent{in.rate().value()};
      break;
    case v1::DeckCommand::kSource: {
      timeline::SourceIntent source;
      if (in.source().has_src()) source.src = in.source().src();
      source.reload = in.source().reload();
      command.intent.payload = source;
      break;
    }
    case v1::DeckCommand::kState:
      command.intent.payload = PatchFromProto(in.state());
      break;
    case v1::DeckCommand::INTENT_NOT_SET:
    default:
      return Invalid<DecodedCommand>("command carries no intent");
  }
  result.ok = true;
  return result;
}

// ---------------------------------------------------------------------------
// Acks
// ---------------------------------------------------------------------------

v1::CommandAck ProtoCodec::ToProto(const runtime::CommandResult& result) {
  v1::CommandAck out;
  out.set_accepted(result.accepted);
  out.set_code(ToProto(result.code));
  out.set_message(result.message);
  out.set_deck(ToProto(result.deck));
  out.set_command_id(result.command_id);
  ToProto(result.state, out.mutable_state());
  out.set_duplicate(result.duplicate);
  return out;
}

DecodeResult<runtime::CommandResult> ProtoCodec::Decode(
    const v1::CommandAck& in) {
  DecodeResult<runtime::CommandResult> result;
  auto& ack = result.value;
  if (!FromProto(in.deck(), &ack.deck)) {
    return Invalid<runtime::CommandResult>("ack for unknown deck");
  }
  ack.accepted = in.accepted();
  ack.code = FromProto(in.code());
  ack.message = in.message();
  ack.command_id = in.command_id();
  ack.state = FromProto(in.state());
  ack.duplicate = in.duplicate();
  result.ok = true;
  return result;
}

// ---------------------------------------------------------------------------
// Server messages
// ---------------------------------------------------------------------------

v1::FullStateResync ProtoCodec::ToProto(const runtime::FullStateResync& resync) {
  v1::FullStateResync out;
  out.set_authority_epoch(resync.authority_epoch);
  for (timeline::DeckKey deck : timeline::kAllDecks) {
    auto* entry = out.add_decks();
    entry->set_deck(ToProto(deck));
    ToProto(resync.decks[timeline::DeckIndex(deck)], entry->mutable_state());
  }
  return out;
}

v1::ServerMessage ProtoCodec::ToProto(const runtime::ServerMessage& message) {
  v1::ServerMessage out;
  if (const auto* broadcast = std::get_if<runtime::DeckBroadcast>(&message)) {
    auto* msg = out.mutable_broadcast();
    msg->set_deck(ToProto(broadcast->deck));
    ToProto(broadcast->state, msg->mutable_state());
  } else {
    *out.mutable_resync() = ToProto(std::get<runtime::FullStateResync>(message));
  }
  return out;
}

DecodeResult<runtime::FullStateResync> ProtoCodec::Decode(
    const v1::FullStateResync& in) {
  DecodeResult<runtime::FullStateResync> result;
  if (in.decks_size() != static_cast<int>(timeline::kDeckCount)) {
    return Invalid<runtime::FullStateResync>("resync must carry every deck");
  }
  std::array<bool, timeline::kDeckCount> seen{};
  for (const auto& entry : in.decks()) {
    timeline::DeckKey deck;
    if (!FromProto(entry.deck(), &deck)) {
      return Invalid<runtime::FullStateResync>("resync entry for unknown deck");
    }
    const std::size_t index = timeline::DeckIndex(deck);
    if (seen[index]) {
      return Invalid<runtime::FullStateResync>(
          std::string("resync repeats deck ") + timeline::ToString(deck));
    }
    seen[index] = true;
    result.value.decks[index] = FromProto(entry.state());
  }
  result.value.authority_epoch = in.authority_epoch();
  result.ok = true;
  return result;
}

DecodeResult<runtime::ServerMessage> ProtoCodec::Decode(
    const v1::ServerMessage& in) {
  DecodeResult<runtime::ServerMessage> result;
  switch (in.payload_case()) {
    case v1::ServerMessage::kBroadcast: {
      runtime::DeckBroadcast broadcast;
      if (!FromProto(in.broadcast().deck(), &broadcast.deck)) {
        return Invalid<runtime::ServerMessage>("broadcast for unknown deck");
      }
      broadcast.state = FromProto(in.broadcast().state());
      result.value = broadcast;
      break;
    }
    case v1::ServerMessage::kResync: {
      auto resync = Decode(in.resync());
      if (!resync.ok) {
        return Invalid<runtime::ServerMessage>(resync.message);
      }
      result.value = std::move(resync.value);
      break;
    }
    case v1::ServerMessage::PAYLOAD_NOT_SET:
    default:
      return Invalid<runtime::ServerMessage>("empty server message");
  }
  result.ok = true;
  return result;
}

}  // namespace decksync::wire
