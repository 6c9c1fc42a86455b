// Repository: DeckSync
// Component: Proto Codec
// Purpose: Converts protocol messages between decksync.v1 protobuf and native types.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_WIRE_PROTO_CODEC_HPP_
#define DECKSYNC_WIRE_PROTO_CODEC_HPP_

#include <string>

#include "decksync.pb.h"
#include "decksync/runtime/Messages.h"
#include "decksync/timeline/DeckTypes.hpp"

namespace decksync::wire {

// Decoding never throws; malformed input comes back with ok == false and
// code == kInvalidPayload.
template <typename T>
struct DecodeResult {
  bool ok = false;
  timeline::ErrorCode code = timeline::ErrorCode::kNone;
  std::string message;
  T value{};
};

struct DecodedCommand {
  runtime::DeckCommand command;
  timeline::ClientRole role = timeline::ClientRole::kViewer;
};

class ProtoCodec {
 public:
  static void ToProto(const timeline::DeckTimelineState& state,
                      v1::DeckTimelineState* out);
  static timeline::DeckTimelineState FromProto(const v1::DeckTimelineState& in);

  static v1::DeckKey ToProto(timeline::DeckKey deck);
  static v1::ClientRole ToProto(timeline::ClientRole role);
  static v1::ErrorCode ToProto(timeline::ErrorCode code);
  static timeline::ErrorCode FromProto(v1::ErrorCode code);

  static v1::DeckCommand ToProto(const runtime::DeckCommand& command,
                                 timeline::ClientRole role);
  static DecodeResult<DecodedCommand> Decode(const v1::DeckCommand& in);

  static v1::CommandAck ToProto(const runtime::CommandResult& result);
  static DecodeResult<runtime::CommandResult> Decode(const v1::CommandAck& in);

  static v1::ServerMessage ToProto(const runtime::ServerMessage& message);
  static v1::FullStateResync ToProto(const runtime::FullStateResync& resync);
  static DecodeResult<runtime::ServerMessage> Decode(
      const v1::ServerMessage& in);
  static DecodeResult<runtime::FullStateResync> Decode(
      const v1::FullStateResync& in);

  // DECK_KEY_UNSPECIFIED and unknown values are rejected.
  static bool FromProto(v1::DeckKey in, timeline::DeckKey* out);
  static bool FromProto(v1::ClientRole in, timeline::ClientRole* out);
};

}  // namespace decksync::wire

#endif  // DECKSYNC_WIRE_PROTO_CODEC_HPP_
