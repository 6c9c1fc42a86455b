#include "decksync/surface/MediaTypes.hpp"

namespace decksync::surface {

const char* ToString(MediaEventKind kind) {
  switch (kind) {
    case MediaEventKind::kLoadedMetadata:
      return "loadedmetadata";
    case MediaEventKind::kCanPlay:
      return "canplay";
    case MediaEventKind::kPlaying:
      return "playing";
    case MediaEventKind::kPaused:
      return "paused";
    case MediaEventKind::kPlayRejected:
      return "play_rejected";
    case MediaEventKind::kPlayFailed:
      return "play_failed";
    case MediaEventKind::kWaiting:
      return "waiting";
    case MediaEventKind::kTimeUpdate:
      return "timeupdate";
    case MediaEventKind::kEnded:
      return "ended";
    case MediaEventKind::kDecodeError:
      return "decode_error";
    case MediaEventKind::kSourceMissing:
      return "source_missing";
  }
  return "unknown";
}

}  // namespace decksync::surface
