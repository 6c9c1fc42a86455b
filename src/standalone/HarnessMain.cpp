// Repository: DeckSync
// Component: Scenario Harness
// Purpose: Replays a scripted scenario against an in-process authority and client session.
// Copyright (c) 2025 DeckSync
//
// Everything runs on one thread and a manual clock: the authority, one
// controller session with a primary and a mirror container per deck, and
// the simulated media backend. Output is deterministic for a given script.
//
// Script: one HarnessStep per line in protobuf JSON mapping, e.g.
//   {"command": {"deck": "DECK_KEY_A", "source": {"src": "clip.mp4"}}}
//   {"advanceMs": "500"}
//   {"fault": {"deck": "DECK_KEY_A", "kind": "decode_error"}}
// A command without commandId is issued by the local session (optimistic
// path); with one it is sent straight to the authority under its own role,
// as another client would.

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <google/protobuf/util/json_util.h>

#include "decksync.pb.h"
#include "decksync/runtime/DeckAuthority.h"
#include "decksync/runtime/DeckSession.h"
#include "decksync/runtime/DispatchQueue.h"
#include "decksync/surface/HeadlessRenderContainer.hpp"
#include "decksync/surface/SimulatedMediaBackend.hpp"
#include "decksync/timing/WallClock.h"
#include "decksync/wire/ProtoCodec.hpp"
#include "harness.pb.h"

namespace {

using decksync::runtime::CommandResult;
using decksync::runtime::DeckAuthority;
using decksync::runtime::DeckCommand;
using decksync::runtime::DeckSession;
using decksync::runtime::DispatchQueue;
using decksync::runtime::ServerMessage;
using decksync::surface::HeadlessRenderContainer;
using decksync::surface::MediaEventKind;
using decksync::surface::SimulatedMediaBackend;
using decksync::timeline::DeckKey;
using decksync::wire::ProtoCodec;

constexpr double kStepS = 0.010;
constexpr double kTickIntervalS = 0.250;

struct CliArgs {
  std::string script_path;  // empty: stdin
  double start_s = 1000.0;
  bool help = false;
  bool valid = true;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS] [SCRIPT]\n"
            << "\n"
            << "Replays a HarnessStep script (JSON lines, stdin when SCRIPT is\n"
            << "omitted) and prints every deck's final state.\n"
            << "\n"
            << "  --start-s SECONDS    Initial clock value (default: 1000)\n"
            << "  --help               Show this help message\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
    } else if (arg == "--start-s" && i + 1 < argc) {
      std::istringstream in(argv[++i]);
      if (!(in >> args.start_s)) {
        args.valid = false;
        args.error = "--start-s expects a number";
        break;
      }
    } else if (!arg.empty() && arg[0] != '-' && args.script_path.empty()) {
      args.script_path = arg;
    } else {
      args.valid = false;
      args.error = "unknown argument: " + arg;
      break;
    }
  }
  return args;
}

bool FaultKindFromName(const std::string& name, MediaEventKind* out) {
  if (name == "decode_error") {
    *out = MediaEventKind::kDecodeError;
  } else if (name == "source_missing") {
    *out = MediaEventKind::kSourceMissing;
  } else if (name == "play_failed") {
    *out = MediaEventKind::kPlayFailed;
  } else if (name == "stall") {
    *out = MediaEventKind::kWaiting;
  } else {
    return false;
  }
  return true;
}

class Harness {
 public:
  explicit Harness(double start_s)
      : clock_(std::make_shared<decksync::timing::ManualWallClock>(start_s)),
        queue_(std::make_shared<DispatchQueue>(clock_)),
        authority_(std::make_shared<DeckAuthority>(clock_)),
        backend_(std::make_shared<SimulatedMediaBackend>(queue_)) {
    DeckSession::Callbacks callbacks;
    callbacks.send_command = [this](const DeckCommand& command) {
      queue_->Post([this, command] {
        const CommandResult result = authority_->Apply(
            command, decksync::timeline::ClientRole::kController);
        session_->OnCommandResult(result);
      });
    };
    callbacks.request_resync = [this](DeckKey) {
      queue_->Post([this] { session_->OnServerMessage(authority_->Snapshot()); });
    };
    session_ = std::make_unique<DeckSession>(backend_, queue_,
                                             decksync::runtime::CoordinatorConfig{},
                                             callbacks);

    for (DeckKey deck : decksync::timeline::kAllDecks) {
      const std::string name = decksync::timeline::ToString(deck);
      primaries_.push_back(
          std::make_unique<HeadlessRenderContainer>("deck-" + name + "-primary"));
      mirrors_.push_back(
          std::make_unique<HeadlessRenderContainer>("deck-" + name + "-mirror"));
      session_->Deck(deck).AttachPrimary(primaries_.back().get());
      session_->Deck(deck).AddMirror(mirrors_.back().get());
    }

    auto subscription = authority_->Subscribe(
        [this](const decksync::runtime::DeckBroadcast& broadcast) {
          queue_->Post([this, broadcast] {
            session_->OnServerMessage(ServerMessage(broadcast));
          });
        });
    subscription_id_ = subscription.id;
    session_->OnServerMessage(ServerMessage(subscription.resync));
  }

  ~Harness() {
    authority_->Unsubscribe(subscription_id_);
    session_.reset();
  }

  bool RunStep(const decksync::harness::v1::HarnessStep& step, int line) {
    using decksync::harness::v1::HarnessStep;
    switch (step.step_case()) {
      case HarnessStep::kCommand:
        return RunCommand(step.command(), line);
      case HarnessStep::kAdvanceMs:
        Advance(static_cast<double>(step.advance_ms()) / 1000.0);
        return true;
      case HarnessStep::kFault:
        return InjectFault(step.fault(), line);
      case HarnessStep::kGesture:
        session_->OnUserGesture();
        queue_->RunDue();
        return true;
      case HarnessStep::STEP_NOT_SET:
      default:
        std::cerr << "line " << line << ": empty step\n";
        return false;
    }
  }

  void PrintStates() const {
    google::protobuf::util::JsonPrintOptions options;
    options.always_print_primitive_fields = true;
    for (DeckKey deck : decksync::timeline::kAllDecks) {
      decksync::v1::DeckBroadcast entry;
      entry.set_deck(ProtoCodec::ToProto(deck));
      ProtoCodec::ToProto(session_->Deck(deck).View(), entry.mutable_state());
      std::string json;
      const auto status =
          google::protobuf::util::MessageToJsonString(entry, &json, options);
      if (!status.ok()) {
        std::cerr << "deck " << decksync::timeline::ToString(deck)
                  << ": cannot print state: " << status.ToString() << "\n";
        continue;
      }
      auto& coordinator = session_->Deck(deck);
      std::cout << json << "\n"
                << "  surface=" << decksync::surface::ToString(coordinator.surface().state())
                << " position=" << coordinator.PositionNow() << "\n";
    }
  }

 private:
  bool RunCommand(const decksync::v1::DeckCommand& proto, int line) {
    auto decoded = ProtoCodec::Decode(proto);
    if (!decoded.ok) {
      std::cerr << "line " << line << ": " << decoded.message << "\n";
      return false;
    }
    const DeckCommand& command = decoded.value.command;
    if (command.intent.command_id.empty()) {
      const auto issued = session_->Issue(command.deck, command.intent.payload,
                                          command.expected_version);
      if (!issued.accepted) {
        std::cout << "line " << line << ": refused code="
                  << decksync::timeline::ToString(issued.code)
                  << " reason=" << issued.message << "\n";
      }
    } else {
      const CommandResult result = authority_->Apply(command, decoded.value.role);
      std::cout << "line " << line << ": ack accepted=" << result.accepted
                << " code=" << decksync::timeline::ToString(result.code)
                << " version=" << result.state.version << "\n";
    }
    queue_->RunDue();
    return true;
  }

  bool InjectFault(const decksync::harness::v1::FaultInjection& fault, int line) {
    DeckKey deck;
    MediaEventKind kind;
    if (!ProtoCodec::FromProto(fault.deck(), &deck) ||
        !FaultKindFromName(fault.kind(), &kind)) {
      std::cerr << "line " << line << ": bad fault injection\n";
      return false;
    }
    auto* primary = session_->Deck(deck).surface().Primary();
    if (primary == nullptr ||
        !backend_->InjectEvent(primary->Id(), kind, "injected by harness")) {
      std::cerr << "line " << line << ": deck has no live instance\n";
      return false;
    }
    queue_->RunDue();
    return true;
  }

  void Advance(double seconds) {
    double elapsed = 0.0;
    while (elapsed + 1e-9 < seconds) {
      clock_->Advance(kStepS);
      elapsed += kStepS;
      since_tick_s_ += kStepS;
      queue_->RunDue();
      if (since_tick_s_ + 1e-9 >= kTickIntervalS) {
        since_tick_s_ = 0.0;
        session_->Tick();
        queue_->RunDue();
      }
    }
  }

  std::shared_ptr<decksync::timing::ManualWallClock> clock_;
  std::shared_ptr<DispatchQueue> queue_;
  std::shared_ptr<DeckAuthority> authority_;
  std::shared_ptr<SimulatedMediaBackend> backend_;
  std::vector<std::unique_ptr<HeadlessRenderContainer>> primaries_;
  std::vector<std::unique_ptr<HeadlessRenderContainer>> mirrors_;
  std::unique_ptr<DeckSession> session_;
  DeckAuthority::SubscriptionId subscription_id_ = 0;
  double since_tick_s_ = 0.0;
};

}  // namespace

int main(int argc, char* argv[]) {
  const CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << args.error << "\n";
    PrintUsage(argv[0]);
    return 2;
  }

  std::ifstream file;
  if (!args.script_path.empty()) {
    file.open(args.script_path);
    if (!file) {
      std::cerr << "cannot open " << args.script_path << "\n";
      return 1;
    }
  }
  std::istream& in = args.script_path.empty() ? std::cin : file;

  Harness harness(args.start_s);
  std::string text;
  int line = 0;
  int failures = 0;
  while (std::getline(in, text)) {
    ++line;
    if (text.empty() || text[0] == '#') continue;
    decksync::harness::v1::HarnessStep step;
    const auto status = google::protobuf::util::JsonStringToMessage(text, &step);
    if (!status.ok()) {
      std::cerr << "line " << line << ": " << status.ToString() << "\n";
      ++failures;
      continue;
    }
    if (!harness.RunStep(step, line)) {
      ++failures;
    }
  }
  harness.PrintStates();
  return failures == 0 ? 0 : 1;
}
