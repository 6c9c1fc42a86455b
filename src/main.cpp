// Repository: DeckSync
// Component: DeckSync Daemon
// Purpose: Hosts the DeckAuthority behind the DeckSync gRPC service.
// Copyright (c) 2025 DeckSync

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "decksync/runtime/DeckAuthority.h"
#include "decksync/timing/WallClock.h"
#include "decksync/util/Logger.hpp"
#include "service/DeckSyncService.h"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string listen = "0.0.0.0:50061";
  std::string epoch;
  bool help = false;
  bool valid = true;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Authoritative deck timeline server.\n"
            << "\n"
            << "  --listen ADDR        gRPC listen address (default: $DECKSYNC_LISTEN\n"
            << "                       or 0.0.0.0:50061)\n"
            << "  --epoch ID           Fixed authority epoch (default: random)\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "Set DECKSYNC_DEBUG=1 for per-command debug logs.\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  if (const char* env = std::getenv("DECKSYNC_LISTEN"); env != nullptr && *env) {
    args.listen = env;
  }
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
    } else if (arg == "--listen" && i + 1 < argc) {
      args.listen = argv[++i];
    } else if (arg == "--epoch" && i + 1 < argc) {
      args.epoch = argv[++i];
    } else {
      args.valid = false;
      args.error = "unknown or incomplete argument: " + arg;
      break;
    }
  }
  return args;
}

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

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  decksync::runtime::AuthorityConfig authority_config;
  authority_config.epoch = args.epoch;
  auto authority = std::make_shared<decksync::runtime::DeckAuthority>(
      decksync::timing::MakeSystemWallClock(), authority_config);
  decksync::service::DeckSyncServiceImpl service(authority);

  grpc::ServerBuilder builder;
  int bound_port = 0;
  builder.AddListeningPort(args.listen, grpc::InsecureServerCredentials(),
                           &bound_port);
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || bound_port == 0) {
    decksync::util::Logger::Error("[decksyncd] LISTEN_FAILED addr=" + args.listen);
    return 1;
  }
  {
    std::ostringstream oss;
    oss << "[decksyncd] LISTENING addr=" << args.listen
        << " port=" << bound_port << " epoch=" << authority->epoch();
    decksync::util::Logger::Info(oss.str());
  }

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  decksync::util::Logger::Info("[decksyncd] SHUTDOWN");
  service.Shutdown();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  return 0;
}
