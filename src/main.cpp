// Repository: Gamecast-commentary
// Component: Commentary Engine Server
// Purpose: Hosts the CommentaryControl gRPC service for the call-hosting framework.
// Copyright (c) 2025 RetroVue

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "commentary_service.h"
#include "gamecast/session/CommentarySession.hpp"
#include "gamecast/util/Logger.hpp"

namespace {

constexpr char kDefaultListenAddress[] = "127.0.0.1:50071";

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string listen_address = kDefaultListenAddress;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Commentary engine: audio feed and commentary scheduling behind a\n"
            << "CommentaryControl gRPC service.\n"
            << "\n"
            << "  --listen ADDR   Listen address (default: " << kDefaultListenAddress << ")\n"
            << "  --help          Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  GAMECAST_DEBUG  Enable debug logging when set\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--listen" && i + 1 < argc) {
      args.listen_address = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.listen_address.empty()) {
    args.error = "--listen requires an address";
    return args;
  }

  args.valid = true;
  return args;
}

}  // namespace

int main(int argc, char* argv[]) {
  using gamecast::util::Logger;

  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  gamecast::control::CommentaryControlImpl service(
      gamecast::session::SessionDependencies::Production());

  grpc::ServerBuilder builder;
  builder.AddListeningPort(args.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    Logger::Error("[Server] Failed to listen on " + args.listen_address);
    return 1;
  }
  Logger::Info("[Server] CommentaryControl listening on " + args.listen_address);

  // Signal handlers only raise the flag; shutdown happens here.
  std::thread shutdown_watcher([&server, &service]() {
    while (!g_termination_requested.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    Logger::Info("[Server] Termination requested, ending sessions");
    // Closing the output channels releases any open subscriber streams
    // before the server waits for in-flight RPCs.
    service.EndAllSessions();
    server->Shutdown();
  });

  server->Wait();
  g_termination_requested.store(true, std::memory_order_release);
  shutdown_watcher.join();

  Logger::Info("[Server] Stopped");
  return 0;
}
