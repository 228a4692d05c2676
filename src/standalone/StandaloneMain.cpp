// Repository: Gamecast-commentary
// Component: Standalone Commentary Harness
// Purpose: Test harness that acts as a fake host for diagnostics
// Copyright (c) 2025 RetroVue
//
// This binary is for testing and diagnostics only.
// It is NOT the production gamecast_server executable.
// The session is unaware it is being run standalone: a logging voice session
// stands in for the realtime voice model, the video track is signalled
// immediately and, with --detect-every-ms, a synthetic detector reports the
// qualifying label at a fixed cadence.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "gamecast/audio/AudioTypes.hpp"
#include "gamecast/config/SessionConfig.hpp"
#include "gamecast/session/CommentarySession.hpp"
#include "gamecast/session/IVoiceSession.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// Logging voice session
// =============================================================================
class LoggingVoiceSession : public gamecast::session::IVoiceSession {
 public:
  bool IsConnected() const override { return true; }

  bool SendAudio(const gamecast::audio::AudioChunk& chunk,
                 const std::string& mime_type) override {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_++;
    bytes_ += chunk.data.size();
    audio_us_ += chunk.DurationUs();
    mime_type_ = mime_type;
    return true;
  }

  bool SendPrompt(const std::string& text) override {
    std::cout << "[PROMPT] " << text << std::endl;
    std::lock_guard<std::mutex> lock(mutex_);
    prompts_++;
    return true;
  }

  void PrintSummary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "[HARNESS] prompts=" << prompts_
              << " chunks=" << chunks_
              << " bytes=" << bytes_
              << " audio_ms=" << audio_us_ / 1000
              << " format=" << (mime_type_.empty() ? "-" : mime_type_) << std::endl;
  }

 private:
  mutable std::mutex mutex_;
  uint64_t prompts_ = 0;
  uint64_t chunks_ = 0;
  uint64_t bytes_ = 0;
  int64_t audio_us_ = 0;
  std::string mime_type_;
};

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  gamecast::config::SessionConfig config;
  int64_t duration_s = 0;        // 0 = until signal
  int64_t detect_every_ms = 0;   // 0 = no synthetic detections
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --video PATH [OPTIONS]\n"
            << "\n"
            << "Standalone commentary harness for testing and diagnostics.\n"
            << "Acts as a fake host - prompts are printed, audio is counted.\n"
            << "\n"
            << "  --video PATH          Media file whose audio is fed (required)\n"
            << "  --team1 NAME          First team (default: Green Bay Packers)\n"
            << "  --team2 NAME          Second team (default: Chicago Bears)\n"
            << "  --fav-team NAME       Favorite team (default: none)\n"
            << "  --level LEVEL         beginner | intermediate | expert\n"
            << "  --style STYLE         enthusiastic | analytical | casual | roasting\n"
            << "  --strategy KIND       periodic | event\n"
            << "  --detect-every-ms N   Report a qualifying detection every N ms\n"
            << "  --duration-s N        Stop after N seconds (default: until Ctrl-C)\n"
            << "  --help                Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --video match.mp4 --style roasting\n"
            << "  " << program_name << " --video match.mp4 --strategy event --detect-every-ms 1000\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  using namespace gamecast::config;
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--video" && i + 1 < argc) {
      args.config.feed.source_uri = argv[++i];
    } else if (arg == "--team1" && i + 1 < argc) {
      args.config.team1 = argv[++i];
    } else if (arg == "--team2" && i + 1 < argc) {
      args.config.team2 = argv[++i];
    } else if (arg == "--fav-team" && i + 1 < argc) {
      args.config.favorite_team = argv[++i];
    } else if (arg == "--level" && i + 1 < argc) {
      auto level = ParseKnowledgeLevel(argv[++i]);
      if (!level) {
        args.error = std::string("Unknown level: ") + argv[i];
        return args;
      }
      args.config.level = *level;
    } else if (arg == "--style" && i + 1 < argc) {
      auto style = ParseCommentaryStyle(argv[++i]);
      if (!style) {
        args.error = std::string("Unknown style: ") + argv[i];
        return args;
      }
      args.config.style = *style;
    } else if (arg == "--strategy" && i + 1 < argc) {
      auto kind = ParseStrategyKind(argv[++i]);
      if (!kind) {
        args.error = std::string("Unknown strategy: ") + argv[i];
        return args;
      }
      args.config.strategy = *kind;
    } else if (arg == "--detect-every-ms" && i + 1 < argc) {
      args.detect_every_ms = std::atoll(argv[++i]);
    } else if (arg == "--duration-s" && i + 1 < argc) {
      args.duration_s = std::atoll(argv[++i]);
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.config.feed.source_uri.empty()) {
    args.error = "--video is required";
    return args;
  }
  if (args.duration_s < 0 || args.detect_every_ms < 0) {
    args.error = "--duration-s and --detect-every-ms must not be negative";
    return args;
  }

  ConfigValidation validation = ValidateSessionConfig(args.config);
  if (!validation.valid) {
    args.error = validation.detail;
    return args;
  }

  args.valid = true;
  return args;
}

int RunHarness(const CliArgs& args) {
  auto voice = std::make_shared<LoggingVoiceSession>();
  auto deps = gamecast::session::SessionDependencies::Production();
  auto time_source = deps.time_source;

  gamecast::session::CommentarySession session("standalone", args.config, voice, std::move(deps));

  std::cout << "[HARNESS] " << args.config.team1 << " vs " << args.config.team2
            << " style=" << gamecast::config::ToString(args.config.style)
            << " level=" << gamecast::config::ToString(args.config.level)
            << " strategy=" << gamecast::config::ToString(args.config.strategy) << std::endl;

  gamecast::session::SessionResult started =
      session.SignalTrack(gamecast::session::TrackKind::kVideo);
  if (!started.ok) {
    std::cerr << "[HARNESS] " << started.message << std::endl;
  }

  const int64_t start_ms = time_source->NowMs();
  int64_t next_detection_ms = start_ms;
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    const int64_t now_ms = time_source->NowMs();
    if (args.duration_s > 0 && now_ms - start_ms >= args.duration_s * 1000) {
      break;
    }
    if (args.detect_every_ms > 0 && now_ms >= next_detection_ms) {
      gamecast::commentary::DetectionEvent event;
      event.objects.push_back({args.config.event.qualifying_label, 1.0});
      session.ReportDetections(event);
      next_detection_ms = now_ms + args.detect_every_ms;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  std::cout << "[HARNESS] Ending session" << std::endl;
  session.End();
  voice->PrintSummary();
  return started.ok ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
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

  return RunHarness(args);
}
