// Repository: Reelkit-playlist
// Component: reelkitd
// Purpose: Hosts one playlist controller with FFmpeg-backed renderers and
//          serves the PlaylistControl gRPC API.
// Copyright (c) 2025 RetroVue

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "PlaylistControlService.h"
#include "reelkit/bandwidth/BandwidthEstimator.hpp"
#include "reelkit/config/PlaylistConfig.hpp"
#include "reelkit/image/FFmpegImageDecoder.hpp"
#include "reelkit/image/ImageCache.hpp"
#include "reelkit/playlist/PlaylistController.hpp"
#include "reelkit/render/FFmpegMediaRenderer.hpp"
#include "reelkit/runtime/EventLoop.hpp"
#include "reelkit/time/SystemTimeSource.hpp"
#include "reelkit/util/Logger.hpp"

namespace {

using reelkit::util::LogLine;
using reelkit::util::Logger;

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
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string listen_address = "127.0.0.1:50061";
  std::string controller_id;
  int backward_buffer = -1;  // -1 = config / env
  int forward_buffer = -1;
  int image_cache_capacity = -1;
  std::string advance_mode;
  bool focused = false;
  bool no_adaptive = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Playlist playback daemon.  Serves the PlaylistControl gRPC API.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --listen ADDR              gRPC listen address (default: 127.0.0.1:50061)\n"
            << "  --id ID                    Controller id (default: generated)\n"
            << "  --backward-buffer N        Renderers kept behind the current item\n"
            << "  --forward-buffer N         Renderers kept ahead of the current item\n"
            << "  --image-cache-capacity N   Decoded images kept in memory\n"
            << "  --advance-mode MODE        auto_advance | loop_current\n"
            << "  --focused                  Start focused and playing\n"
            << "  --no-adaptive              Ignore bandwidth reports for window sizing\n"
            << "  --help                     Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  REELKIT_BACKWARD_BUFFER, REELKIT_FORWARD_BUFFER,\n"
            << "  REELKIT_SETTLE_DELAY_MS, REELKIT_ITEMS_DEBOUNCE_MS,\n"
            << "  REELKIT_IMAGE_CACHE_CAPACITY, REELKIT_ADAPTIVE_BUFFERING,\n"
            << "  REELKIT_DEBUG (verbose logging)\n"
            << "  Command-line options take precedence.\n"
            << "\n";
}

bool ParseNonNegative(const std::string& text, int* out) {
  try {
    size_t consumed = 0;
    const int value = std::stoi(text, &consumed);
    if (consumed != text.size() || value < 0) return false;
    *out = value;
    return true;
  } catch (const std::exception&) {
    return false;
  }
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
    } else if (arg == "--id" && i + 1 < argc) {
      args.controller_id = argv[++i];
    } else if (arg == "--backward-buffer" && i + 1 < argc) {
      if (!ParseNonNegative(argv[++i], &args.backward_buffer)) {
        args.error = "--backward-buffer requires a non-negative integer";
        return args;
      }
    } else if (arg == "--forward-buffer" && i + 1 < argc) {
      if (!ParseNonNegative(argv[++i], &args.forward_buffer)) {
        args.error = "--forward-buffer requires a non-negative integer";
        return args;
      }
    } else if (arg == "--image-cache-capacity" && i + 1 < argc) {
      if (!ParseNonNegative(argv[++i], &args.image_cache_capacity)) {
        args.error = "--image-cache-capacity requires a non-negative integer";
        return args;
      }
    } else if (arg == "--advance-mode" && i + 1 < argc) {
      args.advance_mode = argv[++i];
    } else if (arg == "--focused") {
      args.focused = true;
    } else if (arg == "--no-adaptive") {
      args.no_adaptive = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (!args.advance_mode.empty() &&
      !reelkit::config::ParseAdvanceMode(args.advance_mode)) {
    args.error = "Unknown advance mode: " + args.advance_mode;
    return args;
  }

  args.valid = true;
  return args;
}

reelkit::config::PlaylistConfig BuildConfig(const CliArgs& args) {
  reelkit::config::PlaylistConfig config;
  reelkit::config::ApplyEnvOverrides(config);
  if (args.backward_buffer >= 0) config.backward_buffer = args.backward_buffer;
  if (args.forward_buffer >= 0) config.forward_buffer = args.forward_buffer;
  if (args.image_cache_capacity >= 0) {
    config.image_cache_capacity = args.image_cache_capacity;
  }
  if (!args.advance_mode.empty()) {
    config.advance_mode = *reelkit::config::ParseAdvanceMode(args.advance_mode);
  }
  if (args.no_adaptive) config.adaptive_buffering = false;
  if (!reelkit::config::Normalize(config)) {
    Logger::Warn(LogLine("reelkitd", "CONFIG_NORMALIZED").Str());
  }
  return config;
}

int Run(const CliArgs& args) {
  const reelkit::config::PlaylistConfig config = BuildConfig(args);

  reelkit::time::SystemTimeSource clock;
  reelkit::runtime::EventLoop loop("PlaylistLoop");

  auto image_cache = std::make_unique<reelkit::image::ImageCache>(
      std::make_shared<reelkit::image::FFmpegImageDecoder>(),
      static_cast<size_t>(config.image_cache_capacity));

  reelkit::render::FFmpegRendererConfig renderer_config;
  renderer_config.read_ahead_s = config.video_forward_buffer_s;
  reelkit::render::FFmpegRendererFactory renderer_factory(renderer_config);

  std::unique_ptr<reelkit::bandwidth::BandwidthEstimator> estimator;
  if (config.adaptive_buffering) {
    estimator = std::make_unique<reelkit::bandwidth::BandwidthEstimator>(
        &clock, std::chrono::milliseconds(config.bandwidth_window_ms));
  }

  reelkit::playlist::PlaylistController::Options options;
  options.id = args.controller_id;
  options.is_focused = args.focused;
  options.is_playing = args.focused;

  reelkit::playlist::PlaylistController::Dependencies deps;
  deps.executor = &loop;
  deps.renderer_factory = &renderer_factory;
  deps.image_cache = image_cache.get();
  deps.time_source = &clock;
  deps.bandwidth = estimator.get();

  // The controller lives on the loop thread: build and destroy it there.
  std::unique_ptr<reelkit::playlist::PlaylistController> controller;
  std::string construct_error;
  loop.InvokeAndWait([&] {
    try {
      controller = std::make_unique<reelkit::playlist::PlaylistController>(
          options, deps, config);
    } catch (const std::exception& e) {
      construct_error = e.what();
    }
  });
  if (!controller) {
    Logger::Error(LogLine("reelkitd", "CONTROLLER_FAILED")
                      .Kv("error", construct_error)
                      .Str());
    return 1;
  }

  auto service = std::make_unique<reelkit::service::PlaylistControlImpl>(
      &loop, controller.get(), estimator.get());

  grpc::ServerBuilder builder;
  int bound_port = 0;
  builder.AddListeningPort(args.listen_address,
                           grpc::InsecureServerCredentials(), &bound_port);
  builder.RegisterService(service.get());
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || bound_port == 0) {
    Logger::Error(LogLine("reelkitd", "LISTEN_FAILED")
                      .Kv("address", args.listen_address)
                      .Str());
    service.reset();
    loop.InvokeAndWait([&] { controller.reset(); });
    return 1;
  }

  Logger::Info(LogLine("reelkitd", "LISTENING")
                   .Kv("address", args.listen_address)
                   .Kv("controller_id", controller->Id())
                   .Kv("backward", config.backward_buffer)
                   .Kv("forward", config.forward_buffer)
                   .Kv("adaptive", config.adaptive_buffering)
                   .Kv("advance_mode", reelkit::config::AdvanceModeName(
                                           config.advance_mode))
                   .Str());

  // Closes the bandwidth aggregation window when reports stop arriving.
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    if (estimator) estimator->Poll();
  }

  Logger::Info(LogLine("reelkitd", "SHUTDOWN_REQUESTED").Str());
  service->CloseEventStreams();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  server->Wait();
  service.reset();
  loop.InvokeAndWait([&] { controller.reset(); });
  loop.Stop();
  Logger::Info(LogLine("reelkitd", "STOPPED").Str());
  return 0;
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

  return Run(args);
}
