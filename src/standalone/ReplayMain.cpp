// Repository: SkipTV
// Component: Replay Harness
// Purpose: Drives the real device orchestrator over a scripted lounge
//          transport and file-backed segment data. Every outbound command is
//          logged.
// Copyright (c) 2026 SkipTV
//
// Usage:
//   skiptv_replay --config <path> --events <path> [--segments <path>]
//                 [--channels <path>] [--duration-ms <ms>]

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "ReplaySources.hpp"
#include "ScriptedTransport.hpp"
#include "skiptv/cache/TtlLruCache.hpp"
#include "skiptv/config/EngineConfig.hpp"
#include "skiptv/runtime/DeviceOrchestrator.hpp"
#include "skiptv/segments/SegmentResolver.hpp"
#include "skiptv/timing/ITimeSource.hpp"
#include "skiptv/util/Logger.hpp"

namespace {

using skiptv::util::Logger;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string config_path;
  std::string events_path;
  std::string segments_path;
  std::string channels_path;
  int64_t duration_ms = 0;  // 0: run until signalled
  bool show_help = false;
  bool valid = true;
  std::string error;
};

void PrintUsage(const char* prog) {
  std::cerr << "Usage: " << prog << " \\\n"
            << "  --config <path>       engine config JSON\n"
            << "  --events <path>       JSONL event script\n"
            << "  [--segments <path>]   JSONL raw segments\n"
            << "  [--channels <path>]   JSONL video to channel map\n"
            << "  [--duration-ms <ms>]  stop after this long (default: until SIGINT)\n";
}

CliArgs ParseArgs(int argc, char** argv) {
  CliArgs args;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.show_help = true;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--events" && i + 1 < argc) {
      args.events_path = argv[++i];
    } else if (arg == "--segments" && i + 1 < argc) {
      args.segments_path = argv[++i];
    } else if (arg == "--channels" && i + 1 < argc) {
      args.channels_path = argv[++i];
    } else if (arg == "--duration-ms" && i + 1 < argc) {
      try {
        args.duration_ms = std::stoll(argv[++i]);
      } catch (const std::exception&) {
        args.valid = false;
        args.error = "--duration-ms expects an integer";
        return args;
      }
    } else {
      args.valid = false;
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.show_help) return args;
  if (args.config_path.empty() || args.events_path.empty()) {
    args.valid = false;
    args.error = "--config and --events are required";
  } else if (args.duration_ms < 0) {
    args.valid = false;
    args.error = "--duration-ms must not be negative";
  }
  return args;
}

bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path);
  if (!in.good()) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  *out = ss.str();
  return true;
}

// Calls parse(line) for every non-blank, non-comment line. Returns false and
// reports the offending line on the first parse failure.
template <typename T, typename ParseFn>
bool LoadJsonLines(const std::string& path, ParseFn parse, std::vector<T>* out) {
  std::ifstream in(path);
  if (!in.good()) {
    std::cerr << "Error: cannot open " << path << "\n";
    return false;
  }
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const size_t first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') continue;
    auto parsed = parse(line);
    if (!parsed) {
      std::cerr << "Error: " << path << ":" << line_no << ": unparseable line\n";
      return false;
    }
    out->push_back(std::move(*parsed));
  }
  return true;
}

void LogSummary(const skiptv::runtime::DeviceOrchestrator& orchestrator,
                const skiptv::standalone::ScriptedTransport& transport) {
  for (const auto& snapshot : orchestrator.Snapshots()) {
    std::ostringstream oss;
    oss << "[Replay] SESSION device=" << snapshot.device_name
        << " events=" << snapshot.events_total
        << " unknown=" << snapshot.unknown_events_total
        << " malformed=" << snapshot.malformed_events_total
        << " subscribes=" << snapshot.subscribe_attempts_total
        << " watchdog_expired=" << snapshot.watchdog_expired_total
        << " reconnects=" << snapshot.reconnect_total
        << " forced_disconnects=" << snapshot.forced_disconnect_total;
    Logger::Info(oss.str());
  }
  std::ostringstream oss;
  oss << "[Replay] COMMANDS total=" << transport.commands_sent();
  Logger::Info(oss.str());
}

}  // namespace

int main(int argc, char** argv) {
  namespace cache = skiptv::cache;
  namespace segments = skiptv::segments;
  namespace standalone = skiptv::standalone;

  CliArgs args = ParseArgs(argc, argv);
  if (args.show_help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::string config_text;
  if (!ReadFile(args.config_path, &config_text)) {
    std::cerr << "Error: cannot read config " << args.config_path << "\n";
    return 1;
  }
  auto config = skiptv::config::EngineConfig::FromJson(config_text);
  if (!config) {
    std::cerr << "Error: invalid config " << args.config_path
              << " (a non-empty devices list with screen_id is required)\n";
    return 1;
  }
  const auto problems = config->Validate();
  if (!problems.empty()) {
    for (const auto& problem : problems) {
      std::cerr << "Error: config: " << problem << "\n";
    }
    return 1;
  }
  Logger::SetDebugEnabled(config->debug);

  std::vector<standalone::ScriptEntry> script;
  if (!LoadJsonLines(args.events_path, standalone::ParseScriptLine, &script)) return 1;

  std::vector<standalone::SegmentLine> segment_lines;
  if (!args.segments_path.empty() &&
      !LoadJsonLines(args.segments_path, standalone::ParseSegmentLine, &segment_lines)) {
    return 1;
  }

  std::vector<std::pair<std::string, std::string>> channel_lines;
  if (!args.channels_path.empty() &&
      !LoadJsonLines(args.channels_path, standalone::ParseChannelLine, &channel_lines)) {
    return 1;
  }

  auto time_source = std::make_shared<skiptv::timing::SystemTimeSource>();
  auto segment_cache = std::make_shared<segments::SegmentCache>(
      static_cast<size_t>(config->segment_cache_capacity),
      std::chrono::seconds(config->segment_cache_ttl_s), time_source);
  auto channel_cache = std::make_shared<segments::ChannelCache>(
      static_cast<size_t>(config->channel_cache_capacity),
      std::chrono::seconds(config->channel_cache_ttl_s), time_source);

  std::shared_ptr<segments::IChannelLookup> channel_lookup;
  if (config->WhitelistEnabled()) {
    if (channel_lines.empty()) {
      Logger::Warn("[Replay] channel_whitelist set but no --channels file; whitelist inactive");
    } else {
      channel_lookup = std::make_shared<standalone::FileChannelLookup>(
          std::map<std::string, std::string>(channel_lines.begin(), channel_lines.end()));
    }
  }

  auto resolver = std::make_shared<segments::SegmentResolver>(
      std::make_shared<standalone::FileSegmentProvider>(std::move(segment_lines)),
      channel_lookup, segment_cache, channel_cache, config->ToResolverOptions());
  auto transport = std::make_shared<standalone::ScriptedTransport>(std::move(script));
  auto reporter = std::make_shared<standalone::LoggingViewedReporter>();

  skiptv::runtime::DeviceOrchestrator orchestrator(config->devices, config->ToSessionPolicy(),
                                                   transport, resolver, reporter, time_source);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  orchestrator.Start();

  const auto started = std::chrono::steady_clock::now();
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    if (args.duration_ms > 0 &&
        std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(args.duration_ms)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  if (g_termination_requested.load(std::memory_order_acquire)) {
    Logger::Info("[Replay] Termination requested, shutting down");
  }
  orchestrator.Shutdown();
  LogSummary(orchestrator, *transport);
  return 0;
}
