/**
 * @file main.cpp
 * @brief Entry point for the errdedup command-line driver
 *
 * Reads error signals as JSON lines, runs them through the deduplication
 * service and prints one JSON decision per line followed by a statistics
 * summary.
 */

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "config/config.h"
#include "dedup/deduplication_service.h"
#include "signal/signal_json.h"
#include "utils/clock.h"
#include "utils/structured_log.h"
#include "version.h"

namespace {

constexpr const char* kLoggerName = "errdedup";
constexpr const char* kStdinSource = "<stdin>";

/**
 * @brief Apply level / format and switch to a file sink when configured
 *
 * stdout carries the decisions, so logs go to stderr or the file.
 */
bool ApplyLoggingConfig(const errdedup::config::LoggingConfig& logging) {
  if (!logging.file.empty()) {
    try {
      spdlog::drop(kLoggerName);
      spdlog::set_default_logger(spdlog::basic_logger_mt(kLoggerName, logging.file));
    } catch (const spdlog::spdlog_ex& e) {
      std::cerr << "Error: failed to open log file " << logging.file << ": " << e.what() << "\n";
      return false;
    }
  }

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::set_level(spdlog::level::from_str(logging.level));
  errdedup::utils::StructuredLog::SetFormat(logging.json ? errdedup::utils::LogFormat::JSON
                                                         : errdedup::utils::LogFormat::TEXT);
  return true;
}

nlohmann::json EntryToJson(const errdedup::cache::CachedEntry& entry) {
  return nlohmann::json{
      {"key", entry.key},
      {"code", entry.signal.code()},
      {"count", entry.count},
      {"firstSeen", errdedup::utils::ToEpochMillis(entry.first_seen)},
      {"lastSeen", errdedup::utils::ToEpochMillis(entry.last_seen)},
  };
}

nlohmann::json DecisionToJson(uint64_t line_number, const errdedup::dedup::DeduplicationResult& result) {
  nlohmann::json decision{
      {"line", line_number},
      {"isDuplicate", result.is_duplicate},
      {"shouldLog", result.should_log},
      {"shouldAlert", result.should_alert},
      {"deduplicationKey", result.deduplication_key},
  };
  if (result.entry) {
    decision["count"] = result.entry->count;
  }
  return decision;
}

nlohmann::json StatsToJson(const errdedup::cache::CacheStatisticsSnapshot& stats) {
  nlohmann::json json_stats{
      {"totalErrors", stats.total_errors},
      {"uniqueErrors", stats.unique_errors},
      {"duplicateErrors", stats.duplicate_errors},
      {"hitRate", stats.hit_rate},
      {"evictions", stats.evictions},
      {"expirations", stats.expirations},
  };
  json_stats["oldestError"] =
      stats.oldest_error ? nlohmann::json(errdedup::utils::ToEpochMillis(*stats.oldest_error)) : nlohmann::json();
  json_stats["newestError"] =
      stats.newest_error ? nlohmann::json(errdedup::utils::ToEpochMillis(*stats.newest_error)) : nlohmann::json();
  return json_stats;
}

void PrintConfigSummary(const errdedup::config::Config& config) {
  std::cout << "Configuration file is valid\n";
  std::cout << "\nConfiguration summary:\n";
  std::cout << "  Dedup:\n";
  std::cout << "    enabled: " << (config.dedup.enabled ? "true" : "false") << "\n";
  std::cout << "    ttl_ms: " << config.dedup.ttl_ms << "\n";
  std::cout << "    max_size: " << config.dedup.max_size << "\n";
  std::cout << "    similarity_threshold: " << config.dedup.similarity_threshold << "\n";
  std::cout << "    cleanup_interval_ms: " << config.dedup.cleanup_interval_ms << "\n";
  std::cout << "    max_context_depth: " << config.dedup.max_context_depth << "\n";
  std::cout << "  Logging:\n";
  std::cout << "    level: " << config.logging.level << "\n";
  std::cout << "    json: " << (config.logging.json ? "true" : "false") << "\n";
  std::cout << "    file: " << (config.logging.file.empty() ? "(stderr)" : config.logging.file) << "\n";
}

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [OPTIONS]\n";
  std::cout << "\n";
  std::cout << "Reads error signals (one JSON object per line) and prints a deduplication\n";
  std::cout << "decision for each, followed by a statistics line.\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -t, --config-test              Test configuration file and exit\n";
  std::cout << "  -i, --input <file>             Read signals from file (default: stdin)\n";
  std::cout << "      --top <n>                  Also print the n most frequent errors\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Signal format:\n";
  std::cout << R"(  {"code":"DB_ERROR","message":"Query failed","statusCode":500,"context":{"table":"users"}})"
            << "\n";
  std::cout << "\n";
  std::cout << "Example:\n";
  std::cout << "  " << program << " -c /etc/errdedup/config.yaml -i errors.jsonl --top 5\n";
}

}  // namespace

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit code
 */
int main(int argc, char* argv[]) {
  // Setup logging (stderr until the config says otherwise)
  spdlog::set_default_logger(spdlog::stderr_color_mt(kLoggerName));
  spdlog::set_level(spdlog::level::info);

  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  bool config_test_mode = false;
  const char* config_path = nullptr;
  const char* input_path = nullptr;
  size_t top_n = 0;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      std::cout << "errdedup version " << errdedup::Version::String() << "\n";
      std::cout << "Error signal deduplication and rate-tracking cache\n";
      return 0;
    }
    if (arg == "-t" || arg == "--config-test") {
      config_test_mode = true;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      } else {
        std::cerr << "Error: " << arg << " requires a file path\n";
        return 1;
      }
    } else if (arg == "-i" || arg == "--input") {
      if (i + 1 < argc) {
        input_path = argv[++i];
      } else {
        std::cerr << "Error: " << arg << " requires a file path\n";
        return 1;
      }
    } else if (arg == "--top") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --top requires a number\n";
        return 1;
      }
      try {
        top_n = std::stoul(argv[++i]);
      } catch (const std::exception&) {
        std::cerr << "Error: --top expects a non-negative integer (got: " << argv[i] << ")\n";
        return 1;
      }
    } else {
      std::cerr << "Error: Unknown option: " << arg << "\n";
      std::cerr << "Use -h or --help for usage information\n";
      return 1;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  if (config_test_mode && config_path == nullptr) {
    std::cerr << "Error: --config-test requires -c <config.yaml>\n";
    return 1;
  }

  // Load configuration
  errdedup::config::Config config;
  if (config_path != nullptr) {
    auto config_result = errdedup::config::LoadConfig(config_path);
    if (!config_result) {
      std::cerr << "Error: Failed to load config: " << config_result.error().to_string() << "\n";
      return 1;
    }
    config = *config_result;

    if (config_test_mode) {
      PrintConfigSummary(config);
      return 0;
    }
  }

  if (!ApplyLoggingConfig(config.logging)) {
    return 1;
  }

  spdlog::info("errdedup {} starting", errdedup::Version::String());
  if (config_path != nullptr) {
    spdlog::info("Configuration loaded from: {}", config_path);
  } else {
    spdlog::info("No configuration file specified, using defaults");
  }

  auto clock = std::make_shared<errdedup::utils::SystemClock>();
  auto service_result =
      errdedup::dedup::DeduplicationService::Create(errdedup::dedup::DeduplicationOptions::FromConfig(config.dedup),
                                                    clock);
  if (!service_result) {
    spdlog::error("Failed to start deduplication service: {}", service_result.error().to_string());
    return 1;
  }
  auto service = std::move(*service_result);

  std::ifstream input_file;
  if (input_path != nullptr) {
    input_file.open(input_path);
    if (!input_file) {
      spdlog::error("Failed to open input file: {}", input_path);
      return 1;
    }
  }
  std::istream& input = (input_path != nullptr) ? static_cast<std::istream&>(input_file) : std::cin;
  const std::string source = (input_path != nullptr) ? std::string(input_path) : std::string(kStdinSource);

  uint64_t line_number = 0;
  uint64_t rejected = 0;
  std::string line;
  while (std::getline(input, line)) {
    ++line_number;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;  // Blank line
    }

    auto parsed = errdedup::signal::ParseSignalLine(line, clock->Now());
    if (!parsed) {
      errdedup::utils::LogSignalParseError(source, line_number, parsed.error().message());
      ++rejected;
      continue;
    }

    auto result = service->Process(*parsed);
    std::cout << DecisionToJson(line_number, result).dump() << "\n";
  }

  nlohmann::json summary{{"stats", StatsToJson(service->GetStats())}, {"rejected", rejected}};
  if (top_n > 0) {
    nlohmann::json top = nlohmann::json::array();
    for (const auto& entry : service->GetMostFrequentErrors(top_n)) {
      top.push_back(EntryToJson(entry));
    }
    summary["top"] = std::move(top);
  }
  std::cout << summary.dump() << std::endl;

  service->Shutdown();
  spdlog::info("errdedup stopped ({} lines, {} rejected)", line_number, rejected);
  return 0;
}
