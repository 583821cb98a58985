#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/input_split.hpp"
#include "core/logger.hpp"
#include "core/metrics_manager.hpp"
#include "io/clients/kafka_partition_client.hpp"
#include "reader/base_record_reader.hpp"
#include "reader/offset_range_reader.hpp"
#include "utils/utils.hpp"

#include "nlohmann/json.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_FETCH_ERROR = 2;

// Progress is logged every this many records.
constexpr uint64_t PROGRESS_LOG_INTERVAL = 10000;

std::atomic<bool> g_shutdown_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
}

json record_to_json(const range_reader::Record &record) {
  json j;
  j["topic"] = record.topic_partition.topic;
  j["partition"] = record.topic_partition.partition;
  j["offset"] = record.offset;
  j["timestamp_ms"] = record.timestamp_ms;
  j["key"] = record.key ? json(*record.key) : json(nullptr);
  j["value"] = record.value ? json(*record.value) : json(nullptr);
  return j;
}

void print_usage(const char *program) {
  std::cerr << "Usage: " << program << " <config.ini> [--metrics-json]"
            << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return EXIT_CONFIG_ERROR;
  }

  const std::string config_file_to_load = argv[1];
  bool dump_metrics = false;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--metrics-json") {
      dump_metrics = true;
    } else {
      print_usage(argv[0]);
      return EXIT_CONFIG_ERROR;
    }
  }

  Config::ConfigManager config_manager;
  if (!config_manager.load_configuration(config_file_to_load)) {
    std::cerr << "Cannot read a range without a valid configuration."
              << std::endl;
    return EXIT_CONFIG_ERROR;
  }
  auto config = config_manager.get_config();
  LogManager::instance().configure(config->logging);

  std::vector<std::string> split_errors;
  if (!Config::validate_split_config(config->split, split_errors)) {
    for (const auto &error : split_errors)
      LOG(LogLevel::ERROR, LogComponent::CONFIG, error);
    return EXIT_CONFIG_ERROR;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  const range_reader::PartitionSplit split(
      {config->split.topic, config->split.partition},
      config->split.starting_offset, config->split.ending_offset);

  range_reader::OffsetRangeReader reader(
      range_reader::make_kafka_client_factory(config->reader.max_batch_size));

  int exit_code = 0;
  uint64_t delivered = 0;
  const uint64_t started_ms = Utils::get_current_time_ms();
  {
    range_reader::ReaderCloseGuard guard(reader);
    try {
      reader.initialize(split, *config);

      while (!g_shutdown_requested) {
        if (!reader.next_key_value()) {
          if (reader.state() == range_reader::ReaderState::EXHAUSTED)
            break;
          // Pending offsets but nothing arrived within the retry budget.
          LOG(LogLevel::WARN, LogComponent::CORE,
              "No records available yet for " << split.describe()
                                              << ", polling again.");
          continue;
        }

        std::cout << record_to_json(*reader.current_record()).dump()
                  << std::endl;
        if (++delivered % PROGRESS_LOG_INTERVAL == 0)
          LOG(LogLevel::INFO, LogComponent::CORE,
              "Delivered " << delivered << " records, progress "
                           << reader.progress());
      }

      if (g_shutdown_requested)
        LOG(LogLevel::INFO, LogComponent::CORE,
            "Shutdown requested, stopping at offset "
                << reader.current_offset());
    } catch (const range_reader::InvalidSplitError &e) {
      LOG(LogLevel::FATAL, LogComponent::CORE, "Invalid split: " << e.what());
      exit_code = EXIT_CONFIG_ERROR;
    } catch (const range_reader::ReaderError &e) {
      LOG(LogLevel::FATAL, LogComponent::CORE,
          "Reading " << split.describe() << " failed: " << e.what());
      exit_code = EXIT_FETCH_ERROR;
    }
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Delivered " << delivered << " records from " << split.describe()
                   << " in " << (Utils::get_current_time_ms() - started_ms)
                   << " ms, progress " << reader.progress());

  if (dump_metrics)
    std::cerr << MetricsManager::instance().expose_as_json() << std::endl;

  return exit_code;
}
