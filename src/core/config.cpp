#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

namespace {

// Upper bound for a single poll. A reader blocks for at most
// poll_timeout_ms * retry_attempts inside one next_key_value() call.
constexpr uint64_t MAX_POLL_TIMEOUT_MS = 300000;

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.client", LogComponent::IO_CLIENT},
    {"reader.lifecycle", LogComponent::READER_LIFECYCLE},
    {"reader.fetch", LogComponent::READER_FETCH},
    {"reader.range", LogComponent::READER_RANGE}};

bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return val_str == "true" || val_str == "1" || val_str == "yes" ||
         val_str == "on";
}

template <typename T>
T parse_number_or_throw(const std::string &key, const std::string &value) {
  // string_to_number reads an empty field as zero, which would silently
  // turn "starting_offset =" into offset 0.
  if (value.empty())
    throw std::invalid_argument("missing value for " + key);
  auto parsed = Utils::string_to_number<T>(value);
  if (!parsed)
    throw std::invalid_argument("not a valid number for " + key);
  return *parsed;
}

} // namespace

AppConfig::AppConfig() {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

bool validate_reader_config(const ReaderConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.poll_timeout_ms > MAX_POLL_TIMEOUT_MS) {
    errors.push_back("Reader poll_timeout_ms must not exceed " +
                     std::to_string(MAX_POLL_TIMEOUT_MS));
    valid = false;
  }

  if (config.retry_attempts == 0) {
    errors.push_back("Reader retry_attempts must be at least 1");
    valid = false;
  }

  if (config.max_batch_size == 0) {
    errors.push_back("Reader max_batch_size must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_split_config(const SplitConfig &config,
                           std::vector<std::string> &errors) {
  bool valid = true;

  if (config.topic.empty()) {
    errors.push_back("Split topic cannot be empty");
    valid = false;
  }

  if (config.partition < 0) {
    errors.push_back("Split partition must be non-negative");
    valid = false;
  }

  if (config.starting_offset < 0) {
    errors.push_back("Split starting_offset must be non-negative");
    valid = false;
  }

  if (config.ending_offset < config.starting_offset) {
    errors.push_back("Split ending_offset must not be lower than "
                     "starting_offset");
    valid = false;
  }

  return valid;
}

bool validate_kafka_client_config(const KafkaClientConfig &config,
                                  std::vector<std::string> &errors) {
  bool valid = true;

  if (config.bootstrap_servers.empty()) {
    errors.push_back("KafkaClient bootstrap.servers cannot be empty");
    valid = false;
  }

  // librdkafka refuses to create a KafkaConsumer without a group id even
  // when only manual assignment is used.
  if (config.group_id.empty()) {
    errors.push_back("KafkaClient group.id cannot be empty");
    valid = false;
  }

  if (config.properties.count("enable.auto.commit") &&
      string_to_bool(config.properties.at("enable.auto.commit"))) {
    errors.push_back("KafkaClient enable.auto.commit must stay disabled for "
                     "manually assigned ranges");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  valid &= validate_reader_config(config.reader, errors);
  valid &= validate_kafka_client_config(config.kafka_client, errors);

  // The split section is optional for library users; validate it only once
  // somebody started filling it in.
  if (!config.split.topic.empty())
    valid &= validate_split_config(config.split, errors);

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::clog << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      if (current_section == Sections::READER) {
        if (key == Keys::RD_POLL_TIMEOUT_MS)
          config.reader.poll_timeout_ms =
              parse_number_or_throw<uint64_t>(key, value);
        else if (key == Keys::RD_RETRY_ATTEMPTS)
          config.reader.retry_attempts =
              parse_number_or_throw<uint32_t>(key, value);
        else if (key == Keys::RD_MAX_BATCH_SIZE)
          config.reader.max_batch_size =
              parse_number_or_throw<size_t>(key, value);
        else
          config.custom_settings[current_section + "." + key] = value;

      } else if (current_section == Sections::SPLIT) {
        if (key == Keys::SP_TOPIC)
          config.split.topic = value;
        else if (key == Keys::SP_PARTITION)
          config.split.partition = parse_number_or_throw<int32_t>(key, value);
        else if (key == Keys::SP_STARTING_OFFSET)
          config.split.starting_offset =
              parse_number_or_throw<int64_t>(key, value);
        else if (key == Keys::SP_ENDING_OFFSET)
          config.split.ending_offset =
              parse_number_or_throw<int64_t>(key, value);
        else
          config.custom_settings[current_section + "." + key] = value;

      } else if (current_section == Sections::KAFKA_CLIENT) {
        if (key == Keys::KC_BOOTSTRAP_SERVERS)
          config.kafka_client.bootstrap_servers = value;
        else if (key == Keys::KC_GROUP_ID)
          config.kafka_client.group_id = value;
        else
          config.kafka_client.properties[key] = value;

      } else if (current_section == Sections::LOGGING) {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = level;
        } else {
          auto it = key_to_component_map.find(key);
          if (it != key_to_component_map.end())
            config.logging.log_levels[it->second] = string_to_log_level(value);
          else
            std::cerr << "Warning (Config Line " << line_num
                      << "): Unknown logging component '" << key << "'"
                      << std::endl;
        }

      } else if (current_section.empty()) {
        config.custom_settings[key] = value;
      } else {
        config.custom_settings[current_section + "." + key] = value;
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  config_file.close();
  std::clog << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::clog << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
