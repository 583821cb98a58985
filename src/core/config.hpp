#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Reader Settings
constexpr const char *RD_POLL_TIMEOUT_MS = "poll_timeout_ms";
constexpr const char *RD_RETRY_ATTEMPTS = "retry_attempts";
constexpr const char *RD_MAX_BATCH_SIZE = "max_batch_size";

// Split Settings
constexpr const char *SP_TOPIC = "topic";
constexpr const char *SP_PARTITION = "partition";
constexpr const char *SP_STARTING_OFFSET = "starting_offset";
constexpr const char *SP_ENDING_OFFSET = "ending_offset";

// Kafka client settings which are interpreted by the reader itself. Every
// other key of the section is handed to librdkafka untouched.
constexpr const char *KC_BOOTSTRAP_SERVERS = "bootstrap.servers";
constexpr const char *KC_GROUP_ID = "group.id";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

namespace Sections {
constexpr const char *READER = "Reader";
constexpr const char *SPLIT = "Split";
constexpr const char *KAFKA_CLIENT = "KafkaClient";
constexpr const char *LOGGING = "Logging";
} // namespace Sections

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct ReaderConfig {
  uint64_t poll_timeout_ms = 1000;
  uint32_t retry_attempts = 5;
  size_t max_batch_size = 500;
};

// Describes the range handed to a single reader by the job that computed
// the splits.
struct SplitConfig {
  std::string topic;
  int32_t partition = 0;
  int64_t starting_offset = 0;
  int64_t ending_offset = 0;
};

struct KafkaClientConfig {
  std::string bootstrap_servers = "localhost:9092";
  std::string group_id = "offset-range-reader";
  std::map<std::string, std::string> properties;
};

struct AppConfig {
  ReaderConfig reader;
  SplitConfig split;
  KafkaClientConfig kafka_client;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig();
};

LogLevel string_to_log_level(const std::string &level_str_raw);

bool validate_reader_config(const ReaderConfig &config,
                            std::vector<std::string> &errors);
bool validate_split_config(const SplitConfig &config,
                           std::vector<std::string> &errors);
bool validate_kafka_client_config(const KafkaClientConfig &config,
                                  std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
