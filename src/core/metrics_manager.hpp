#ifndef METRICS_MANAGER_HPP
#define METRICS_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

class MetricsManager;

using MetricLabels = std::map<std::string, std::string>;

struct LabeledCounter {
  friend class MetricsManager;
  void increment(const MetricLabels &labels, uint64_t value = 1);
  uint64_t get_value(const MetricLabels &labels) const;
  uint64_t get_total() const;

private:
  LabeledCounter(std::string name, std::string help)
      : name(std::move(name)), help(std::move(help)) {}

  struct Series {
    std::atomic<uint64_t> val{0};
  };

  std::string name;
  std::string help;
  std::map<MetricLabels, std::unique_ptr<Series>> series_;
  mutable std::mutex series_mutex_;
};

struct Histogram {
  friend class MetricsManager;
  void observe(double value);

  std::vector<
      std::pair<std::chrono::time_point<std::chrono::steady_clock>, double>>
  get_recent_observations() const;

  double get_cumulative_sum() const;
  uint64_t get_cumulative_count() const;

private:
  Histogram(std::string name, std::string help)
      : name(std::move(name)), help(std::move(help)) {}
  std::string name;
  std::string help;

  std::deque<
      std::pair<std::chrono::time_point<std::chrono::steady_clock>, double>>
      observations_;

  std::atomic<double> cumulative_sum_{0.0};
  std::atomic<uint64_t> cumulative_count_{0};

  mutable std::mutex mtx;
  static constexpr size_t MAX_OBSERVATIONS = 200;
};

// Process-wide registry. Registering a name twice hands back the metric
// created by the first call, so every reader instance of a process feeds the
// same series.
class MetricsManager {
public:
  static MetricsManager &instance();

  MetricsManager(const MetricsManager &) = delete;
  void operator=(const MetricsManager &) = delete;

  LabeledCounter *register_labeled_counter(const std::string &name,
                                           const std::string &help_text);
  Histogram *register_histogram(const std::string &name,
                                const std::string &help_text);

  std::string expose_as_prometheus_text();
  std::string expose_as_json();

private:
  MetricsManager() : start_time_(std::chrono::steady_clock::now()) {}
  ~MetricsManager() = default;

  std::map<std::string, std::unique_ptr<LabeledCounter>> labeled_counters_;
  std::map<std::string, std::unique_ptr<Histogram>> histograms_;
  std::mutex registry_mutex_;

  const std::chrono::time_point<std::chrono::steady_clock> start_time_;
};

#endif // METRICS_MANAGER_HPP
