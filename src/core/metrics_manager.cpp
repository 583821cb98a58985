#include "metrics_manager.hpp"
#include "nlohmann/json.hpp"

#include <chrono>
#include <cstdint>
#include <sstream>

using json = nlohmann::json;

namespace {

std::string labels_to_key(const MetricLabels &labels, const char *separator,
                          bool quote_values) {
  std::string key;
  bool first = true;
  for (const auto &[label, value] : labels) {
    if (!first)
      key += separator;
    key += label;
    key += '=';
    if (quote_values)
      key += "\"" + value + "\"";
    else
      key += value;
    first = false;
  }
  return key;
}

} // namespace

void Histogram::observe(double value) {
  // Update atomics first, as they don't require a heavy lock
  double current_sum = cumulative_sum_.load(std::memory_order_relaxed);
  while (!cumulative_sum_.compare_exchange_weak(
      current_sum, current_sum + value, std::memory_order_release,
      std::memory_order_relaxed))
    ;
  cumulative_count_.fetch_add(1, std::memory_order_relaxed);

  std::lock_guard<std::mutex> lock(mtx);
  observations_.emplace_front(std::chrono::steady_clock::now(), value);
  if (observations_.size() > MAX_OBSERVATIONS)
    observations_.pop_back();
}

std::vector<
    std::pair<std::chrono::time_point<std::chrono::steady_clock>, double>>
Histogram::get_recent_observations() const {
  std::lock_guard<std::mutex> lock(mtx);
  return {observations_.begin(), observations_.end()};
}

double Histogram::get_cumulative_sum() const {
  return cumulative_sum_.load(std::memory_order_relaxed);
}

uint64_t Histogram::get_cumulative_count() const {
  return cumulative_count_.load(std::memory_order_relaxed);
}

void LabeledCounter::increment(const MetricLabels &labels, uint64_t value) {
  std::lock_guard<std::mutex> lock(series_mutex_);
  auto &series = series_[labels];
  if (!series)
    series = std::make_unique<Series>();
  series->val.fetch_add(value, std::memory_order_relaxed);
}

uint64_t LabeledCounter::get_value(const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lock(series_mutex_);
  auto it = series_.find(labels);
  if (it == series_.end())
    return 0;
  return it->second->val.load(std::memory_order_relaxed);
}

uint64_t LabeledCounter::get_total() const {
  std::lock_guard<std::mutex> lock(series_mutex_);
  uint64_t total = 0;
  for (const auto &[labels, series_ptr] : series_)
    total += series_ptr->val.load(std::memory_order_relaxed);
  return total;
}

MetricsManager &MetricsManager::instance() {
  static MetricsManager instance;
  return instance;
}

LabeledCounter *
MetricsManager::register_labeled_counter(const std::string &name,
                                         const std::string &help_text) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = labeled_counters_[name];
  if (!slot)
    slot = std::unique_ptr<LabeledCounter>(new LabeledCounter(name, help_text));
  return slot.get();
}

Histogram *MetricsManager::register_histogram(const std::string &name,
                                              const std::string &help_text) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = histograms_[name];
  if (!slot)
    slot = std::unique_ptr<Histogram>(new Histogram(name, help_text));
  return slot.get();
}

std::string MetricsManager::expose_as_prometheus_text() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  std::stringstream ss;

  for (const auto &[name, counter_ptr] : labeled_counters_) {
    ss << "# HELP " << name << " " << counter_ptr->help << "\n";
    ss << "# TYPE " << name << " counter\n";

    std::lock_guard<std::mutex> series_lock(counter_ptr->series_mutex_);
    for (const auto &[labels, series_ptr] : counter_ptr->series_) {
      ss << name << "{" << labels_to_key(labels, ",", true) << "} "
         << series_ptr->val.load(std::memory_order_relaxed) << "\n";
    }
  }

  for (const auto &[name, histo_ptr] : histograms_) {
    ss << "# HELP " << name << " " << histo_ptr->help << "\n";
    ss << "# TYPE " << name << " histogram\n";

    double sum = histo_ptr->get_cumulative_sum();
    uint64_t count = histo_ptr->get_cumulative_count();

    ss << name << "_bucket{le=\"+Inf\"} " << count << "\n";
    ss << name << "_sum " << sum << "\n";
    ss << name << "_count " << count << "\n";
  }

  return ss.str();
}

std::string MetricsManager::expose_as_json() {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  json j;

  auto now = std::chrono::steady_clock::now();
  j["server_timestamp_ms"] =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count();
  j["app_runtime_seconds"] =
      std::chrono::duration_cast<std::chrono::seconds>(now - start_time_)
          .count();

  json j_counters = json::object();
  for (const auto &[name, counter_ptr] : labeled_counters_) {
    json j_series = json::object();
    std::lock_guard<std::mutex> series_lock(counter_ptr->series_mutex_);
    uint64_t total = 0;

    for (const auto &[labels, series_ptr] : counter_ptr->series_) {
      // e.g. "partition=3,topic=events"
      std::string label_key = labels_to_key(labels, ",", false);
      uint64_t val = series_ptr->val.load(std::memory_order_relaxed);
      if (!label_key.empty())
        j_series[label_key] = val;
      total += val;
    }

    // Always include a 'total' for the entire metric.
    j_series["total"] = total;
    j_counters[name] = j_series;
  }
  j["counters"] = j_counters;

  json j_histograms = json::object();
  for (const auto &[name, histo_ptr] : histograms_) {
    json j_histo_details;
    j_histo_details["count"] = histo_ptr->get_cumulative_count();
    j_histo_details["sum"] = histo_ptr->get_cumulative_sum();

    json j_observations = json::array();
    for (const auto &obs_pair : histo_ptr->get_recent_observations()) {
      double time_ago_s =
          std::chrono::duration<double>(now - obs_pair.first).count();
      j_observations.push_back({time_ago_s, obs_pair.second});
    }
    j_histo_details["recent_observations"] = j_observations;
    j_histograms[name] = j_histo_details;
  }
  j["histograms"] = j_histograms;

  return j.dump();
}
