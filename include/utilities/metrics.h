#pragma once
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mailcas {

using MetricLabels = std::map<std::string, std::string>;

/**
 * @brief Process-wide metrics registry rendered in Prometheus text format.
 */
class MetricsRegistry {
public:
  /** Get singleton instance. */
  static MetricsRegistry &instance();

  /** Set gauge value with optional labels. */
  void setGauge(const std::string &name, double value,
                const MetricLabels &labels = {});

  /** Increment counter by value (default 1). */
  void incrementCounter(const std::string &name, double value = 1.0,
                        const MetricLabels &labels = {});

  /** Record an observation; exported as `<name>_sum` and `<name>_count`. */
  void observe(const std::string &name, double value,
               const MetricLabels &labels = {});

  /** Current gauge value, 0 when never set. */
  double gauge(const std::string &name, const MetricLabels &labels = {}) const;

  /** Current counter value, 0 when never incremented. */
  double counter(const std::string &name,
                 const MetricLabels &labels = {}) const;

  /** Serialize all metrics in Prometheus text format. */
  std::string toPrometheus() const;

  /**
   * @brief Clear all stored metrics.
   *
   * Primarily used by unit tests to ensure a clean registry state.
   */
  void reset();

  /** Convert labels map to Prometheus label string. */
  static std::string labelsToString(const MetricLabels &labels);

private:
  MetricsRegistry() = default;
  struct Histogram {
    double sum{0};
    unsigned long count{0};
  };

  mutable std::mutex mtx_;
  std::unordered_map<std::string, double> gauges_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, Histogram> histograms_;
};

} // namespace mailcas
