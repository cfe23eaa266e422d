#include "utilities/metrics.h"
#include <sstream>

namespace mailcas {

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

static std::string makeKey(const std::string &name,
                           const MetricLabels &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

// Splits "name{labels}" back into its two halves.
static void splitKey(const std::string &key, std::string &name,
                     std::string &labels) {
  auto name_end = key.find('{');
  name = key.substr(0, name_end);
  labels = name_end == std::string::npos ? "" : key.substr(name_end);
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(const std::string &name, double value,
                                       const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &h = histograms_[makeKey(name, labels)];
  h.sum += value;
  h.count += 1;
}

double MetricsRegistry::gauge(const std::string &name,
                              const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = gauges_.find(makeKey(name, labels));
  return it == gauges_.end() ? 0.0 : it->second;
}

double MetricsRegistry::counter(const std::string &name,
                                const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(makeKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

std::string MetricsRegistry::labelsToString(const MetricLabels &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << kv.second << "\"";
  }
  oss << '}';
  return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  std::ostringstream oss;
  std::string name, labels;
  for (const auto &kv : gauges_) {
    splitKey(kv.first, name, labels);
    oss << name << labels << ' ' << kv.second << '\n';
  }
  for (const auto &kv : counters_) {
    splitKey(kv.first, name, labels);
    oss << name << labels << ' ' << kv.second << '\n';
  }
  for (const auto &kv : histograms_) {
    splitKey(kv.first, name, labels);
    oss << name << "_sum" << labels << ' ' << kv.second.sum << '\n';
    oss << name << "_count" << labels << ' ' << kv.second.count << '\n';
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  histograms_.clear();
}

} // namespace mailcas
