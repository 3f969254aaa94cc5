#include "distd/metrics.h"

#include <set>
#include <sstream>

namespace distd {

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

static std::string makeKey(const std::string &name, const MetricLabels &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

static std::string baseName(const std::string &key) {
  return key.substr(0, key.find('{'));
}

static std::string labelPart(const std::string &key) {
  auto pos = key.find('{');
  return pos == std::string::npos ? "" : key.substr(pos);
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::addGauge(const std::string &name, double delta,
                               const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] += delta;
}

void MetricsRegistry::incrementCounter(const std::string &name, double value,
                                       const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &s = summaries_[makeKey(name, labels)];
  s.sum += value;
  s.count += 1;
}

double MetricsRegistry::value(const std::string &name,
                              const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  const std::string key = makeKey(name, labels);
  if (auto it = counters_.find(key); it != counters_.end())
    return it->second;
  if (auto it = gauges_.find(key); it != gauges_.end())
    return it->second;
  return 0.0;
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
  std::set<std::string> typed;
  auto typeLine = [&](const std::string &name, const char *type) {
    if (typed.insert(name).second)
      oss << "# TYPE " << name << ' ' << type << '\n';
  };
  for (const auto &kv : gauges_) {
    typeLine(baseName(kv.first), "gauge");
    oss << kv.first << ' ' << kv.second << '\n';
  }
  for (const auto &kv : counters_) {
    typeLine(baseName(kv.first), "counter");
    oss << kv.first << ' ' << kv.second << '\n';
  }
  for (const auto &kv : summaries_) {
    const std::string name = baseName(kv.first);
    const std::string labels = labelPart(kv.first);
    typeLine(name, "summary");
    oss << name << "_sum" << labels << ' ' << kv.second.sum << '\n';
    oss << name << "_count" << labels << ' ' << kv.second.count << '\n';
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  summaries_.clear();
}

} // namespace distd
