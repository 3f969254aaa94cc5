#pragma once
#include <map>
#include <mutex>
#include <string>

namespace distd {

using MetricLabels = std::map<std::string, std::string>;

/**
 * @brief Process-wide counters, gauges and summaries with Prometheus text
 * export. Engine components record into the singleton; the host process
 * decides whether and where to expose it.
 */
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  void setGauge(const std::string &name, double value,
                const MetricLabels &labels = {});
  void addGauge(const std::string &name, double delta,
                const MetricLabels &labels = {});
  void incrementCounter(const std::string &name, double value = 1.0,
                        const MetricLabels &labels = {});
  /** Record one observation of a summary (sum and count). */
  void observe(const std::string &name, double value,
               const MetricLabels &labels = {});

  /** Current value of a counter or gauge, 0 if never recorded. */
  double value(const std::string &name, const MetricLabels &labels = {}) const;

  std::string toPrometheus() const;

  /** Clear everything; used by tests. */
  void reset();

  static std::string labelsToString(const MetricLabels &labels);

private:
  MetricsRegistry() = default;
  struct Summary {
    double sum{0};
    unsigned long count{0};
  };

  mutable std::mutex mtx_;
  std::map<std::string, double> gauges_;
  std::map<std::string, double> counters_;
  std::map<std::string, Summary> summaries_;
};

} // namespace distd
