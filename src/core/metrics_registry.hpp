#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>
#include <string>

// Process-wide prometheus registry. The auditor runs once and exits, so
// metrics are exported as a node_exporter textfile instead of being scraped.
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  // Families are created once per name; later calls return the same one
  prometheus::Gauge &create_gauge(const std::string &name,
                                  const std::string &help);

  prometheus::Family<prometheus::Counter> &
  create_counter_family(const std::string &name, const std::string &help);

  prometheus::Family<prometheus::Gauge> &
  create_gauge_family(const std::string &name, const std::string &help);

  // Text exposition format of everything registered
  std::string serialize() const;

  // Written to <path>.tmp, then renamed into place
  bool write_textfile(const std::string &path) const;

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
  std::map<std::string, prometheus::Family<prometheus::Counter> *>
      counter_families_;
  std::map<std::string, prometheus::Family<prometheus::Gauge> *>
      gauge_families_;
};

#endif // METRICS_REGISTRY_HPP
