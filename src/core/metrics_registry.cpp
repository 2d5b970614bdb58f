#include "metrics_registry.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cstdio>
#include <fstream>
#include <prometheus/text_serializer.h>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

prometheus::Family<prometheus::Counter> &
MetricsRegistry::create_counter_family(const std::string &name,
                                       const std::string &help) {
  auto it = counter_families_.find(name);
  if (it != counter_families_.end())
    return *it->second;

  auto &family =
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
  counter_families_.emplace(name, &family);
  return family;
}

prometheus::Family<prometheus::Gauge> &
MetricsRegistry::create_gauge_family(const std::string &name,
                                     const std::string &help) {
  auto it = gauge_families_.find(name);
  if (it != gauge_families_.end())
    return *it->second;

  auto &family =
      prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);
  gauge_families_.emplace(name, &family);
  return family;
}

prometheus::Gauge &MetricsRegistry::create_gauge(const std::string &name,
                                                 const std::string &help) {
  return create_gauge_family(name, help).Add({});
}

std::string MetricsRegistry::serialize() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}

bool MetricsRegistry::write_textfile(const std::string &path) const {
  if (!Utils::create_directory_for_file(path)) {
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
        "Cannot create directory for metrics textfile " << path);
    return false;
  }

  const std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
      LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
          "Cannot open metrics textfile " << tmp_path);
      return false;
    }
    out << serialize();
    if (!out.good()) {
      LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
          "Failed writing metrics textfile " << tmp_path);
      return false;
    }
  }

  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    LOG(LogLevel::ERROR, LogComponent::IO_OUTPUT,
        "Cannot move metrics textfile into place at " << path);
    std::remove(tmp_path.c_str());
    return false;
  }
  return true;
}
