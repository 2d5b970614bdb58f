#include "metric_extractor.hpp"
#include "core/logger.hpp"
#include "header_index.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace analysis {

const std::vector<std::string> &declared_columns(Subsystem subsystem) {
  static const std::map<Subsystem, std::vector<std::string>> declared = {
      {Subsystem::CPU,
       {Columns::CPU_USER, Columns::CPU_SYSTEM, Columns::CPU_IOWAIT,
        Columns::CPU_STEAL, Columns::CPU_IDLE}},
      {Subsystem::MEMORY, {Columns::MEM_USED_PCT, Columns::MEM_KBAVAIL}},
      {Subsystem::SWAP, {Columns::SWAP_USED_PCT}},
      {Subsystem::PAGING, {Columns::PGSCAN, Columns::PGSTEAL}},
      {Subsystem::LOAD,
       {Columns::RUNQ_SZ, Columns::LDAVG_1, Columns::LDAVG_5,
        Columns::LDAVG_15}},
      {Subsystem::CONTEXT_SWITCH, {Columns::CSWCH}},
      {Subsystem::DISK,
       {Columns::DISK_AWAIT, Columns::DISK_UTIL, Columns::DISK_AQU_SZ}},
      {Subsystem::NET_DEVICE,
       {Columns::NET_RXKB, Columns::NET_TXKB, Columns::NET_IFUTIL}},
      {Subsystem::NET_ERROR,
       {Columns::NET_RXERR, Columns::NET_TXERR, Columns::NET_RXDROP,
        Columns::NET_TXDROP}},
      {Subsystem::SOCKET,
       {Columns::SOCK_TOTAL, Columns::SOCK_TCP, Columns::SOCK_UDP,
        Columns::SOCK_TCP_TW}},
      {Subsystem::TCP,
       {Columns::TCP_ACTIVE, Columns::TCP_PASSIVE, Columns::TCP_RETRANS,
        Columns::TCP_ESTAB, Columns::TCP_INERR}},
      {Subsystem::IP, {Columns::IP_IREC, Columns::IP_IDEL, Columns::IP_IREJ}},
  };
  static const std::vector<std::string> none;
  auto it = declared.find(subsystem);
  return it == declared.end() ? none : it->second;
}

std::optional<std::string> resource_column(Subsystem subsystem) {
  switch (subsystem) {
  case Subsystem::CPU:
    return std::string(Columns::CPU);
  case Subsystem::DISK:
    return std::string(Columns::DEV);
  case Subsystem::NET_DEVICE:
  case Subsystem::NET_ERROR:
    return std::string(Columns::IFACE);
  default:
    return std::nullopt;
  }
}

std::vector<std::string> column_aliases(const std::string &canonical) {
  if (canonical == Columns::DISK_AQU_SZ)
    return {"avgqu-sz"};
  if (canonical == Columns::TCP_INERR)
    return {"isegerr/s"};
  return {};
}

bool is_cpu_aggregate(const std::string &cpu_id) {
  return cpu_id == "-1" || cpu_id == "all";
}

namespace {

struct BoundColumn {
  std::string name;
  size_t index;
};

// Columns of the current header this extractor will read
struct RowLayout {
  std::optional<size_t> timestamp;
  std::optional<size_t> resource;
  std::vector<BoundColumn> numeric;
  // pgscank/s + pgscand/s, used when pgscan/s is not reported
  std::vector<size_t> pgscan_parts;
};

RowLayout bind_layout(const HeaderIndex &header, Subsystem subsystem) {
  RowLayout layout;
  layout.timestamp = header.find(Columns::TIMESTAMP);
  if (auto res = resource_column(subsystem))
    layout.resource = header.find(*res);

  for (const auto &column : declared_columns(subsystem)) {
    auto idx = header.find(column);
    if (!idx) {
      for (const auto &alias : column_aliases(column)) {
        idx = header.find(alias);
        if (idx)
          break;
      }
    }
    if (idx)
      layout.numeric.push_back({column, *idx});
  }

  if (subsystem == Subsystem::PAGING && !header.contains(Columns::PGSCAN)) {
    for (const char *part : {Columns::PGSCAN_KSWAPD, Columns::PGSCAN_DIRECT})
      if (auto idx = header.find(part))
        layout.pgscan_parts.push_back(*idx);
  }
  return layout;
}

double numeric_field(const std::vector<std::string_view> &fields,
                     size_t index) {
  if (index >= fields.size())
    return 0.0;
  std::string value = Utils::trim_copy(fields[index]);
  return Utils::string_to_number<double>(value).value_or(0.0);
}

bool has_whitespace(const std::string &s) {
  return std::any_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

MetricExtractor::MetricExtractor(Subsystem subsystem, bool include_loopback)
    : subsystem_(subsystem), include_loopback_(include_loopback) {}

std::vector<Sample>
MetricExtractor::extract(const std::vector<std::string> &lines) const {
  std::vector<Sample> samples;
  std::map<std::pair<std::string, std::string>, size_t> by_key;

  RowLayout layout;
  bool have_header = false;
  size_t skipped = 0;

  for (const auto &line : lines) {
    if (HeaderIndex::is_header_line(line)) {
      layout = bind_layout(HeaderIndex(line), subsystem_);
      have_header = true;
      continue;
    }
    if (!have_header || line.find("LINUX-RESTART") != std::string::npos) {
      ++skipped;
      continue;
    }

    auto fields = Utils::split_string_view(line, FIELD_DELIMITER);

    std::string timestamp;
    if (layout.timestamp && *layout.timestamp < fields.size()) {
      timestamp = Utils::trim_copy(fields[*layout.timestamp]);
    } else {
      for (auto field : fields) {
        if (Utils::time_of_day_part(field)) {
          timestamp = Utils::trim_copy(field);
          break;
        }
      }
    }
    if (!Utils::time_of_day_part(timestamp)) {
      ++skipped;
      continue;
    }

    std::string resource;
    if (layout.resource && *layout.resource < fields.size())
      resource = Utils::trim_copy(fields[*layout.resource]);

    if (subsystem_ == Subsystem::NET_DEVICE ||
        subsystem_ == Subsystem::NET_ERROR) {
      if (resource.empty() || resource == Columns::IFACE ||
          has_whitespace(resource)) {
        ++skipped;
        continue;
      }
      if (resource == "lo" && !include_loopback_)
        continue;
    }

    Sample sample;
    sample.timestamp = timestamp;
    sample.subsystem = subsystem_;
    sample.resource_key = resource;
    for (const auto &column : layout.numeric)
      sample.fields.emplace(column.name, numeric_field(fields, column.index));
    if (!layout.pgscan_parts.empty()) {
      double total = 0.0;
      for (size_t idx : layout.pgscan_parts)
        total += numeric_field(fields, idx);
      sample.fields.emplace(Columns::PGSCAN, total);
    }

    auto key = std::make_pair(sample.timestamp, sample.resource_key);
    auto existing = by_key.find(key);
    if (existing != by_key.end()) {
      auto &target = samples[existing->second].fields;
      for (auto &field : sample.fields)
        target.insert(field);
      continue;
    }
    by_key.emplace(std::move(key), samples.size());
    samples.push_back(std::move(sample));
  }

  LOG(LogLevel::TRACE, LogComponent::ANALYSIS_EXTRACT,
      subsystem_to_string(subsystem_)
          << ": extracted " << samples.size() << " samples, skipped "
          << skipped << " rows");
  return samples;
}

} // namespace analysis
