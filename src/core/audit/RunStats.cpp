#include "RunStats.hpp"

namespace fixity {

const char* metric_name(Metric m) {
  switch (m) {
    case Metric::Objects:            return "objects";
    case Metric::Datastreams:        return "ds";
    case Metric::DatastreamVersions: return "ds_versions";
    case Metric::Ok:                 return "ok";
    case Metric::Invalid:            return "invalid";
    case Metric::Missing:            return "missing";
    case Metric::Updated:            return "ds_updated";
    case Metric::SaveErrors:         return "ds_err";
    case Metric::CheckErrors:        return "ds_check_err";
  }
  return "unknown";
}

uint64_t RunStats::get(Metric m) const {
  auto it = counters_.find(m);
  return it == counters_.end() ? 0 : it->second;
}

std::map<std::string, uint64_t> RunStats::snapshot() const {
  std::map<std::string, uint64_t> out;
  for (const auto& [m, v] : counters_) out.emplace(metric_name(m), v);
  return out;
}

} // namespace fixity
