#pragma once
#include <cstdint>
#include <map>
#include <string>

namespace fixity {

enum class Metric {
  Objects,            // objects fully processed
  Datastreams,        // "ds"
  DatastreamVersions, // "ds_versions", all-versions validate only
  Ok,
  Invalid,
  Missing,
  Updated,            // "ds_updated"
  SaveErrors,         // "ds_err"
  CheckErrors         // "ds_check_err"
};

const char* metric_name(Metric m);

// Counters for one run. Values only ever grow.
class RunStats {
public:
  void increment(Metric m, uint64_t by = 1) { counters_[m] += by; }
  // Makes a metric present with a zero value without counting anything.
  void touch(Metric m) { counters_[m] += 0; }

  uint64_t get(Metric m) const;
  bool has(Metric m) const { return counters_.count(m) != 0; }

  // name -> value for every present metric, for logging.
  std::map<std::string, uint64_t> snapshot() const;

private:
  std::map<Metric, uint64_t> counters_;
};

} // namespace fixity
