#include "ChecksumClassifier.hpp"

#include <spdlog/spdlog.h>

#include "core/audit/RunStats.hpp"
#include "core/report/ReportWriter.hpp"

namespace fixity {

ChecksumStatus decide_status(const DatastreamRecord& snapshot,
                             std::optional<bool> verified) {
  if (!has_recorded_checksum(snapshot)) return ChecksumStatus::Missing;
  if (verified.has_value() && !*verified) return ChecksumStatus::Invalid;
  return ChecksumStatus::Ok;
}

ChecksumStatus ChecksumClassifier::classify(const DatastreamRecord& snapshot) const {
  std::optional<bool> verified;
  if (!missingOnly_) verified = repo_.verifyChecksum(snapshot);
  return decide_status(snapshot, verified);
}

ChecksumStatus ChecksumClassifier::check(const DatastreamRecord& snapshot,
                                         RunStats& stats,
                                         ReportWriter& report) const {
  const ChecksumStatus s = classify(snapshot);
  switch (s) {
    case ChecksumStatus::Ok:      stats.increment(Metric::Ok); break;
    case ChecksumStatus::Invalid: stats.increment(Metric::Invalid); break;
    case ChecksumStatus::Missing: stats.increment(Metric::Missing); break;
  }
  spdlog::debug("{}/{} ({}) {}", snapshot.pid, snapshot.dsid, snapshot.created,
                to_string(s));
  report.status(snapshot, s);
  return s;
}

} // namespace fixity
