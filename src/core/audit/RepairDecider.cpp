#include "RepairDecider.hpp"

#include <spdlog/spdlog.h>

#include "core/audit/RunStats.hpp"
#include "core/report/ReportWriter.hpp"

namespace fixity {

bool RepairDecider::shouldRepair(const DatastreamRecord& ds) const {
  return !has_recorded_checksum(ds) || forced_.count(ds.dsid) != 0;
}

RepairOutcome RepairDecider::maybeRepair(const DatastreamRecord& ds,
                                         RunStats& stats,
                                         ReportWriter& report) {
  RepairOutcome out;
  if (!shouldRepair(ds)) return out;

  out.attempted = true;
  try {
    repo_.saveDatastream(ds, checksumType_, "updating checksum");
    out.updated = true;
    stats.increment(Metric::Updated);
    spdlog::debug("{}/{} saved with checksum type {}", ds.pid, ds.dsid,
                  to_string(checksumType_));
  } catch (const RepositoryError& e) {
    out.error = e.what();
    stats.increment(Metric::SaveErrors);
    report.saveError(ds.pid, ds.dsid, out.error);
  }
  return out;
}

} // namespace fixity
