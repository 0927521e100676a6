#pragma once
#include <set>
#include <string>
#include <utility>

#include "core/repository/Repository.hpp"

namespace fixity {

class ReportWriter;
class RunStats;

struct RepairOutcome {
  bool attempted = false;
  bool updated = false;
  std::string error; // save failure reason, empty otherwise
};

class RepairDecider {
public:
  RepairDecider(Repository& repo, ChecksumType checksumType,
                std::set<std::string> forced)
    : repo_(repo), checksumType_(checksumType), forced_(std::move(forced)) {}

  // A datastream is repaired when it has no checksum or the operator forced it.
  bool shouldRepair(const DatastreamRecord& ds) const;

  // Saves the datastream with the configured checksum type when shouldRepair()
  // holds. Save failures are reported and counted, never thrown.
  RepairOutcome maybeRepair(const DatastreamRecord& ds, RunStats& stats,
                            ReportWriter& report);

private:
  Repository& repo_;
  ChecksumType checksumType_;
  std::set<std::string> forced_;
};

} // namespace fixity
