#pragma once
#include <optional>

#include "core/audit/ChecksumStatus.hpp"
#include "core/repository/Repository.hpp"

namespace fixity {

class ReportWriter;
class RunStats;

// Status of a snapshot given what verification said about it (nullopt when
// verification was skipped). A snapshot without fixity information is always
// missing, even if the repository claims it verified.
ChecksumStatus decide_status(const DatastreamRecord& snapshot,
                             std::optional<bool> verified);

class ChecksumClassifier {
public:
  ChecksumClassifier(Repository& repo, bool missingOnly)
    : repo_(repo), missingOnly_(missingOnly) {}

  // Throws RepositoryError if verification cannot be performed.
  ChecksumStatus classify(const DatastreamRecord& snapshot) const;

  // classify() plus counting and reporting of the result.
  ChecksumStatus check(const DatastreamRecord& snapshot, RunStats& stats,
                       ReportWriter& report) const;

private:
  Repository& repo_;
  bool missingOnly_;
};

} // namespace fixity
