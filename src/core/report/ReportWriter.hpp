#pragma once
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "core/audit/ChecksumStatus.hpp"
#include "core/repository/Repository.hpp"

namespace fixity {

class CsvReport;
class RunStats;

// Everything the operator reads: per-datastream status lines, warnings and
// errors, the optional CSV export and the closing summary.
class ReportWriter {
public:
  // csv may be null when no export was requested.
  ReportWriter(std::ostream& out, std::ostream& err, bool quiet,
               CsvReport* csv = nullptr)
    : out_(out), err_(err), quiet_(quiet), csv_(csv) {}

  // Records a classification. Ok results produce no output.
  void status(const DatastreamRecord& r, ChecksumStatus s);

  void objectInaccessible(const std::string& pid);
  void saveError(const std::string& pid, const std::string& dsid,
                 const std::string& reason);
  void checkError(const std::string& pid, const std::string& dsid,
                  const std::string& reason);
  void stopped(bool interrupted, uint64_t objects);

  void validateSummary(const RunStats& stats, bool allVersions, bool missingOnly);
  void repairSummary(const RunStats& stats);

  std::size_t rowsWritten() const { return rows_; }

private:
  std::ostream& out_;
  std::ostream& err_;
  bool quiet_;
  CsvReport* csv_;
  std::size_t rows_ = 0;
};

} // namespace fixity
