#include "ReportWriter.hpp"

#include "core/audit/RunStats.hpp"
#include "core/report/CsvReport.hpp"

namespace fixity {

void ReportWriter::status(const DatastreamRecord& r, ChecksumStatus s) {
  if (s == ChecksumStatus::Ok) return;

  if (!quiet_) {
    out_ << r.pid << "/" << r.dsid << " - " << to_string(s)
         << " checksum (" << r.created << ")\n";
  }
  if (csv_) {
    csv_->writeRow(ReportRow{r.pid, r.dsid, r.created, s, r.mimetype, r.versionable});
    ++rows_;
  }
}

void ReportWriter::objectInaccessible(const std::string& pid) {
  err_ << "Error: " << pid << " does not exist or is inaccessible\n";
}

void ReportWriter::saveError(const std::string& pid, const std::string& dsid,
                             const std::string& reason) {
  err_ << "Error saving " << pid << "/" << dsid << " : " << reason << "\n";
}

void ReportWriter::checkError(const std::string& pid, const std::string& dsid,
                              const std::string& reason) {
  err_ << "Error checking " << pid << "/" << dsid << " : " << reason << "\n";
}

void ReportWriter::stopped(bool interrupted, uint64_t objects) {
  out_ << "\nStopped after " << objects << " object(s)"
       << (interrupted ? " (interrupted)" : " (maximum reached)") << "\n";
}

// -------- summaries --------

void ReportWriter::validateSummary(const RunStats& stats, bool allVersions,
                                   bool missingOnly) {
  out_ << "\nTested " << stats.get(Metric::Objects) << " object(s), "
       << stats.get(Metric::Datastreams) << " datastream(s)";
  if (allVersions) {
    out_ << ", " << stats.get(Metric::DatastreamVersions) << " datastream version(s)";
  }
  out_ << "\n";
  if (!missingOnly) {
    out_ << stats.get(Metric::Invalid) << " invalid checksum(s)\n";
  }
  out_ << stats.get(Metric::Missing) << " datastream(s) with missing checksum\n";
  if (stats.get(Metric::CheckErrors) > 0) {
    out_ << stats.get(Metric::CheckErrors) << " datastream(s) could not be checked\n";
  }
}

void ReportWriter::repairSummary(const RunStats& stats) {
  out_ << "\nChecked " << stats.get(Metric::Objects) << " object(s), updated "
       << stats.get(Metric::Updated) << " datastream(s)\n";
  if (stats.get(Metric::SaveErrors) > 0) {
    out_ << "Error saving " << stats.get(Metric::SaveErrors) << " datastream(s)\n";
  }
  if (stats.get(Metric::CheckErrors) > 0) {
    out_ << stats.get(Metric::CheckErrors) << " datastream(s) could not be checked\n";
  }
}

} // namespace fixity
