#pragma once
#include <fstream>
#include <ostream>
#include <string>
#include <string_view>

#include "core/audit/ChecksumStatus.hpp"

namespace fixity {

struct ReportRow {
  std::string pid;
  std::string dsid;
  std::string created;
  ChecksumStatus status;
  std::string mimetype;
  bool versionable;
};

// Writes report rows as CSV with every field quoted.
class CsvReport {
public:
  explicit CsvReport(std::ostream& os) : os_(os) {}

  void writeHeader();
  void writeRow(const ReportRow& row);

  static std::string quote(std::string_view field);

private:
  std::ostream& os_;
};

// Opens (truncating) a report file, creating parent directories.
// Throws std::runtime_error when the file cannot be opened.
std::ofstream open_report_file(const std::string& path);

} // namespace fixity
