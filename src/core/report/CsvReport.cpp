#include "CsvReport.hpp"
#include <filesystem>
#include <stdexcept>

namespace fixity {

std::string CsvReport::quote(std::string_view field) {
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char c : field) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

void CsvReport::writeHeader() {
  os_ << quote("pid") << ',' << quote("datastream id") << ','
      << quote("date created") << ',' << quote("status") << ','
      << quote("mimetype") << ',' << quote("versioned") << "\r\n";
}

void CsvReport::writeRow(const ReportRow& row) {
  os_ << quote(row.pid) << ',' << quote(row.dsid) << ','
      << quote(row.created) << ',' << quote(to_string(row.status)) << ','
      << quote(row.mimetype) << ',' << quote(row.versionable ? "True" : "False")
      << "\r\n";
  os_.flush();
}

std::ofstream open_report_file(const std::string& path) {
  namespace fs = std::filesystem;
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
  std::ofstream os(path, std::ios::binary | std::ios::trunc);
  if (!os) throw std::runtime_error("Cannot open CSV file: " + path);
  return os;
}

} // namespace fixity
