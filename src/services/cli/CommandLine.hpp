#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/audit/ObjectWalker.hpp"
#include "services/fedora/FedoraClient.hpp"

namespace fixity {

// Malformed command line; reported with usage and exit code 1.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct CommandLine {
  Mode mode = Mode::Validate;
  FedoraConfig fedora;
  bool quiet = false;
  uint64_t maxObjects = 0;
  std::vector<std::string> pids;

  // validate
  std::string csvFile;
  bool allVersions = false;
  bool missingOnly = false;

  // repair
  ChecksumType checksumType = ChecksumType::Default;
  std::set<std::string> forced;
};

std::string get_env_or(const char* key, const std::string& defval);

// "DC, RELS-EXT,,MODS" -> {"DC", "MODS", "RELS-EXT"}
std::set<std::string> parse_id_list(const std::string& csv);

// Parses `fixity-checker <validate|repair> [options] [PID...]`. Returns
// nullopt after writing help to `help` when --help was requested. Missing
// connection settings fall back to FIXITY_FEDORA_* environment variables.
std::optional<CommandLine> parse_command_line(int argc, const char* const argv[],
                                              std::ostream& help);

} // namespace fixity
