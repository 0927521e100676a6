#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/audit/ChecksumClassifier.hpp"
#include "core/audit/RepairDecider.hpp"
#include "core/audit/RunStats.hpp"
#include "core/repository/Repository.hpp"

namespace fixity {

class InterruptFlag;
class ReportWriter;

// Content model every Fedora 3 object carries; used to find all objects.
inline constexpr const char* kAllObjectsModel =
  "info:fedora/fedora-system:FedoraObject-3.0";

enum class Mode { Validate, Repair };

struct WalkOptions {
  Mode mode = Mode::Validate;
  uint64_t maxObjects = 0; // 0 = no limit

  // validate
  bool allVersions = false;
  bool missingOnly = false;

  // repair
  ChecksumType checksumType = ChecksumType::Default;
  std::set<std::string> forced;

  // Called after each processed object with (done, total).
  std::function<void(std::size_t, std::size_t)> progress;
};

struct RunOutcome {
  RunStats stats;
  bool interrupted = false;
  bool maxReached = false;
};

// Explicit pids deduplicated in first-seen order, or every object in the
// repository when none were given.
std::vector<std::string> resolve_targets(Repository& repo,
                                         const std::vector<std::string>& pids);

// Walks objects one at a time. Interrupt and the object limit are honoured
// only between objects, so an object is never left half processed.
class ObjectWalker {
public:
  ObjectWalker(Repository& repo, ReportWriter& report,
               const InterruptFlag& interrupt, WalkOptions opts)
    : repo_(repo), report_(report), interrupt_(interrupt), opts_(std::move(opts)),
      classifier_(repo, opts_.missingOnly),
      repairer_(repo, opts_.checksumType, opts_.forced) {}

  RunOutcome run(const std::vector<std::string>& targets);

private:
  void validateDatastream(const std::string& pid, const std::string& dsid);
  void repairDatastream(const std::string& pid, const std::string& dsid);

  Repository& repo_;
  ReportWriter& report_;
  const InterruptFlag& interrupt_;
  WalkOptions opts_;
  ChecksumClassifier classifier_;
  RepairDecider repairer_;
  RunStats stats_;
};

} // namespace fixity
