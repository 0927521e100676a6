#include "ObjectWalker.hpp"

#include <unordered_set>

#include <spdlog/spdlog.h>

#include "core/audit/InterruptFlag.hpp"
#include "core/report/ReportWriter.hpp"

namespace fixity {

std::vector<std::string> resolve_targets(Repository& repo,
                                         const std::vector<std::string>& pids) {
  if (pids.empty()) return repo.findByModel(kAllObjectsModel);

  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto& pid : pids) {
    if (seen.insert(pid).second) out.push_back(pid);
  }
  return out;
}

RunOutcome ObjectWalker::run(const std::vector<std::string>& targets) {
  stats_ = RunStats{};
  const bool versions = opts_.mode == Mode::Validate && opts_.allVersions;
  if (versions) stats_.touch(Metric::DatastreamVersions);

  RunOutcome outcome;
  std::size_t done = 0;

  for (const auto& pid : targets) {
    std::vector<std::string> dsids;
    try {
      if (!repo_.getObject(pid)) {
        report_.objectInaccessible(pid);
        continue;
      }
      dsids = repo_.listDatastreamIds(pid);
    } catch (const RepositoryError& e) {
      spdlog::warn("{}: {}", pid, e.what());
      report_.objectInaccessible(pid);
      continue;
    }

    spdlog::debug("{}: {} datastream(s)", pid, dsids.size());
    for (const auto& dsid : dsids) {
      stats_.increment(Metric::Datastreams);
      try {
        if (opts_.mode == Mode::Validate) validateDatastream(pid, dsid);
        else repairDatastream(pid, dsid);
      } catch (const RepositoryError& e) {
        stats_.increment(Metric::CheckErrors);
        report_.checkError(pid, dsid, e.what());
      }
    }

    stats_.increment(Metric::Objects);
    ++done;
    if (opts_.progress) opts_.progress(done, targets.size());

    // object boundary: the only place a run may stop early
    if (interrupt_.isSet()) {
      spdlog::info("interrupted after {} object(s)", done);
      outcome.interrupted = true;
      break;
    }
    if (opts_.maxObjects > 0 && stats_.get(Metric::Objects) >= opts_.maxObjects) {
      spdlog::info("processed maximum of {} object(s)", opts_.maxObjects);
      outcome.maxReached = true;
      break;
    }
  }

  outcome.stats = stats_;
  return outcome;
}

void ObjectWalker::validateDatastream(const std::string& pid, const std::string& dsid) {
  if (!opts_.allVersions) {
    classifier_.check(repo_.getDatastream(pid, dsid), stats_, report_);
    return;
  }
  // a version that cannot be verified must not hide the older ones
  for (const auto& version : repo_.datastreamHistory(pid, dsid)) {
    stats_.increment(Metric::DatastreamVersions);
    try {
      classifier_.check(version, stats_, report_);
    } catch (const RepositoryError& e) {
      stats_.increment(Metric::CheckErrors);
      report_.checkError(pid, dsid, std::string(e.what()) + " (" + version.created + ")");
    }
  }
}

void ObjectWalker::repairDatastream(const std::string& pid, const std::string& dsid) {
  repairer_.maybeRepair(repo_.getDatastream(pid, dsid), stats_, report_);
}

} // namespace fixity
