// src/main.cpp
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/audit/InterruptFlag.hpp"
#include "core/audit/ObjectWalker.hpp"
#include "core/report/CsvReport.hpp"
#include "core/report/ReportWriter.hpp"
#include "services/cli/CommandLine.hpp"
#include "services/cli/PasswordPrompt.hpp"
#include "services/cli/ProgressBar.hpp"
#include "services/cli/SignalHandler.hpp"
#include "services/fedora/FedoraClient.hpp"

// ---------- helpers ----------

// Log lines go to stderr so stdout carries only the report.
static void setup_logging(bool quiet) {
  auto logger = spdlog::stderr_color_mt("fixity");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

  const std::string level = fixity::get_env_or("FIXITY_LOG_LEVEL", "");
  if (!level.empty()) spdlog::set_level(spdlog::level::from_str(level));
  else spdlog::set_level(quiet ? spdlog::level::err : spdlog::level::warn);
}

static int run(const fixity::CommandLine& cl) {
  using namespace fixity;

  FedoraConfig fedora = cl.fedora;
  if (!fedora.user.empty() && fedora.password.empty())
    fedora.password = prompt_password("Password for " + fedora.user + ": ");
  FedoraClient repo(fedora);

  std::ofstream csvFile;
  std::unique_ptr<CsvReport> csv;
  if (cl.mode == Mode::Validate && !cl.csvFile.empty()) {
    csvFile = open_report_file(cl.csvFile);
    csv = std::make_unique<CsvReport>(csvFile);
    csv->writeHeader();
  }
  ReportWriter report(std::cout, std::cerr, cl.quiet, csv.get());

  const auto targets = resolve_targets(repo, cl.pids);
  spdlog::info("{} object(s) to process", targets.size());

  InterruptFlag interrupted;
  install_interrupt_handler(interrupted);

  WalkOptions opts;
  opts.mode = cl.mode;
  opts.maxObjects = cl.maxObjects;
  opts.allVersions = cl.allVersions;
  opts.missingOnly = cl.missingOnly;
  opts.checksumType = cl.checksumType;
  opts.forced = cl.forced;

  std::unique_ptr<ProgressBar> progress;
  if (!cl.quiet && ProgressBar::stderr_is_tty()) {
    // the bar counts toward --max when it is lower than the target count
    std::size_t total = targets.size();
    if (cl.maxObjects > 0 && cl.maxObjects < total) total = cl.maxObjects;
    progress = std::make_unique<ProgressBar>(std::cerr, "Processing objects", total);
    opts.progress = [&progress](std::size_t done, std::size_t) { progress->update(done); };
  }

  ObjectWalker walker(repo, report, interrupted, std::move(opts));
  RunOutcome outcome = walker.run(targets);
  if (progress) progress->finish();

  for (const auto& [name, value] : outcome.stats.snapshot())
    spdlog::debug("{} = {}", name, value);

  if (outcome.interrupted || outcome.maxReached)
    report.stopped(outcome.interrupted, outcome.stats.get(Metric::Objects));
  if (cl.mode == Mode::Validate) {
    report.validateSummary(outcome.stats, cl.allVersions, cl.missingOnly);
    if (csv) std::cout << report.rowsWritten() << " row(s) written to " << cl.csvFile << "\n";
  } else {
    report.repairSummary(outcome.stats);
  }
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::optional<fixity::CommandLine> cl;
  try {
    cl = fixity::parse_command_line(argc, argv, std::cout);
  } catch (const fixity::UsageError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  if (!cl) return 0;

  try {
    setup_logging(cl->quiet);
    return run(*cl);
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
