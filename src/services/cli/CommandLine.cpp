#include "CommandLine.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <sstream>

namespace po = boost::program_options;

// -------- helpers --------

static void print_usage(std::ostream& os, const char* argv0) {
  os << "Usage:\n"
     << "  " << argv0 << " validate [options] [PID...]  # report missing/invalid checksums\n"
     << "  " << argv0 << " repair [options] [PID...]    # add checksums where missing\n"
     << "\nWithout PIDs every object in the repository is checked.\n"
     << "Run '" << argv0 << " <command> --help' for command options.\n";
}

static po::options_description common_options() {
  po::options_description opts("Common options");
  // clang-format off
  opts.add_options()
    ("help,h", "show this help and exit")
    ("fedora-root", po::value<std::string>(),
     "Fedora base URL, e.g. http://localhost:8080/fedora/ (or FIXITY_FEDORA_ROOT)")
    ("fedora-user", po::value<std::string>(), "Fedora user (or FIXITY_FEDORA_USER)")
    ("fedora-password", po::value<std::string>(),
     "Fedora password (or FIXITY_FEDORA_PASSWORD; prompted when a user is set)")
    ("quiet,q", po::bool_switch(), "only print errors and the summary")
    ("max,m", po::value<uint64_t>(), "stop after processing this many objects")
    ("timeout", po::value<int>(), "per-request timeout in seconds");
  // clang-format on
  return opts;
}

static po::options_description validate_options() {
  po::options_description opts("validate options");
  // clang-format off
  opts.add_options()
    ("csv-file", po::value<std::string>(), "write missing/invalid datastreams to this CSV file")
    ("all-versions,a", po::bool_switch(), "check every version of each datastream")
    ("missing-only", po::bool_switch(), "only look for missing checksums, skip verification");
  // clang-format on
  return opts;
}

static po::options_description repair_options() {
  po::options_description opts("repair options");
  // clang-format off
  opts.add_options()
    ("checksum-type", po::value<std::string>()->default_value("DEFAULT"),
     "checksum type to set: DEFAULT, MD5, SHA-1, SHA-256, SHA-384, SHA-512")
    ("force", po::value<std::string>(),
     "comma-separated datastream ids to repair even when they have a checksum");
  // clang-format on
  return opts;
}

namespace fixity {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

std::set<std::string> parse_id_list(const std::string& csv) {
  std::set<std::string> ids;
  std::istringstream in(csv);
  std::string item;
  while (std::getline(in, item, ',')) {
    const auto b = item.find_first_not_of(" \t");
    if (b == std::string::npos) continue;
    const auto e = item.find_last_not_of(" \t");
    ids.insert(item.substr(b, e - b + 1));
  }
  return ids;
}

std::optional<CommandLine> parse_command_line(int argc, const char* const argv[],
                                              std::ostream& help) {
  const char* argv0 = argc > 0 ? argv[0] : "fixity-checker";
  if (argc < 2) {
    print_usage(help, argv0);
    throw UsageError("no command given");
  }

  const std::string command = argv[1];
  if (command == "-h" || command == "--help") {
    print_usage(help, argv0);
    return std::nullopt;
  }

  CommandLine cl;
  po::options_description visible = common_options();
  if (command == "validate") {
    cl.mode = Mode::Validate;
    visible.add(validate_options());
  } else if (command == "repair") {
    cl.mode = Mode::Repair;
    visible.add(repair_options());
  } else {
    throw UsageError("unknown command '" + command + "' (expected validate or repair)");
  }

  po::options_description hidden;
  hidden.add_options()("pid", po::value<std::vector<std::string>>());
  po::options_description all;
  all.add(visible).add(hidden);
  po::positional_options_description positional;
  positional.add("pid", -1);

  po::variables_map vm;
  try {
    std::vector<std::string> args(argv + 2, argv + argc);
    po::store(po::command_line_parser(args).options(all).positional(positional).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw UsageError(e.what());
  }

  if (vm.count("help")) {
    help << "Usage: " << argv0 << " " << command << " [options] [PID...]\n\n" << visible;
    return std::nullopt;
  }

  // connection settings: flags win over environment
  cl.fedora.rootUrl = vm.count("fedora-root") ? vm["fedora-root"].as<std::string>()
                                              : get_env_or("FIXITY_FEDORA_ROOT", "");
  if (cl.fedora.rootUrl.empty())
    throw UsageError("--fedora-root is required");
  try {
    split_base_url(cl.fedora.rootUrl);
  } catch (const std::invalid_argument& e) {
    throw UsageError(std::string("--fedora-root: ") + e.what());
  }
  cl.fedora.user = vm.count("fedora-user") ? vm["fedora-user"].as<std::string>()
                                           : get_env_or("FIXITY_FEDORA_USER", "");
  cl.fedora.password = vm.count("fedora-password")
                         ? vm["fedora-password"].as<std::string>()
                         : get_env_or("FIXITY_FEDORA_PASSWORD", "");
  if (vm.count("timeout")) {
    cl.fedora.timeoutSeconds = vm["timeout"].as<int>();
    if (cl.fedora.timeoutSeconds < 0) throw UsageError("--timeout must not be negative");
  }

  cl.quiet = vm["quiet"].as<bool>();
  if (vm.count("max")) {
    cl.maxObjects = vm["max"].as<uint64_t>();
    if (cl.maxObjects == 0) throw UsageError("--max must be at least 1");
  }
  if (vm.count("pid")) cl.pids = vm["pid"].as<std::vector<std::string>>();

  if (cl.mode == Mode::Validate) {
    if (vm.count("csv-file")) cl.csvFile = vm["csv-file"].as<std::string>();
    cl.allVersions = vm["all-versions"].as<bool>();
    cl.missingOnly = vm["missing-only"].as<bool>();
  } else {
    const std::string type = vm["checksum-type"].as<std::string>();
    try {
      cl.checksumType = parse_checksum_type(type);
    } catch (const std::invalid_argument& e) {
      throw UsageError(std::string("--checksum-type: ") + e.what());
    }
    if (cl.checksumType == ChecksumType::Disabled)
      throw UsageError("--checksum-type DISABLED would remove checksums");
    if (vm.count("force")) cl.forced = parse_id_list(vm["force"].as<std::string>());
  }
  return cl;
}

} // namespace fixity
