#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/curation/candidate_loader.hpp"
#include "internal/curation/curator.hpp"
#include "internal/curation/record_importer.hpp"
#include "internal/curation/source_compare.hpp"
#include "internal/curation/updater.hpp"
#include "internal/db/source_index.hpp"
#include "internal/factory.hpp"
#include "internal/ledger/deprecation_analysis.hpp"
#include "internal/ledger/deprecation_ledger.hpp"
#include "internal/matching/lattice_matcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/selection/selection_service.hpp"
#include "internal/uniq/uniqueness_engine.hpp"
#include "internal/util/errors.hpp"

using mc3d::observability::IntField;
using mc3d::observability::StringField;
using mc3d::runtime::config::RuntimeConfig;

namespace {

void Usage() {
  std::cout << "Usage:\n"
            << "  mc3d-source [--config <yaml>] <command> ...\n"
            << "\n"
            << "Commands:\n"
            << "  import <records.json> <group>\n"
            << "  curate <import_group> <curated_group>\n"
            << "  update <old_group> <new_group> <target_group>\n"
            << "  uniq <group>... [-o out] [--method first|seb|pymatgen] [--no-sort-by-spg]\n"
            << "       [--matcher-settings yaml] [--parallelize N] [--chunk-size N]\n"
            << "       [--checkpoint path] [-c element]... [-S element]...\n"
            << "  select <families.json> <mc3d-ids.json> <deprecation.json>\n"
            << "       [--selected path] [--new-data path] [--group label]\n"
            << "  analyse id-removed <old_group> <new_group> [--file path]\n"
            << "  analyse structure-updated <old_curated_group> <new_final_group> [--file path]\n"
            << "  analyse incorrect-formula [--file path] [--yes]\n"
            << "  compare <source> <source> [--tol-factor x]\n";
}

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/*
  Positional arguments plus "--flag value" options, in command-line order.
*/
class Args {
 public:
  Args(int argc, char** argv, int begin) {
    for (int i = begin; i < argc; ++i) items_.emplace_back(argv[i]);
  }

  bool Done() const {
    return pos_ >= items_.size();
  }

  const std::string& Peek() const {
    return items_[pos_];
  }

  std::string Next() {
    if (Done()) throw UsageError("missing argument");
    return items_[pos_++];
  }

  std::string Value(const std::string& flag) {
    if (Done()) throw UsageError(flag + " needs a value");
    return items_[pos_++];
  }

 private:
  std::vector<std::string> items_;
  size_t                   pos_ = 0;
};

uint32_t ParseCount(const std::string& flag, const std::string& value) {
  try {
    size_t idx = 0;
    long   n   = std::stol(value, &idx);
    if (idx != value.size() || n < 0) throw UsageError(flag + " expects a non-negative integer");
    return static_cast<uint32_t>(n);
  } catch (const std::logic_error&) {
    throw UsageError(flag + " expects a non-negative integer");
  }
}

std::vector<std::string> Positionals(Args& args, size_t count) {
  std::vector<std::string> out;
  for (size_t i = 0; i < count; ++i) {
    if (args.Done() || args.Peek().rfind("-", 0) == 0) throw UsageError("expected " + std::to_string(count) + " arguments");
    out.push_back(args.Next());
  }
  return out;
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

int RunImport(Args& args, const mc3d::factory::RuntimeDependencies& deps) {
  auto pos = Positionals(args, 2);
  if (!args.Done()) throw UsageError("unexpected argument " + args.Peek());

  auto outcome = mc3d::curation::ImportRecords(*deps.repository, pos[0], pos[1]);
  std::cout << "Imported " << outcome.imported << " records, skipped " << outcome.errors.size() << "\n";
  return 0;
}

int RunCurate(Args& args, const mc3d::factory::RuntimeDependencies& deps) {
  auto pos = Positionals(args, 2);
  if (!args.Done()) throw UsageError("unexpected argument " + args.Peek());

  auto outcome = mc3d::curation::Curate(*deps.repository, pos[0], pos[1]);
  std::cout << "Curated " << outcome.curated << " of " << outcome.processed << " structures\n";
  return 0;
}

int RunUpdate(Args& args, const mc3d::factory::RuntimeDependencies& deps) {
  auto pos = Positionals(args, 3);
  if (!args.Done()) throw UsageError("unexpected argument " + args.Peek());

  auto outcome = mc3d::curation::Update(*deps.repository, *deps.matcher, pos[0], pos[1], pos[2]);
  std::cout << "Took " << outcome.kept_old << " structures where the old one was fine.\n"
            << "Took " << outcome.updated << " structures where the new one was different.\n"
            << "Found " << outcome.added << " structures which are new.\n";
  return 0;
}

int RunUniq(Args& args, RuntimeConfig config, const mc3d::factory::RuntimeDependencies& deps) {
  mc3d::curation::CandidateQuery query;
  auto*                          uniq = config.mutable_uniq();

  std::optional<std::string> matcher_settings;

  while (!args.Done()) {
    const auto arg = args.Next();
    if (arg == "-o" || arg == "--output") {
      uniq->set_output_path(args.Value(arg));
    } else if (arg == "--method") {
      uniq->set_method(args.Value(arg));
    } else if (arg == "--no-sort-by-spg") {
      uniq->set_sort_by_spacegroup(false);
    } else if (arg == "--sort-by-spg") {
      uniq->set_sort_by_spacegroup(true);
    } else if (arg == "--matcher-settings") {
      matcher_settings = args.Value(arg);
    } else if (arg == "--parallelize") {
      uniq->set_parallelize(ParseCount(arg, args.Value(arg)));
    } else if (arg == "--chunk-size") {
      uniq->set_chunk_size(ParseCount(arg, args.Value(arg)));
    } else if (arg == "--checkpoint") {
      uniq->set_checkpoint_path(args.Value(arg));
    } else if (arg == "-c" || arg == "--contains") {
      query.contains_elements.push_back(args.Value(arg));
    } else if (arg == "-S" || arg == "--skip") {
      query.skip_elements.push_back(args.Value(arg));
    } else if (arg.rfind("-", 0) == 0) {
      throw UsageError("unknown option " + arg);
    } else {
      query.groups.push_back(arg);
    }
  }
  if (query.groups.empty()) throw UsageError("uniq needs at least one source group");

  mc3d::uniq::UniquenessOptions options;
  try {
    options = mc3d::uniq::UniquenessOptions::FromConfig(*uniq);
  } catch (const std::invalid_argument& e) {
    throw UsageError(e.what());
  }

  auto matcher = deps.matcher;
  if (matcher_settings) {
    matcher = mc3d::factory::BuildMatcher(mc3d::config::ConfigLoader::LoadMatcherSettings(*matcher_settings));
  }

  auto candidates = mc3d::curation::LoadCandidates(*deps.repository, query);

  mc3d::uniq::UniquenessEngine engine(options, *matcher, *deps.detector);
  auto                         result = engine.Run(candidates);

  for (const auto& error : result.errors) {
    MC3D_LOG_WARN("Structure left out", {StringField("source", error.source), StringField("error", error.message)});
  }
  std::cout << "Found " << result.stats.families << " unique families.\n";
  return 0;
}

int RunSelect(Args& args, const RuntimeConfig& config, const mc3d::factory::RuntimeDependencies& deps) {
  auto pos     = Positionals(args, 3);
  auto options = mc3d::selection::SelectionOptions::FromConfig(config.selection());

  while (!args.Done()) {
    const auto arg = args.Next();
    if (arg == "--selected") {
      options.selected_path = args.Value(arg);
    } else if (arg == "--new-data") {
      options.new_data_path = args.Value(arg);
    } else if (arg == "--group") {
      options.new_uniques_group = args.Value(arg);
    } else {
      throw UsageError("unknown option " + arg);
    }
  }

  mc3d::selection::SelectionService service(*deps.repository, *deps.detector, options);
  auto                              outcome = service.Run(pos[0], pos[1], pos[2]);

  std::cout << "Found " << outcome.report.new_families.size() << " new families.\n";
  if (!outcome.report.conflicts.empty() || !outcome.report.orphaned.empty()) {
    std::cout << "Conflicts: " << outcome.report.conflicts.size() << ", ids without family: " << outcome.report.orphaned.size()
              << "\n";
  }
  return 0;
}

bool ConfirmOverwrite(const std::vector<std::string>& overlapping) {
  std::cout << "Found issues for " << overlapping.size() << " sources that are already in the ledger.\n"
            << "Do you want to continue? This will overwrite the issues. [y/N] " << std::flush;
  std::string answer;
  std::getline(std::cin, answer);
  return answer == "y" || answer == "Y" || answer == "yes";
}

int RunAnalyse(Args& args, const mc3d::factory::RuntimeDependencies& deps) {
  const auto what = args.Next();

  std::vector<std::string> pos;
  if (what == "id-removed" || what == "structure-updated") {
    pos = Positionals(args, 2);
  } else if (what != "incorrect-formula") {
    throw UsageError("unknown analysis " + what);
  }

  std::string file = "deprecation.json";
  bool        yes  = false;
  while (!args.Done()) {
    const auto arg = args.Next();
    if (arg == "--file") {
      file = args.Value(arg);
    } else if (arg == "--yes" && what == "incorrect-formula") {
      yes = true;
    } else {
      throw UsageError("unknown option " + arg);
    }
  }

  mc3d::ledger::DeprecationAnalysis analysis(*deps.repository);
  mc3d::ledger::MergeOutcome        outcome;

  if (what == "id-removed") {
    outcome = mc3d::ledger::MergeInto(file, analysis.IdRemoved(pos[0], pos[1]), mc3d::ledger::MergePolicy::kOverwrite);
  } else if (what == "structure-updated") {
    outcome = mc3d::ledger::MergeInto(file, analysis.StructureUpdated(pos[0], pos[1]),
                                      mc3d::ledger::MergePolicy::kRejectOnConflict);
  } else {
    mc3d::ledger::ConfirmFn confirm = ConfirmOverwrite;
    if (yes) confirm = [](const std::vector<std::string>&) { return true; };
    outcome = mc3d::ledger::MergeInto(file, analysis.IncorrectFormula(), mc3d::ledger::MergePolicy::kConfirmOverwrite, confirm);
  }

  std::cout << "Ledger " << file << ": " << outcome.added << " added, " << outcome.overwritten << " overwritten, "
            << outcome.total << " total\n";
  return 0;
}

int RunCompare(Args& args, const mc3d::factory::RuntimeDependencies& deps) {
  auto   pos        = Positionals(args, 2);
  double tol_factor = 1.0;
  while (!args.Done()) {
    const auto arg = args.Next();
    if (arg != "--tol-factor") throw UsageError("unknown option " + arg);
    const auto value = args.Value(arg);
    try {
      tol_factor = std::stod(value);
    } catch (const std::logic_error&) {
      throw UsageError("--tol-factor expects a number");
    }
  }

  mc3d::db::SourceIndex index(*deps.repository, mc3d::db::StructureFilter{});
  const bool match = mc3d::curation::CompareSources(index, *deps.repository, *deps.detector, pos[0], pos[1], tol_factor);
  std::cout << (match ? "match" : "no match") << "\n";
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  int         first = 1;
  std::string config_path;
  if (argc >= 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    first       = 3;
  }
  if (first >= argc) {
    Usage();
    return 1;
  }

  const std::string cmd = argv[first];
  if (cmd == "-h" || cmd == "--help" || cmd == "help") {
    Usage();
    return 0;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? mc3d::config::ConfigLoader::Default()
                                      : mc3d::config::ConfigLoader::LoadFromYaml(config_path);

    mc3d::observability::InitializeLogging(config);

    Args args(argc, argv, first + 1);
    int  rc = 0;

    try {
      static const std::vector<std::string> kCommands = {"import", "curate", "update", "uniq",
                                                         "select", "analyse", "compare"};
      if (std::find(kCommands.begin(), kCommands.end(), cmd) == kCommands.end()) {
        throw UsageError("unknown command " + cmd);
      }

      auto deps = mc3d::factory::BuildRuntime(config);

      if (cmd == "import") {
        rc = RunImport(args, deps);
      } else if (cmd == "curate") {
        rc = RunCurate(args, deps);
      } else if (cmd == "update") {
        rc = RunUpdate(args, deps);
      } else if (cmd == "uniq") {
        rc = RunUniq(args, config, deps);
      } else if (cmd == "select") {
        rc = RunSelect(args, config, deps);
      } else if (cmd == "analyse") {
        rc = RunAnalyse(args, deps);
      } else {
        rc = RunCompare(args, deps);
      }
    } catch (const UsageError& e) {
      std::cerr << "error: " << e.what() << "\n";
      Usage();
      mc3d::observability::ShutdownLogging();
      return 1;
    }

    mc3d::observability::ShutdownLogging();
    return rc;
  } catch (const mc3d::util::LedgerConflictError& e) {
    MC3D_LOG_CRITICAL("Fatal error", {StringField("error", e.what()), IntField("conflicting_keys", static_cast<int64_t>(e.Keys().size()))});
    mc3d::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    MC3D_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    mc3d::observability::ShutdownLogging();
    return 2;
  }
}
