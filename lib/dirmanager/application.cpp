/**
 * @file application.cpp
 * @brief Command dispatch and result reporting
 */

#include "application.hpp"

#include <cstdlib>

#include "consolidator.hpp"
#include "duplicatefinder.hpp"
#include "emptydirectoryscanner.hpp"
#include "moveout.hpp"
#include "nameindex.hpp"
#include "relocator.hpp"
#include "reportbuilder.hpp"

namespace fs = std::filesystem;

int Application::run(const Options &options, const fs::path &workingDir) {
  using Command = Options::Command;

  if (options.command == Command::Help) {
    m_out << CommandLine::usage();
    return EXIT_SUCCESS;
  }

  if (options.command == Command::None) {
    m_err << "Invalid command or option provided.\n" << CommandLine::usage();
    return EXIT_FAILURE;
  }

  if (options.cleanup && options.command != Command::Report &&
      options.command != Command::Delete) {
    m_err << "Warning: The --cleanup option is only supported with report "
             "and delete. Ignoring --cleanup."
          << std::endl;
  }

  fs::path root = workingDir;
  if (!options.searchLocation.empty()) {
    root = resolve(workingDir, options.searchLocation);
  }
  if (!m_fs.isDirectory(root)) {
    m_err << "Error: Provided search location '" << root.string()
          << "' is not a valid directory." << std::endl;
    return EXIT_FAILURE;
  }

  if (options.command == Command::Consolidate &&
      !CommandLine::isTextType(options)) {
    m_err << "Error: The consolidate command only supports --type .txt.\n"
          << CommandLine::usage();
    return EXIT_FAILURE;
  }

  const fs::path destination =
      options.location.empty()
          ? workingDir / defaultDestination(options.command)
          : resolve(workingDir, options.location);

  switch (options.command) {
  case Command::Report:
    return runReport(options, root, destination);
  case Command::Move:
    return runMove(options, root, destination);
  case Command::Delete:
    return runDelete(options, root);
  case Command::MoveOut:
    return runMoveOut(options, root, workingDir);
  case Command::Consolidate:
    return runConsolidate(root, destination);
  default:
    m_err << "Invalid command or option provided.\n" << CommandLine::usage();
    return EXIT_FAILURE;
  }
}

/**
 * @brief Writes the duplicate report, or the empty-directory report with
 * --cleanup
 *
 * With --cleanup, --type and --name are ignored.
 */
int Application::runReport(const Options &options, const fs::path &root,
                           const fs::path &destination) {
  if (options.cleanup) {
    EmptyDirectoryScanner scanner(m_fs, m_guard);
    auto empty = scanner.findEmpty(root);
    if (empty.empty()) {
      m_out << "No empty directories found." << std::endl;
      return EXIT_SUCCESS;
    }

    auto written = m_writer.write(
        destination, ReportBuilder::kEmptyDirectoryReportName,
        ReportBuilder::serialize(ReportBuilder::emptyDirectoryReport(empty)));
    if (!written.ok) {
      m_err << "Error generating empty directories report: " << written.error
            << std::endl;
      return EXIT_FAILURE;
    }
    m_out << "Empty directories report generated at: "
          << written.path.string() << std::endl;
    return EXIT_SUCCESS;
  }

  const auto selection = CommandLine::resolveType(options);
  IndexFilter filter{selection.kind, options.name, selection.extension};

  auto index = NameIndexer::build(makeWalker(destination), root, filter);
  auto groups = DuplicateFinder::findDuplicates(index);
  if (groups.empty()) {
    m_out << "No duplicates found." << std::endl;
    return EXIT_SUCCESS;
  }

  auto written = m_writer.write(
      destination, ReportBuilder::kDuplicateReportName,
      ReportBuilder::serialize(ReportBuilder::duplicateReport(groups)));
  if (!written.ok) {
    m_err << "Error generating duplicate report: " << written.error
          << std::endl;
    return EXIT_FAILURE;
  }

  m_out << "Found " << groups.size() << " duplicate name(s) with "
        << DuplicateFinder::countDuplicates(groups) << " extra copies."
        << std::endl;
  m_out << "Duplicate report generated at: " << written.path.string()
        << std::endl;
  return EXIT_SUCCESS;
}

int Application::runMove(const Options &options, const fs::path &root,
                         const fs::path &destination) {
  const auto selection = CommandLine::resolveType(options);
  IndexFilter filter{selection.kind, options.name, selection.extension};

  auto index = NameIndexer::build(makeWalker(destination), root, filter);

  std::vector<fs::path> batch;
  if (options.all) {
    if (index.empty()) {
      m_out << "No items found to move." << std::endl;
      return EXIT_SUCCESS;
    }
    batch = DuplicateFinder::allPaths(index);
  } else {
    auto groups = DuplicateFinder::findDuplicates(index);
    if (groups.empty()) {
      m_out << "No duplicates found to move." << std::endl;
      return EXIT_SUCCESS;
    }
    batch = DuplicateFinder::duplicatePaths(groups);
  }

  Relocator relocator(m_fs, m_guard);
  printOutcomes(relocator.relocate(batch, destination, Relocator::Mode::Move));
  return EXIT_SUCCESS;
}

/**
 * @brief Deletes duplicates; --all deletes every match and takes precedence
 * over --cleanup, which prunes empty directories instead
 */
int Application::runDelete(const Options &options, const fs::path &root) {
  if (!options.all && options.cleanup) {
    EmptyDirectoryScanner scanner(m_fs, m_guard);
    auto outcomes = scanner.pruneEmpty(root, root);
    if (outcomes.empty()) {
      m_out << "No empty directories found." << std::endl;
      return EXIT_SUCCESS;
    }
    for (const auto &outcome : outcomes) {
      if (outcome.succeeded()) {
        m_out << "Deleted empty directory: " << outcome.source.string()
              << std::endl;
      } else {
        m_err << "Error deleting directory " << outcome.source.string()
              << ": " << outcome.cause << std::endl;
      }
    }
    return EXIT_SUCCESS;
  }

  const auto selection = CommandLine::resolveType(options);
  IndexFilter filter{selection.kind, options.name, selection.extension};

  auto index = NameIndexer::build(makeWalker(), root, filter);

  std::vector<fs::path> batch;
  if (options.all) {
    if (index.empty()) {
      m_out << "No items found to delete." << std::endl;
      return EXIT_SUCCESS;
    }
    batch = DuplicateFinder::allPaths(index);
  } else {
    auto groups = DuplicateFinder::findDuplicates(index);
    if (groups.empty()) {
      m_out << "No duplicates found to delete." << std::endl;
      return EXIT_SUCCESS;
    }
    batch = DuplicateFinder::duplicatePaths(groups);
  }

  Relocator relocator(m_fs, m_guard);
  printOutcomes(relocator.relocate(batch, {}, Relocator::Mode::Delete));
  return EXIT_SUCCESS;
}

int Application::runMoveOut(const Options &options, const fs::path &root,
                            const fs::path &workingDir) {
  Relocator relocator(m_fs, m_guard);
  MoveOut moveOut(m_fs, relocator);

  if (CommandLine::resolveType(options).kind == Entry::Kind::Directory) {
    auto outcome = moveOut.moveOutDeepestFolder(root, workingDir);
    if (!outcome) {
      m_out << "No nested folder with files found to move." << std::endl;
      return EXIT_SUCCESS;
    }
    printOutcomes({*outcome});
    return EXIT_SUCCESS;
  }

  auto outcomes = moveOut.moveOutFiles(root, workingDir);
  if (outcomes.empty()) {
    m_out << "No nested files found to move." << std::endl;
    return EXIT_SUCCESS;
  }
  printOutcomes(outcomes);
  return EXIT_SUCCESS;
}

int Application::runConsolidate(const fs::path &root,
                                const fs::path &destination) {
  Consolidator consolidator(m_fs);
  auto result = consolidator.collect(makeWalker(destination), root, ".txt");

  for (const auto &failure : result.failures) {
    m_err << "Error reading " << failure.path.string() << ": "
          << failure.message << std::endl;
  }

  if (result.contents.empty()) {
    m_out << "No text data found to consolidate." << std::endl;
    return EXIT_SUCCESS;
  }

  auto written = m_writer.write(destination, "consolidated.txt",
                                Consolidator::render(result.contents));
  if (!written.ok) {
    m_err << "Error writing consolidated file: " << written.error
          << std::endl;
    return EXIT_FAILURE;
  }

  m_out << "Consolidated " << result.contents.size() << " unique text(s) from "
        << result.filesRead << " file(s)." << std::endl;
  m_out << "Consolidated file generated at: " << written.path.string()
        << std::endl;
  return EXIT_SUCCESS;
}

TreeWalker Application::makeWalker(const fs::path &skipDir) const {
  TreeWalker walker(m_fs);
  walker.setErrorCallback([this](const fs::path &dir, const std::error_code &ec) {
    m_err << "Warning: cannot read directory " << dir.string() << ": "
          << ec.message() << std::endl;
  });
  if (!skipDir.empty()) {
    walker.exclude(skipDir);
  }
  return walker;
}

std::string Application::defaultDestination(Options::Command command) {
  switch (command) {
  case Options::Command::Report:
    return "reports";
  case Options::Command::Consolidate:
    return "consolidated";
  default:
    return "duplicate";
  }
}

fs::path Application::resolve(const fs::path &base, const std::string &value) {
  fs::path p(value);
  if (p.is_relative()) {
    p = base / p;
  }
  return p.lexically_normal();
}

void Application::printOutcomes(const std::vector<Outcome> &outcomes) {
  int done = 0;
  int skipped = 0;
  int failed = 0;

  for (const auto &outcome : outcomes) {
    switch (outcome.status) {
    case Outcome::Status::Moved:
    case Outcome::Status::Deleted:
      ++done;
      m_out << outcome.describe() << std::endl;
      break;
    case Outcome::Status::SkippedMissing:
      ++skipped;
      m_out << outcome.describe() << std::endl;
      break;
    case Outcome::Status::Failed:
      ++failed;
      m_err << outcome.describe() << std::endl;
      break;
    }
  }

  m_out << done << " done, " << skipped << " skipped, " << failed
        << " failed." << std::endl;
}
