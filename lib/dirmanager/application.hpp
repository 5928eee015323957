/**
 * @file application.hpp
 * @brief Runs one dirmanager command end to end
 */

#ifndef APPLICATION_HPP
#define APPLICATION_HPP

#include <filesystem>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "artifactwriter.hpp"
#include "commandline.hpp"
#include "ifilesystem.hpp"
#include "outcome.hpp"
#include "pathguard.hpp"
#include "treewalker.hpp"

/**
 * @class Application
 * @brief High-level entrypoint tying the scanners, policy and relocator
 * together
 *
 * The class resolves the scan root and destination against the working
 * directory, runs the requested command and prints what happened:
 *  - progress and per-item results go to the output stream
 *  - warnings, configuration errors and per-item failures go to the error
 *    stream
 *
 * Exit status
 *  - EXIT_SUCCESS for help and for every completed run, including runs that
 *    found nothing and batches in which some items failed
 *  - EXIT_FAILURE for configuration errors (raised before anything on disk is
 *    touched) and for reports or merged files that could not be written
 *
 * The working directory is a parameter, never read from the process, so the
 * same instance can be driven against temporary trees in tests.
 *
 * @see CommandLine
 * @see Relocator
 */
class Application {
private:
  IFileSystem &m_fs;
  const PathGuard &m_guard;
  std::ostream &m_out;
  std::ostream &m_err;
  ArtifactWriter m_writer;

public:
  Application(IFileSystem &fs, const PathGuard &guard, std::ostream &out,
              std::ostream &err,
              ArtifactWriter::Clock clock = [] { return std::time(nullptr); })
      : m_fs(fs), m_guard(guard), m_out(out), m_err(err),
        m_writer(fs, std::move(clock)) {}

  /**
   * @brief Executes options against workingDir
   *
   * @param options Parsed command line
   * @param workingDir Reference directory: default scan root, base of
   *                   relative locations and the target of move-out
   *
   * @return EXIT_SUCCESS or EXIT_FAILURE
   */
  int run(const Options &options, const std::filesystem::path &workingDir);

private:
  int runReport(const Options &options, const std::filesystem::path &root,
                const std::filesystem::path &destination);
  int runMove(const Options &options, const std::filesystem::path &root,
              const std::filesystem::path &destination);
  int runDelete(const Options &options, const std::filesystem::path &root);
  int runMoveOut(const Options &options, const std::filesystem::path &root,
                 const std::filesystem::path &workingDir);
  int runConsolidate(const std::filesystem::path &root,
                     const std::filesystem::path &destination);

  /**
   * @brief Walker that reports unreadable directories and skips skipDir
   */
  TreeWalker makeWalker(const std::filesystem::path &skipDir = {}) const;
  static std::string defaultDestination(Options::Command command);
  static std::filesystem::path resolve(const std::filesystem::path &base,
                                       const std::string &value);

  /**
   * @brief Prints one line per outcome and a closing summary
   */
  void printOutcomes(const std::vector<Outcome> &outcomes);
};

#endif // APPLICATION_HPP
