/**
 * @file commandline.hpp
 * @brief Command-line parsing and option resolution
 *
 * Turns argv into an Options value and answers the questions that depend on
 * options alone: which kind of item a command targets and which extension,
 * if any, restricts it.
 */

#ifndef COMMANDLINE_HPP
#define COMMANDLINE_HPP

#include <string>
#include <vector>

#include "entry.hpp"

/**
 * @brief Parsed command and modifiers of one invocation
 *
 * location and searchLocation are stored with any "path=" prefix already
 * removed; they are still relative to the working directory if the user
 * gave a relative path.
 */
struct Options {
  enum class Command { None, Report, Move, MoveOut, Delete, Consolidate, Help };

  Command command = Command::None;
  std::string type;
  std::string location;
  std::string name;
  std::string searchLocation;
  bool cleanup = false;
  bool all = false;
};

/**
 * @brief What a command scans for, derived from --type
 */
struct ItemSelection {
  Entry::Kind kind = Entry::Kind::File;
  std::string extension; // normalised, empty when not filtering
};

/**
 * @class CommandLine
 * @brief Parser for the dirmanager command line
 *
 * Accepted forms:
 * - commands: report, move, move-out, delete, consolidate, help, each with
 *   or without a leading "--"
 * - valued options: --type, --location, --name, --search-location, given
 *   as "--opt value" or "--opt=value"
 * - flags: --cleanup, --all
 *
 * Exactly one command must be present.
 */
class CommandLine {
public:
  struct ParseResult {
    bool ok = false;
    Options options;
    std::string error;
  };

  /**
   * @brief Parses argv, skipping the program name in argv[0]
   */
  static ParseResult parse(int argc, const char *const argv[]);

  /**
   * @brief Parses arguments that do not include the program name
   */
  static ParseResult parse(const std::vector<std::string> &args);

  /**
   * @brief Strips a leading "path=" from a location value
   *
   * "path=/opt/data" and "/opt/data" both yield "/opt/data".
   */
  static std::string parseLocation(const std::string &value);

  /**
   * @brief Resolves --type into a kind and an optional extension
   *
   * "file" selects files, "folder" selects directories and ".ext" selects
   * files with that extension (case-insensitive). A missing or unrecognised
   * type selects directories for report and files for every other command.
   */
  static ItemSelection resolveType(const Options &options);

  /**
   * @brief True when --type names ".txt", the only type consolidate takes
   */
  static bool isTextType(const Options &options);

  static std::string commandName(Options::Command command);

  static std::string usage();
};

#endif // COMMANDLINE_HPP
