/**
 * @file commandline.cpp
 * @brief Implementation of the command-line parser
 */

#include "commandline.hpp"
#include "nameindex.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return s;
}

const std::map<std::string, Options::Command> &commandTable() {
  static const std::map<std::string, Options::Command> table = {
      {"report", Options::Command::Report},
      {"move", Options::Command::Move},
      {"move-out", Options::Command::MoveOut},
      {"delete", Options::Command::Delete},
      {"consolidate", Options::Command::Consolidate},
      {"help", Options::Command::Help},
  };
  return table;
}

} // namespace

CommandLine::ParseResult CommandLine::parse(int argc,
                                            const char *const argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse(args);
}

CommandLine::ParseResult
CommandLine::parse(const std::vector<std::string> &args) {
  ParseResult result;
  Options &opts = result.options;

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string arg = args[i];

    // Split "--opt=value"
    std::string inlineValue;
    bool hasInlineValue = false;
    if (arg.rfind("--", 0) == 0) {
      auto eq = arg.find('=');
      if (eq != std::string::npos) {
        inlineValue = arg.substr(eq + 1);
        arg = arg.substr(0, eq);
        hasInlineValue = true;
      }
    }

    const std::string bare = arg.rfind("--", 0) == 0 ? arg.substr(2) : arg;

    auto command = commandTable().find(bare);
    if (command != commandTable().end() && !hasInlineValue) {
      if (opts.command != Options::Command::None) {
        result.error = "Only one command may be given (got `" +
                       commandName(opts.command) + "` and `" + bare + "`).";
        return result;
      }
      opts.command = command->second;
      continue;
    }

    if (arg == "--cleanup" || arg == "--all") {
      if (hasInlineValue) {
        result.error = "Option `" + arg + "` does not take a value.";
        return result;
      }
      (arg == "--cleanup" ? opts.cleanup : opts.all) = true;
      continue;
    }

    std::string *target = nullptr;
    if (arg == "--type")
      target = &opts.type;
    else if (arg == "--location")
      target = &opts.location;
    else if (arg == "--name")
      target = &opts.name;
    else if (arg == "--search-location")
      target = &opts.searchLocation;

    if (!target) {
      result.error = "Unknown argument: " + args[i];
      return result;
    }

    std::string value;
    if (hasInlineValue) {
      value = inlineValue;
    } else if (i + 1 < args.size()) {
      value = args[++i];
    } else {
      result.error = "Missing value for `" + arg + "`.";
      return result;
    }

    if (value.empty()) {
      result.error = "Empty value for `" + arg + "`.";
      return result;
    }

    *target = (target == &opts.location || target == &opts.searchLocation)
                  ? parseLocation(value)
                  : value;
  }

  if (opts.command == Options::Command::None) {
    result.error = "No command given.";
    return result;
  }

  result.ok = true;
  return result;
}

std::string CommandLine::parseLocation(const std::string &value) {
  const std::string prefix = "path=";
  if (value.rfind(prefix, 0) == 0) {
    return value.substr(prefix.size());
  }
  return value;
}

ItemSelection CommandLine::resolveType(const Options &options) {
  ItemSelection selection;
  const bool isReport = options.command == Options::Command::Report;
  const std::string type = toLower(options.type);

  if (type == "file") {
    selection.kind = Entry::Kind::File;
  } else if (type == "folder") {
    selection.kind = Entry::Kind::Directory;
  } else if (!type.empty() && type.front() == '.') {
    selection.kind = Entry::Kind::File;
    selection.extension = IndexFilter::normalizeExtension(type);
  } else {
    selection.kind = isReport ? Entry::Kind::Directory : Entry::Kind::File;
  }

  return selection;
}

bool CommandLine::isTextType(const Options &options) {
  return toLower(options.type) == ".txt";
}

std::string CommandLine::commandName(Options::Command command) {
  for (const auto &entry : commandTable()) {
    if (entry.second == command)
      return entry.first;
  }
  return "none";
}

std::string CommandLine::usage() {
  return R"(Usage: dirmanager <command> [options]

Commands:
  report             Generate a JSON report of duplicate files or folders.
                     Searches for folders unless --type says otherwise.
  move               Move duplicates (all but the first occurrence) to a directory.
  move-out           Move nested files into the current directory; with
                     --type folder, move the deepest folder that holds files.
  delete             Delete duplicates, keeping the first occurrence.
  consolidate        Merge the unique contents of all .txt files into one file.
                     Only works with --type .txt.
  help               Show this help.

Options:
  --type <t>             file, folder or an extension such as .txt or .jpg.
                         Defaults to folder for report and file otherwise.
  --location <dir>       Destination for reports, moved items or the merged file
                         (path=<dir> is accepted too).
                         Defaults: ./reports, ./duplicate, ./consolidated.
  --name <name>          Only consider items with exactly this name.
  --cleanup              With report: report empty directories only.
                         With delete: remove empty directories recursively.
  --search-location <d>  Directory to scan (path=<dir> is accepted too).
                         Defaults to the current directory.
  --all                  With move or delete: act on every matching item,
                         not only on duplicates.

Examples:
  dirmanager report --type file --location path=/srv/reports
  dirmanager move --type .txt --location /tmp/dups
  dirmanager move-out --type folder
  dirmanager delete --all --type .tmp
  dirmanager report --cleanup
  dirmanager consolidate --type .txt --search-location path=/opt/var/data
)";
}
