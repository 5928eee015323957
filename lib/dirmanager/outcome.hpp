#ifndef OUTCOME_HPP
#define OUTCOME_HPP

#include <filesystem>
#include <string>

/**
 * @brief Result of moving or deleting a single path
 *
 * A batch produces one Outcome per input path. Nothing here is persisted;
 * the Application turns outcomes into output lines through describe().
 */
struct Outcome {
  enum class Status { Moved, Deleted, SkippedMissing, Failed };
  enum class Action { Move, Delete };

  Status status;
  Action action;
  std::filesystem::path source;
  std::filesystem::path destination; // set for Moved only
  std::string cause;                 // set for Failed only
  bool directory = false;

  static Outcome moved(const std::filesystem::path &src,
                       const std::filesystem::path &dst, bool isDir) {
    return Outcome{Status::Moved, Action::Move, src, dst, "", isDir};
  }

  static Outcome deleted(const std::filesystem::path &src, bool isDir) {
    return Outcome{Status::Deleted, Action::Delete, src, {}, "", isDir};
  }

  static Outcome missing(const std::filesystem::path &src, Action action) {
    return Outcome{Status::SkippedMissing, action, src, {}, "", false};
  }

  static Outcome failed(const std::filesystem::path &src, Action action,
                        const std::string &why, bool isDir) {
    return Outcome{Status::Failed, action, src, {}, why, isDir};
  }

  bool succeeded() const {
    return status == Status::Moved || status == Status::Deleted;
  }

  /**
   * @brief One human-readable line for this outcome
   *
   * Examples:
   * - "Moved: /a/x.txt -> /dup/x_1.txt"
   * - "Deleted folder: /a/old"
   * - "Source not found (already moved or deleted): /a/x.txt"
   * - "Error deleting /a/x.txt: Permission denied"
   */
  std::string describe() const {
    switch (status) {
    case Status::Moved:
      return "Moved: " + source.string() + " -> " + destination.string();
    case Status::Deleted:
      return std::string(directory ? "Deleted folder: " : "Deleted file: ") +
             source.string();
    case Status::SkippedMissing:
      return "Source not found (already moved or deleted): " + source.string();
    case Status::Failed:
      return std::string(action == Action::Move ? "Error moving "
                                                : "Error deleting ") +
             source.string() + ": " + cause;
    default:
      return "Unknown outcome";
    }
  }
};

#endif // OUTCOME_HPP
