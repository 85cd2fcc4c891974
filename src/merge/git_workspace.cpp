#include "merge/git_workspace.hpp"

#include "core/fs_utils.hpp"

#include <array>
#include <cstdio>
#include <system_error>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace cupkit::merge {

namespace {

using core::errors::ErrorKind;
using core::errors::OpError;

std::string ShellQuote(std::string_view raw) {
  std::string quoted = "'";
  for (const char c : raw) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

bool RunShellCommand(const std::string& command, std::string& output, int& exit_code,
                     std::string& error) {
  output.clear();
  exit_code = -1;

  const std::string wrapped = command + " 2>&1";
#if defined(_WIN32)
  FILE* pipe = _popen(wrapped.c_str(), "r");
#else
  FILE* pipe = popen(wrapped.c_str(), "r");
#endif
  if (pipe == nullptr) {
    error = "failed to execute command: " + command;
    return false;
  }

  // fread, not fgets: porcelain -z output is NUL separated.
  std::array<char, 4096> buffer{};
  std::size_t read_count = 0;
  while ((read_count = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0U) {
    output.append(buffer.data(), read_count);
  }

#if defined(_WIN32)
  exit_code = _pclose(pipe);
#else
  const int raw_status = pclose(pipe);
  if (raw_status == -1) {
    exit_code = -1;
  } else if (WIFEXITED(raw_status)) {
    exit_code = WEXITSTATUS(raw_status);
  } else {
    exit_code = raw_status;
  }
#endif
  return true;
}

std::string TrimTrailingNewlines(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  return text;
}

} // namespace

bool ParsePorcelainConflicts(std::string_view output, std::vector<Conflict>& conflicts,
                             OpError& error) {
  conflicts.clear();
  std::size_t cursor = 0;
  while (cursor < output.size()) {
    std::size_t end = output.find('\0', cursor);
    if (end == std::string_view::npos) {
      end = output.size();
    }
    const std::string_view record = output.substr(cursor, end - cursor);
    cursor = end + 1U;
    if (record.empty()) {
      continue;
    }
    if (record.size() < 4U || record[2] != ' ') {
      return core::errors::Fail(error, ErrorKind::kParseError,
                                "unexpected git status record: " + std::string(record));
    }

    const std::string_view code = record.substr(0, 2);
    // Renames and copies carry their source path as an extra record.
    if (code[0] == 'R' || code[0] == 'C') {
      const std::size_t source_end = output.find('\0', cursor);
      cursor = source_end == std::string_view::npos ? output.size() : source_end + 1U;
      continue;
    }

    ConflictState state = ConflictState::kBothModified;
    if (ParseConflictState(code, state)) {
      conflicts.push_back({std::string(record.substr(3)), state});
    }
  }
  return true;
}

bool GitWorkspace::RunGit(const std::string& args, std::string& output, OpError& error) const {
  const std::string command = "git -C " + ShellQuote(top_level_.string()) + " " + args;
  int exit_code = -1;
  std::string run_error;
  if (!RunShellCommand(command, output, exit_code, run_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, run_error);
  }
  if (exit_code != 0) {
    return core::errors::Fail(error, ErrorKind::kIoError,
                              "git " + args + " exited with " + std::to_string(exit_code) +
                                  ": " + TrimTrailingNewlines(output));
  }
  return true;
}

bool GitWorkspace::Open(const fs::path& tree, OpError& error) {
  std::error_code ec;
  if (!fs::is_directory(tree, ec) || ec) {
    return core::errors::Fail(error, ErrorKind::kNotFound,
                              "working tree not found: " + tree.string());
  }

  top_level_ = tree;
  std::string output;
  if (!RunGit("rev-parse --show-toplevel", output, error)) {
    error.kind = ErrorKind::kNotFound;
    error.message = "not a git working tree: " + tree.string() + " (" + error.message + ")";
    return false;
  }
  top_level_ = fs::path(TrimTrailingNewlines(output));
  return true;
}

bool GitWorkspace::ListConflicts(std::vector<Conflict>& conflicts, OpError& error) {
  std::string output;
  if (!RunGit("status --porcelain=v1 -z --untracked-files=no", output, error)) {
    return false;
  }
  return ParsePorcelainConflicts(output, conflicts, error);
}

bool GitWorkspace::Exists(const std::string& path) {
  std::error_code ec;
  return fs::exists(top_level_ / path, ec) && !ec;
}

bool GitWorkspace::CheckoutOurs(const std::string& path, OpError& error) {
  std::string output;
  return RunGit("checkout --ours -- " + ShellQuote(path), output, error);
}

bool GitWorkspace::CheckoutTheirs(const std::string& path, OpError& error) {
  std::string output;
  return RunGit("checkout --theirs -- " + ShellQuote(path), output, error);
}

bool GitWorkspace::Remove(const std::string& path, OpError& error) {
  bool removed = false;
  std::string io_error;
  if (!core::RemovePathIfExists(top_level_ / path, removed, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, io_error);
  }
  return true;
}

bool GitWorkspace::Move(const std::string& from, const std::string& to, OpError& error) {
  std::string io_error;
  if (!core::MovePath(top_level_ / from, top_level_ / to, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, io_error);
  }
  return true;
}

bool GitWorkspace::Write(const std::string& path, std::string_view text, OpError& error) {
  std::string io_error;
  if (!core::WriteTextFileAtomic(top_level_ / path, text, io_error)) {
    return core::errors::Fail(error, ErrorKind::kIoError, io_error);
  }
  return true;
}

bool GitWorkspace::Stage(const std::string& path, OpError& error) {
  std::string output;
  return RunGit("add -A -- " + ShellQuote(path), output, error);
}

} // namespace cupkit::merge
