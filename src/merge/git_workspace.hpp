#pragma once

#include "merge/merge_conflict_resolver.hpp"

#include <filesystem>
#include <string>

namespace cupkit::merge {

// ConflictWorkspace over a real git checkout. Every git call runs as
// `git -C <toplevel> ...` through the shell; file moves and writes go
// straight to the filesystem under the top-level directory.
class GitWorkspace final : public ConflictWorkspace {
public:
  // Resolves the repository top level of `tree` (kNotFound when `tree` is
  // missing or not inside a git work tree).
  bool Open(const std::filesystem::path& tree, core::errors::OpError& error);

  const std::filesystem::path& TopLevel() const {
    return top_level_;
  }

  bool ListConflicts(std::vector<Conflict>& conflicts, core::errors::OpError& error) override;
  bool Exists(const std::string& path) override;
  bool CheckoutOurs(const std::string& path, core::errors::OpError& error) override;
  bool CheckoutTheirs(const std::string& path, core::errors::OpError& error) override;
  bool Remove(const std::string& path, core::errors::OpError& error) override;
  bool Move(const std::string& from, const std::string& to,
            core::errors::OpError& error) override;
  bool Write(const std::string& path, std::string_view text,
             core::errors::OpError& error) override;
  bool Stage(const std::string& path, core::errors::OpError& error) override;

private:
  bool RunGit(const std::string& args, std::string& output, core::errors::OpError& error) const;

  std::filesystem::path top_level_;
};

// Parses NUL-separated `git status --porcelain=v1 -z` output, keeping only
// unmerged entries.
bool ParsePorcelainConflicts(std::string_view output, std::vector<Conflict>& conflicts,
                             core::errors::OpError& error);

} // namespace cupkit::merge
