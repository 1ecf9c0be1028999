#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include <core/types.hpp>
#include "command_runner.hpp"

namespace fs = std::filesystem;

// One checkout per branch under <git root>/.crew/worktrees/<branch>, each
// carrying a .crew symlink back to the shared data root.
class WorktreeManager {
public:
    WorktreeManager(std::shared_ptr<CommandRunner> runner, fs::path git_root);

    // Main repository root, even when project_path is itself a worktree.
    static Result<fs::path> resolve_git_root(CommandRunner& runner, const fs::path& project_path);

    const fs::path& git_root() const { return git_root_; }
    fs::path data_path() const;
    fs::path worktree_dir() const;
    fs::path worktree_path(const std::string& branch) const;

    // Paths git currently has registered, main checkout included.
    Result<std::vector<fs::path>> list_worktrees();

    // Attach the branch if it exists, else create it. Returns the existing
    // path when the worktree is already there.
    Result<fs::path> create_worktree(const std::string& branch);

    // Replace <worktree>/.crew with a symlink to the canonical data root.
    Result<void> establish_alias(const fs::path& worktree_path);

    // Removes the alias and then the checkout. The branch is kept.
    Result<void> remove_worktree(const std::string& branch);

    // Keep .crew out of `git status` in every checkout.
    Result<void> ensure_excluded();

private:
    CommandResult git(const std::vector<std::string>& args);

    std::shared_ptr<CommandRunner> runner_;
    fs::path git_root_;
};
