#include "worktree_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <algorithm>

static fs::path normalized(const fs::path& p) {
    std::error_code ec;
    auto c = fs::weakly_canonical(p, ec);
    return ec ? p.lexically_normal() : c;
}

WorktreeManager::WorktreeManager(std::shared_ptr<CommandRunner> runner, fs::path git_root)
    : runner_(std::move(runner)), git_root_(std::move(git_root)) {}

CommandResult WorktreeManager::git(const std::vector<std::string>& args) {
    return runner_->run("git", args, git_root_.string());
}

Result<fs::path> WorktreeManager::resolve_git_root(CommandRunner& runner,
                                                   const fs::path& project_path) {
    auto r = runner.run("git", {"rev-parse", "--path-format=absolute", "--git-common-dir"},
                        project_path.string());
    if (r.failed()) {
        return Result<fs::path>::Err(
            describe_failure(fmt::format("{} is not inside a git repository",
                                         project_path.string()), "git", r),
            ErrorKind::Infrastructure);
    }

    std::string common = r.stdout_data;
    trim(common);
    fs::path common_dir(common);
    fs::path root = common_dir.parent_path();
    if (root.empty()) root = project_path;
    return Result<fs::path>::Ok(normalized(root));
}

fs::path WorktreeManager::data_path() const { return git_root_ / DATA_DIR_NAME; }
fs::path WorktreeManager::worktree_dir() const { return data_path() / "worktrees"; }
fs::path WorktreeManager::worktree_path(const std::string& branch) const {
    return worktree_dir() / branch;
}

// ── Queries ─────────────────────────────────────────────────

Result<std::vector<fs::path>> WorktreeManager::list_worktrees() {
    auto r = git({"worktree", "list", "--porcelain"});
    if (r.failed()) {
        return Result<std::vector<fs::path>>::Err(
            describe_failure("Failed to list worktrees", "git", r),
            ErrorKind::ExternalCommandFailed);
    }

    std::vector<fs::path> out;
    const std::string prefix = "worktree ";
    for (const auto& line : split_lines(r.stdout_data)) {
        if (line.compare(0, prefix.size(), prefix) == 0) {
            out.push_back(normalized(line.substr(prefix.size())));
        }
    }
    return Result<std::vector<fs::path>>::Ok(out);
}

// ── Create / attach ─────────────────────────────────────────

Result<fs::path> WorktreeManager::create_worktree(const std::string& branch) {
    auto check = git({"check-ref-format", "--branch", branch});
    if (branch.empty() || check.failed()) {
        return Result<fs::path>::Err(fmt::format("Invalid branch name '{}'", branch),
                                     ErrorKind::InvalidInput);
    }

    fs::path wt_path = worktree_path(branch);

    auto registered = list_worktrees();
    if (registered.is_err()) return Result<fs::path>::Err(registered.error, registered.kind);
    bool is_registered = std::find(registered.value.begin(), registered.value.end(),
                                   normalized(wt_path)) != registered.value.end();

    std::error_code ec;
    bool on_disk = fs::exists(wt_path, ec);

    if (on_disk && is_registered) {
        crew_log(fmt::format("worktree: reusing {}", wt_path.string()));
        return Result<fs::path>::Ok(wt_path);
    }
    if (on_disk) {
        return Result<fs::path>::Err(
            fmt::format("{} exists but git does not know it as a worktree; "
                        "remove it and run `git worktree prune`", wt_path.string()),
            ErrorKind::StaleResourceState);
    }
    if (is_registered) {
        return Result<fs::path>::Err(
            fmt::format("Worktree {} is registered but missing on disk; "
                        "run `git worktree prune`", wt_path.string()),
            ErrorKind::StaleResourceState);
    }

    fs::create_directories(wt_path.parent_path(), ec);
    if (ec) {
        return Result<fs::path>::Err(
            fmt::format("Failed to create {}: {}", wt_path.parent_path().string(), ec.message()),
            ErrorKind::Io);
    }

    // Existing branch first, new branch second
    auto attach = git({"worktree", "add", wt_path.string(), branch});
    if (attach.success()) {
        crew_log(fmt::format("worktree: attached {} at {}", branch, wt_path.string()));
        return Result<fs::path>::Ok(wt_path);
    }

    auto create = git({"worktree", "add", wt_path.string(), "-b", branch});
    if (create.failed()) {
        return Result<fs::path>::Err(
            describe_failure("git worktree add failed", "git", create),
            ErrorKind::ExternalCommandFailed);
    }
    crew_log(fmt::format("worktree: created branch {} at {}", branch, wt_path.string()));
    return Result<fs::path>::Ok(wt_path);
}

// ── Alias ───────────────────────────────────────────────────

Result<void> WorktreeManager::establish_alias(const fs::path& worktree_path) {
    std::error_code ec;
    fs::path target = fs::canonical(data_path(), ec);
    if (ec) {
        return Result<void>::Err(
            fmt::format("Cannot resolve {}: {}", data_path().string(), ec.message()),
            ErrorKind::Io);
    }

    fs::path alias = worktree_path / DATA_DIR_NAME;
    if (fs::is_symlink(fs::symlink_status(alias, ec)) || fs::exists(alias, ec)) {
        // Plain remove handles links and files; a real directory needs remove_all
        if (!fs::remove(alias, ec) || ec) {
            ec.clear();
            fs::remove_all(alias, ec);
            if (ec) {
                return Result<void>::Err(
                    fmt::format("Cannot replace {}: {}", alias.string(), ec.message()),
                    ErrorKind::StaleResourceState);
            }
        }
    }

    fs::create_directory_symlink(target, alias, ec);
    if (ec) {
        return Result<void>::Err(
            fmt::format("Failed to link {} -> {}: {}", alias.string(), target.string(),
                        ec.message()),
            ErrorKind::Io);
    }
    return Result<void>::Ok();
}

// ── Remove ──────────────────────────────────────────────────

Result<void> WorktreeManager::remove_worktree(const std::string& branch) {
    fs::path wt_path = worktree_path(branch);

    // The alias is untracked content and would make git refuse the removal
    std::error_code ec;
    fs::path alias = wt_path / DATA_DIR_NAME;
    if (fs::is_symlink(fs::symlink_status(alias, ec))) {
        fs::remove(alias, ec);
    }

    auto r = git({"worktree", "remove", wt_path.string()});
    if (r.failed()) {
        return Result<void>::Err(describe_failure("git worktree remove failed", "git", r),
                                 ErrorKind::ExternalCommandFailed);
    }
    return Result<void>::Ok();
}

Result<void> WorktreeManager::ensure_excluded() {
    auto r = git({"rev-parse", "--path-format=absolute", "--git-common-dir"});
    if (r.failed()) {
        return Result<void>::Err(describe_failure("Failed to locate git dir", "git", r),
                                 ErrorKind::ExternalCommandFailed);
    }
    std::string common = r.stdout_data;
    trim(common);
    fs::path exclude = fs::path(common) / "info" / "exclude";

    std::string pattern = std::string("/") + DATA_DIR_NAME;
    std::ifstream in(exclude);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line == pattern || line == DATA_DIR_NAME || line == pattern + "/") {
            return Result<void>::Ok();
        }
    }
    in.close();

    std::error_code ec;
    fs::create_directories(exclude.parent_path(), ec);
    std::ofstream out(exclude, std::ios::app);
    if (!out) {
        return Result<void>::Err("Cannot write " + exclude.string(), ErrorKind::Io);
    }
    out << pattern << "\n";
    return Result<void>::Ok();
}
