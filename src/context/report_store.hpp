#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

enum class ReportStatus {
    Pending,
    InProgress,
    Done,
    Failed,
};

const char* report_status_name(ReportStatus s);
std::optional<ReportStatus> parse_report_status(const std::string& name);

struct Finding {
    std::string description;
    std::string severity;
    std::optional<std::string> file;
    std::optional<int> line;
};

// What an agent leaves behind when it finishes a task.
struct Report {
    std::string task_id;
    int expert_id = 0;
    std::string expert_name;
    ReportStatus status = ReportStatus::InProgress;
    std::string started_at;
    std::optional<std::string> completed_at;
    std::string summary;
    std::vector<Finding> findings;
    std::vector<std::string> recommendations;
    std::vector<std::string> files_modified;
    std::vector<std::string> files_created;
    std::vector<std::string> errors;

    // Problems that make the report unusable; empty when valid.
    std::vector<std::string> validate() const;
};

// queue/reports/expert<N>_report.yaml, one report per agent.
// Agents write these files; crew reads, lists and clears them.
class ReportStore {
public:
    explicit ReportStore(fs::path reports_dir);

    const fs::path& dir() const { return dir_; }
    fs::path report_file(int expert_id) const;

    Result<void> write(const Report& report);
    Result<std::optional<Report>> read(int expert_id) const;
    Result<void> clear(int expert_id);

    // Every readable, valid report, oldest first. Bad files are logged and skipped.
    std::vector<Report> list() const;

private:
    fs::path dir_;
};
