#include "report_store.hpp"
#include "context_store.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <regex>

const char* report_status_name(ReportStatus s) {
    switch (s) {
        case ReportStatus::Pending:    return "pending";
        case ReportStatus::InProgress: return "in_progress";
        case ReportStatus::Done:       return "done";
        case ReportStatus::Failed:     return "failed";
    }
    return "pending";
}

std::optional<ReportStatus> parse_report_status(const std::string& name) {
    for (auto s : {ReportStatus::Pending, ReportStatus::InProgress, ReportStatus::Done,
                   ReportStatus::Failed}) {
        if (name == report_status_name(s)) return s;
    }
    return std::nullopt;
}

std::vector<std::string> Report::validate() const {
    std::vector<std::string> problems;
    if (task_id.empty()) problems.push_back("task_id is empty");
    if (expert_id < 0) problems.push_back("expert_id is negative");
    if (started_at.empty()) problems.push_back("started_at is empty");
    if ((status == ReportStatus::Done || status == ReportStatus::Failed) && !completed_at) {
        problems.push_back(fmt::format("status {} needs completed_at", report_status_name(status)));
    }
    for (const auto& f : findings) {
        if (f.description.empty()) problems.push_back("finding without a description");
    }
    return problems;
}

ReportStore::ReportStore(fs::path reports_dir) : dir_(std::move(reports_dir)) {}

fs::path ReportStore::report_file(int expert_id) const {
    return dir_ / fmt::format("expert{}_report.yaml", expert_id);
}

// ── helpers ─────────────────────────────────────────────────

static std::vector<std::string> read_strings(const YAML::Node& n) {
    if (!n || !n.IsSequence()) return {};
    return n.as<std::vector<std::string>>();
}

static Result<Report> parse_report(const YAML::Node& root) {
    Report r;
    r.task_id = root["task_id"].as<std::string>("");
    r.expert_id = root["expert_id"].as<int>(-1);
    r.expert_name = root["expert_name"].as<std::string>("");
    std::string status = root["status"].as<std::string>("");
    auto parsed = parse_report_status(status);
    if (!parsed) {
        return Result<Report>::Err(fmt::format("unknown status '{}'", status),
                                   ErrorKind::InvalidInput);
    }
    r.status = *parsed;
    r.started_at = root["started_at"].as<std::string>("");
    if (root["completed_at"] && !root["completed_at"].IsNull()) {
        r.completed_at = root["completed_at"].as<std::string>();
    }
    r.summary = root["summary"].as<std::string>("");

    const YAML::Node details = root["details"];
    if (details && details.IsMap()) {
        if (details["findings"] && details["findings"].IsSequence()) {
            for (const auto& n : details["findings"]) {
                Finding f;
                f.description = n["description"].as<std::string>("");
                f.severity = n["severity"].as<std::string>("");
                if (n["file"] && !n["file"].IsNull()) f.file = n["file"].as<std::string>();
                if (n["line"] && !n["line"].IsNull()) f.line = n["line"].as<int>();
                r.findings.push_back(f);
            }
        }
        r.recommendations = read_strings(details["recommendations"]);
        r.files_modified = read_strings(details["files_modified"]);
        r.files_created = read_strings(details["files_created"]);
    }
    r.errors = read_strings(root["errors"]);
    return Result<Report>::Ok(r);
}

// ── Read / write ────────────────────────────────────────────

Result<void> ReportStore::write(const Report& report) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "task_id" << YAML::Value << report.task_id;
    out << YAML::Key << "expert_id" << YAML::Value << report.expert_id;
    out << YAML::Key << "expert_name" << YAML::Value << report.expert_name;
    out << YAML::Key << "status" << YAML::Value << report_status_name(report.status);
    out << YAML::Key << "started_at" << YAML::Value << report.started_at;
    out << YAML::Key << "completed_at" << YAML::Value;
    if (report.completed_at) out << *report.completed_at;
    else out << YAML::Null;
    out << YAML::Key << "summary" << YAML::Value << report.summary;

    out << YAML::Key << "details" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "findings" << YAML::Value << YAML::BeginSeq;
    for (const auto& f : report.findings) {
        out << YAML::BeginMap;
        out << YAML::Key << "description" << YAML::Value << f.description;
        out << YAML::Key << "severity" << YAML::Value << f.severity;
        if (f.file) out << YAML::Key << "file" << YAML::Value << *f.file;
        if (f.line) out << YAML::Key << "line" << YAML::Value << *f.line;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "recommendations" << YAML::Value << report.recommendations;
    out << YAML::Key << "files_modified" << YAML::Value << report.files_modified;
    out << YAML::Key << "files_created" << YAML::Value << report.files_created;
    out << YAML::EndMap;

    out << YAML::Key << "errors" << YAML::Value << report.errors;
    out << YAML::EndMap;

    return write_file_atomic(report_file(report.expert_id), std::string(out.c_str()) + "\n");
}

Result<std::optional<Report>> ReportStore::read(int expert_id) const {
    fs::path path = report_file(expert_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) return Result<std::optional<Report>>::Ok(std::nullopt);

    try {
        auto parsed = parse_report(YAML::LoadFile(path.string()));
        if (parsed.is_err()) {
            return Result<std::optional<Report>>::Err(
                fmt::format("Invalid report {}: {}", path.string(), parsed.error), parsed.kind);
        }
        const Report& r = parsed.value;
        auto problems = r.validate();
        if (!problems.empty()) {
            return Result<std::optional<Report>>::Err(
                fmt::format("Invalid report {}: {}", path.string(), problems.front()),
                ErrorKind::InvalidInput);
        }
        return Result<std::optional<Report>>::Ok(r);
    } catch (const YAML::Exception& e) {
        return Result<std::optional<Report>>::Err(
            fmt::format("Corrupt report {}: {}", path.string(), e.what()), ErrorKind::Io);
    }
}

Result<void> ReportStore::clear(int expert_id) {
    std::error_code ec;
    fs::remove(report_file(expert_id), ec);
    if (ec) {
        return Result<void>::Err(
            fmt::format("Cannot clear report for agent {}: {}", expert_id, ec.message()),
            ErrorKind::Io);
    }
    return Result<void>::Ok();
}

std::vector<Report> ReportStore::list() const {
    static const std::regex name_re(R"(expert(\d+)_report\.yaml)");

    std::vector<Report> out;
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return out;

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        std::smatch m;
        std::string name = entry.path().filename().string();
        if (!std::regex_match(name, m, name_re)) continue;

        int id = safe_stoi(m[1].str(), -1);
        if (id < 0) continue;
        auto r = read(id);
        if (r.is_err()) {
            crew_log("reports: skipping " + r.error);
            continue;
        }
        if (r.value) out.push_back(*r.value);
    }
    std::stable_sort(out.begin(), out.end(), [](const Report& a, const Report& b) {
        return a.started_at != b.started_at ? a.started_at < b.started_at
                                            : a.expert_id < b.expert_id;
    });
    return out;
}
