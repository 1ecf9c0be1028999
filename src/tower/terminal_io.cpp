#include "terminal_io.hpp"
#include <cli/theme.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <readline/readline.h>
#include <readline/history.h>

ReadlineInput* ReadlineInput::active_ = nullptr;

ReadlineInput::ReadlineInput(std::string prompt) : prompt_(std::move(prompt)) {
    active_ = this;
    rl_callback_handler_install(prompt_.c_str(), &ReadlineInput::on_line);
}

ReadlineInput::~ReadlineInput() {
    rl_callback_handler_remove();
    if (active_ == this) active_ = nullptr;
}

void ReadlineInput::on_line(char* raw) {
    if (!active_) {
        free(raw);
        return;
    }
    if (!raw) {
        active_->pending_.push_back({InputEvent::Kind::Eof, ""});
        return;
    }
    std::string line = raw;
    free(raw);

    trim(line);
    if (line.empty()) return;
    add_history(line.c_str());
    active_->pending_.push_back({InputEvent::Kind::Line, line});
}

InputEvent ReadlineInput::next(int timeout_ms) {
    if (pending_.empty() && platform::poll_stdin(timeout_ms)) {
        rl_callback_read_char();
    }
    if (pending_.empty()) return {};

    InputEvent ev = pending_.front();
    pending_.pop_front();
    return ev;
}

// ── Rendering ───────────────────────────────────────────────

void TerminalRenderer::render(const TowerView& view) {
    std::string out = theme::banner(view.session_name);
    out += theme::kv("Project", view.project_path);
    out += theme::section("Agents");

    int width = platform::term_width();
    for (const auto& row : view.agents) {
        std::string where = row.branch ? theme::brown(*row.branch) : theme::dim("root");
        out += fmt::format("    {:>2}  {:<12} ", row.id, truncate_str(row.name, 12));
        out += theme::status(row.status);
        out += " " + where;
        if (row.operation) out += "  " + theme::yellow(*row.operation + "...");
        out += "\n";

        if (!row.activity.empty()) {
            size_t room = width > 20 ? static_cast<size_t>(width - 10) : 10;
            out += theme::dim("          " + truncate_str(row.activity, room)) + "\n";
        }
    }

    if (!view.messages.empty()) {
        out += theme::divider();
        for (const auto& msg : view.messages) {
            if (!msg.empty() && msg[0] == '!') {
                out += theme::warn(msg.substr(msg.size() > 1 ? 2 : 1));
            } else {
                out += theme::info(msg);
            }
        }
    }
    out += "\n";

    std::cout << out << std::flush;
    rl_on_new_line();
    rl_forced_update_display();
}

std::string tower_prompt() {
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };
    return rl_esc(theme::color::BROWN) + "crew" + rl_esc(theme::color::RESET) + "> ";
}
