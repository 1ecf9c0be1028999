#pragma once

#include <deque>
#include <string>
#include "tower_view.hpp"

// Line editing through readline's callback interface: characters are fed
// only when stdin is readable, so next() never blocks past its timeout.
// Only one instance may exist at a time.
class ReadlineInput : public InputSource {
public:
    explicit ReadlineInput(std::string prompt);
    ~ReadlineInput() override;

    ReadlineInput(const ReadlineInput&) = delete;
    ReadlineInput& operator=(const ReadlineInput&) = delete;

    InputEvent next(int timeout_ms) override;

    const std::string& prompt() const { return prompt_; }

private:
    static void on_line(char* line);
    static ReadlineInput* active_;

    std::string prompt_;
    std::deque<InputEvent> pending_;
};

// Full redraw of the agent table and recent messages, then the prompt.
class TerminalRenderer : public Renderer {
public:
    void render(const TowerView& view) override;
};

// "crew> " with readline's non-printing markers around the colors
std::string tower_prompt();
