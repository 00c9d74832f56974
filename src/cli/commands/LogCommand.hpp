#pragma once

#include "cli/ICommand.hpp"

namespace gitpulse {

class LogCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "log"; }
    const char* description() const override { return "Show first-parent commit history"; }
    const char* helpNameLine() const override { return "log -  Show commit logs"; }
    const char* helpSynopsis() const override { return "gitpulse log [--path <repo>] [--max-count <n>] [--oneline]"; }
    const char* helpDescription() const override {
        return "Show the first-parent history from HEAD, read directly from loose and packed objects.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--path <repo>", "Repository (worktree or bare); default: current directory."},
            {"--max-count <n>", "Limit the number of commits (default 10)."},
            {"--oneline", "Condense each commit to a single line."},
        };
    }
};

}
