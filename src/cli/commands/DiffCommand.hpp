#pragma once

#include "cli/ICommand.hpp"

namespace gitpulse {

class DiffCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "diff"; }
    const char* description() const override { return "Show per-file line counts for one commit"; }
    const char* helpNameLine() const override { return "diff -  Measure a commit against its first parent"; }
    const char* helpSynopsis() const override { return "gitpulse diff [<commit>] [--path <repo>] [--full]"; }
    const char* helpDescription() const override {
        return "Lists the files a commit changed with added and deleted line counts. The default fast mode "
               "estimates from change status alone; --full compares blob contents. <commit> is a full id or HEAD.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--path <repo>", "Repository (worktree or bare); default: current directory."},
            {"--full", "Count lines from blob contents instead of estimating."},
        };
    }
};

}
