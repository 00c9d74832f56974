#pragma once

#include "cli/ICommand.hpp"

namespace gitpulse {

class StatsCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "stats"; }
    const char* description() const override { return "Analyze a saved raw data bundle"; }
    const char* helpNameLine() const override { return "stats -  Recompute statistics from raw JSON"; }
    const char* helpSynopsis() const override {
        return "gitpulse stats <raw.json> [--owner <o>] [--repo <r>] [--output <file>] [--now <unix-seconds>]";
    }
    const char* helpDescription() const override {
        return "Reads a bundle written by `gitpulse analyze --raw` and prints the analysis as JSON. "
               "No network or repository access.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--owner <o>", "Owner name recorded in the output."},
            {"--repo <r>", "Repository name recorded in the output."},
            {"--output <file>", "Write JSON to <file> instead of stdout."},
            {"--now <unix-seconds>", "Reference time for the repository age (default: current time)."},
        };
    }
};

}
