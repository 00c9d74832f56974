#pragma once

#include <optional>

#include "cli/ICommand.hpp"
#include "engine/Messages.hpp"

namespace gitpulse {

/// Parsed `analyze` arguments
struct AnalyzeArgs {
    StartRequest request;
    bool raw{false};
    std::string outputPath;
};

class AnalyzeCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "analyze"; }
    const char* description() const override { return "Clone a GitHub repository and compute its statistics"; }
    const char* helpNameLine() const override { return "analyze -  Compute history statistics for owner/repo"; }
    const char* helpSynopsis() const override {
        return "gitpulse analyze <owner>/<repo> [--proxy <url>] [--mirror <dir>] [--raw] [--output <file>] "
               "[--full-diffs <n>] [--batch-size <n>] [--max-commits <n>] [--timeout <seconds>] "
               "[--idle-timeout <seconds>]";
    }
    const char* helpDescription() const override {
        return "Shallow-clones the repository into a scratch directory on a worker thread, walks its first-parent "
               "history, diffs every commit and prints the analysis as JSON. Progress goes to stderr.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"--proxy <url>", "HTTP proxy for the clone (default: $GITPULSE_PROXY)."},
            {"--mirror <dir>", "Copy <dir>/<owner>/<repo>[.git] instead of cloning."},
            {"--raw", "Print the raw data bundle instead of the analysis."},
            {"--output <file>", "Write JSON to <file> instead of stdout."},
            {"--full-diffs <n>", "Commits diffed line by line (default 30)."},
            {"--batch-size <n>", "Commits diffed concurrently (default 10)."},
            {"--max-commits <n>", "History depth (default 1000)."},
            {"--timeout <seconds>", "Kill the clone after this long (default 120)."},
            {"--idle-timeout <seconds>", "Abandon the run after this long without progress (default 120)."},
        };
    }

    /// Parse arguments on top of @p ctx's defaults
    static Expected<AnalyzeArgs> parse(const AppContext& ctx, const std::vector<std::string>& args);
};

}
