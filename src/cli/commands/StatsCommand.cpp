#include "cli/commands/StatsCommand.hpp"

#include <chrono>

#include "cli/ArgParsing.hpp"
#include "model/Json.hpp"
#include "stats/GitStatsAnalyzer.hpp"

namespace gitpulse {

Expected<void> StatsCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    std::string input;
    std::string owner;
    std::string repo;
    std::string output;
    int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0) {
            if (!input.empty()) return Error{ErrorCode::InvalidArgs, "unexpected argument '" + arg + "'"};
            input = arg;
            continue;
        }
        auto value = cli::takeValue(args, i);
        if (!value) return value.error();
        if (arg == "--owner") {
            owner = value.value();
        } else if (arg == "--repo") {
            repo = value.value();
        } else if (arg == "--output") {
            output = value.value();
        } else if (arg == "--now") {
            auto seconds = cli::parsePositive(arg, value.value());
            if (!seconds) return seconds.error();
            now = static_cast<int64_t>(seconds.value());
        } else {
            return Error{ErrorCode::InvalidArgs, "unknown option " + arg};
        }
    }
    if (input.empty()) {
        return Error{ErrorCode::InvalidArgs, "stats: missing <raw.json>"};
    }

    auto raw = json::readRawFile(input);
    if (!raw) return raw.error();
    return json::writeOutput(output, json::encodeAnalysis(GitStatsAnalyzer::analyze(raw.value(), owner, repo, now), 2));
}

}
