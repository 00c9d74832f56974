#include "cli/commands/AnalyzeCommand.hpp"

#include <chrono>

#include "cli/ArgParsing.hpp"
#include "engine/StatsClient.hpp"
#include "engine/StatsWorker.hpp"
#include "model/Json.hpp"
#include "stats/GitStatsAnalyzer.hpp"
#include "util/Logger.hpp"

namespace gitpulse {

Expected<AnalyzeArgs> AnalyzeCommand::parse(const AppContext& ctx, const std::vector<std::string>& args) {
    AnalyzeArgs parsed;
    parsed.request.options = ctx.defaults;
    parsed.request.proxyUrl = ctx.defaultProxy;

    std::string slug;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--raw") {
            parsed.raw = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            if (!slug.empty()) {
                return Error{ErrorCode::InvalidArgs, "unexpected argument '" + arg + "'"};
            }
            slug = arg;
            continue;
        }

        auto value = cli::takeValue(args, i);
        if (!value) return value.error();

        if (arg == "--proxy") {
            parsed.request.proxyUrl = value.value();
        } else if (arg == "--mirror") {
            parsed.request.options.mirrorRoot = value.value();
        } else if (arg == "--output") {
            parsed.outputPath = value.value();
        } else {
            auto number = cli::parsePositive(arg, value.value());
            if (!number) return number.error();
            if (arg == "--full-diffs") {
                parsed.request.options.fullDiffBudget = number.value();
            } else if (arg == "--batch-size") {
                parsed.request.options.batchSize = number.value();
            } else if (arg == "--max-commits") {
                parsed.request.options.maxCommits = number.value();
            } else if (arg == "--timeout") {
                parsed.request.options.cloneTimeout = std::chrono::seconds(static_cast<long>(number.value()));
            } else if (arg == "--idle-timeout") {
                parsed.request.options.idleTimeout = std::chrono::seconds(static_cast<long>(number.value()));
            } else {
                return Error{ErrorCode::InvalidArgs, "unknown option " + arg};
            }
        }
    }

    size_t slash = slug.find('/');
    if (slug.empty() || slash == std::string::npos || slug.find('/', slash + 1) != std::string::npos) {
        return Error{ErrorCode::InvalidArgs, "expected <owner>/<repo>"};
    }
    parsed.request.owner = slug.substr(0, slash);
    parsed.request.repo = slug.substr(slash + 1);
    return parsed;
}

Expected<void> AnalyzeCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    auto parsed = parse(ctx, args);
    if (!parsed) return parsed.error();
    AnalyzeArgs& options = parsed.value();

    const std::string owner = options.request.owner;
    const std::string repo = options.request.repo;
    StatsClient client;

    auto raw = client.run(std::move(options.request), [](const ProgressMessage& progress) {
        Logger::instance().info(std::string("[") + stepName(progress.step) + " " +
                                std::to_string(progress.percent) + "%] " + progress.message);
    });
    if (!raw) {
        if (raw.error().code == ErrorCode::Timeout) {
            Logger::instance().info("Waiting for the abandoned run to clean up");
            StatsWorker::reapAbandoned();
        }
        return raw.error();
    }

    std::string text;
    if (options.raw) {
        text = json::encodeRaw(raw.value(), 2);
    } else {
        auto now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        text = json::encodeAnalysis(GitStatsAnalyzer::analyze(raw.value(), owner, repo, now), 2);
    }
    return json::writeOutput(options.outputPath, text);
}

}
