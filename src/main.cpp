// gitpulse: repository history statistics from the command line.

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/AnalyzeCommand.hpp"
#include "cli/commands/DiffCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/LogCommand.hpp"
#include "cli/commands/StatsCommand.hpp"
#include "util/Logger.hpp"

using namespace gitpulse;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("analyze", [] { return std::make_unique<AnalyzeCommand>(); });
    f.registerCreator("stats", [] { return std::make_unique<StatsCommand>(); });
    f.registerCreator("log", [] { return std::make_unique<LogCommand>(); });
    f.registerCreator("diff", [] { return std::make_unique<DiffCommand>(); });
}

static AppContext makeContext() {
    AppContext ctx;
    ctx.defaults = EngineOptions::fromEnvironment();
    if (const char* proxy = std::getenv("GITPULSE_PROXY")) {
        ctx.defaultProxy = proxy;
    }
    return ctx;
}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    AppContext ctx = makeContext();
    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        auto res = invoker.invoke(*cmd, ctx, {});
        return res ? 0 : 1;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        std::cerr << "gitpulse: '" << cmdName << "' is not a gitpulse command. Available:";
        for (const auto& name : CommandFactory::instance().names()) {
            std::cerr << " " << name;
        }
        std::cerr << "\n";
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
