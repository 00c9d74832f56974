#include "cli/commands/HelpCommand.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace gitpulse {

namespace {

void printCommandDetail(const ICommand& cmd) {
    std::cout << "NAME\n    " << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS\n    " << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION\n    " << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        std::cout << "OPTIONS\n";
        for (const auto& [opt, desc] : opts) {
            std::cout << "    " << opt << "\n        " << desc << "\n";
        }
        std::cout << "\n";
    }
}

void printEnvironment() {
    std::cout << "\nEnvironment:\n"
              << "  GITPULSE_LOG\tlog level: error, warn, info (default) or debug\n"
              << "  GITPULSE_PROXY\tdefault transport proxy for analyze\n"
              << "  GITPULSE_GIT\tgit executable used to clone (default: git)\n";
}

}

Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    if (!args.empty()) {
        const std::string& topic = args.front();
        auto cmd = CommandFactory::instance().create(topic);
        if (cmd) {
            printCommandDetail(*cmd);
            return {};
        }
        std::cerr << "Unknown help topic: " << topic << "\n\n";
    }

    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);

    std::cout << "usage: gitpulse <command> [args]\n\nCommands:\n";
    for (const auto& c : cmds) {
        std::cout << "  " << c->name() << "\t" << c->description() << "\n";
    }
    printEnvironment();
    return {};
}

}
