#include "cli/commands/DiffCommand.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>

#include "cli/ArgParsing.hpp"
#include "core/Repository.hpp"
#include "engine/DiffEngine.hpp"

namespace gitpulse {

Expected<void> DiffCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    std::filesystem::path path = std::filesystem::current_path();
    std::string target = "HEAD";
    DiffMode mode = DiffMode::Fast;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--full") {
            mode = DiffMode::Full;
        } else if (args[i] == "--path") {
            auto value = cli::takeValue(args, i);
            if (!value) return value.error();
            path = value.value();
        } else if (args[i].rfind("--", 0) == 0) {
            return Error{ErrorCode::InvalidArgs, "diff: unknown option " + args[i]};
        } else {
            target = args[i];
        }
    }

    auto repo = Repository::open(path);
    if (!repo) return repo.error();

    std::string commitId = target;
    if (target == "HEAD") {
        auto head = repo.value()->resolveHead();
        if (!head) return head.error();
        commitId = head.value();
    }

    CommitObject commit;
    try {
        commit = repo.value()->objects().readCommit(commitId);
    } catch (const ObjectStoreError& e) {
        return Error{e.code(), e.what()};
    }

    DiffEngine engine(repo.value()->objects());
    auto detail = engine.diffCommit(commit, mode);
    if (!detail) return detail.error();

    const CommitDetail& d = detail.value();
    std::cout << "\033[33mcommit " << d.sha << "\033[0m (" << diffModeName(d.diffMode) << ")\n";
    for (const auto& file : d.files) {
        std::cout << std::left << std::setw(9) << changeStatusName(file.status)
                  << "\033[32m+" << std::setw(6) << file.additions << "\033[0m"
                  << "\033[31m-" << std::setw(6) << file.deletions << "\033[0m"
                  << file.filename << "\n";
    }
    std::cout << d.files.size() << " file(s) changed, " << d.stats.additions << " insertion(s)(+), "
              << d.stats.deletions << " deletion(s)(-)\n";
    return {};
}

}
