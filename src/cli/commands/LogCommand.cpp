#include "cli/commands/LogCommand.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "cli/ArgParsing.hpp"
#include "core/Constants.hpp"
#include "core/Repository.hpp"
#include "util/Calendar.hpp"

namespace gitpulse {

namespace {

/// "+0530" -> 19800; malformed zones count as UTC
int64_t zoneOffsetSeconds(const std::string& zone) {
    if (zone.size() != 5 || (zone[0] != '+' && zone[0] != '-')) return 0;
    for (size_t i = 1; i < 5; ++i) {
        if (zone[i] < '0' || zone[i] > '9') return 0;
    }
    int64_t hours = (zone[1] - '0') * 10 + (zone[2] - '0');
    int64_t minutes = (zone[3] - '0') * 10 + (zone[4] - '0');
    int64_t offset = hours * 3600 + minutes * 60;
    return zone[0] == '-' ? -offset : offset;
}

/// Git's default date format in the author's own zone: "Mon Jan 1 09:30:00 2024 +0100"
std::string formatGitDate(int64_t timestamp, const std::string& zone) {
    static const char* const days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* const months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                         "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    calendar::CivilTime t = calendar::toCivil(timestamp + zoneOffsetSeconds(zone));
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s %s %d %02d:%02d:%02d %d", days[t.weekday], months[t.month - 1],
                  t.day, t.hour, t.minute, t.second, t.year);
    return std::string(buffer) + (zone.empty() ? "" : " " + zone);
}

}

/**
 * @brief Execute 'gitpulse log'
 *
 * Displays first-parent history, newest first. A shallow clone's history
 * ends at its boundary without an error.
 */
Expected<void> LogCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    std::filesystem::path path = std::filesystem::current_path();
    size_t maxCount = Constants::MAX_COMMIT_LOG;
    bool oneline = false;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--oneline") {
            oneline = true;
        } else if (args[i] == "--path") {
            auto value = cli::takeValue(args, i);
            if (!value) return value.error();
            path = value.value();
        } else if (args[i] == "--max-count" || args[i] == "-n") {
            const std::string flag = args[i];
            auto value = cli::takeValue(args, i);
            if (!value) return value.error();
            auto count = cli::parsePositive(flag, value.value());
            if (!count) return count.error();
            maxCount = count.value();
        } else {
            return Error{ErrorCode::InvalidArgs, "log: unknown argument " + args[i]};
        }
    }

    auto repo = Repository::open(path);
    if (!repo) return repo.error();

    auto head = repo.value()->resolveHead();
    if (!head) {
        if (head.error().code == ErrorCode::RefNotFound) {
            std::cout << "`your current branch does not have any commits yet`\n";
            return {};
        }
        return head.error();
    }

    auto history = repo.value()->firstParentHistory(head.value(), maxCount);
    if (!history) return history.error();

    for (const auto& commit : history.value()) {
        if (oneline) {
            std::cout << "\033[33m" << commit.shortHash() << "\033[0m " << commit.shortMessage() << "\n";
            continue;
        }
        std::cout << "\033[33mcommit " << commit.hash << "\033[0m\n";
        std::cout << "Author: " << commit.authorName << " <" << commit.authorEmail << ">\n";
        std::cout << "Date:   " << formatGitDate(commit.authorTimestamp, commit.authorTimezone) << "\n\n";

        std::istringstream iss(commit.message);
        std::string line;
        while (std::getline(iss, line)) {
            std::cout << "    " << line << "\n";
        }
        std::cout << "\n";
    }
    return {};
}

}
