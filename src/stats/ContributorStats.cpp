#include "stats/ContributorStats.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

#include "core/Constants.hpp"

namespace gitpulse::stats {

namespace {
    void sortByCommits(std::vector<ContributorSummary>& contributors) {
        std::stable_sort(contributors.begin(), contributors.end(),
                         [](const ContributorSummary& a, const ContributorSummary& b) {
                             return a.totalCommits > b.totalCommits;
                         });
    }

    std::vector<ContributorSummary> fromCommitList(const std::vector<CommitSummary>& commits) {
        std::vector<ContributorSummary> contributors;
        std::unordered_map<std::string, size_t> index;
        for (const auto& commit : commits) {
            const std::string& login = commit.authorLogin.empty() ? commit.author.name : commit.authorLogin;
            auto [it, inserted] = index.emplace(login, contributors.size());
            if (inserted) {
                ContributorSummary summary;
                summary.login = login;
                contributors.push_back(summary);
            }
            ++contributors[it->second].totalCommits;
        }

        const double total = static_cast<double>(commits.size());
        for (auto& c : contributors) {
            c.commitPercentage = total > 0 ? static_cast<double>(c.totalCommits) / total * 100.0 : 0.0;
        }
        sortByCommits(contributors);
        return contributors;
    }
}

std::vector<ContributorSummary> buildContributorSummary(const RawDataBundle& raw) {
    if (raw.contributorStats.empty()) {
        return fromCommitList(raw.commits);
    }

    int64_t totalCommits = 0;
    for (const auto& series : raw.contributorStats) {
        totalCommits += series.total;
    }

    std::vector<ContributorSummary> contributors;
    contributors.reserve(raw.contributorStats.size());
    for (const auto& series : raw.contributorStats) {
        ContributorSummary summary;
        summary.login = series.login;
        summary.totalCommits = series.total;
        bool active = false;
        for (const auto& week : series.weeks) {
            summary.totalAdditions += week.a;
            summary.totalDeletions += week.d;
            if (week.c > 0) {
                if (!active) summary.firstCommitWeek = week.w;
                active = true;
                summary.lastCommitWeek = week.w;
            }
        }
        summary.commitPercentage =
            totalCommits > 0 ? static_cast<double>(series.total) / static_cast<double>(totalCommits) * 100.0 : 0.0;
        contributors.push_back(summary);
    }
    sortByCommits(contributors);
    return contributors;
}

BusFactorData computeBusFactor(const std::vector<ContributorSummary>& contributors) {
    BusFactorData data;
    if (contributors.empty()) {
        return data;
    }

    std::vector<const ContributorSummary*> ranked;
    ranked.reserve(contributors.size());
    for (const auto& c : contributors) ranked.push_back(&c);
    std::stable_sort(ranked.begin(), ranked.end(), [](const ContributorSummary* a, const ContributorSummary* b) {
        return a->commitPercentage > b->commitPercentage;
    });

    double cumulative = 0.0;
    bool crossed = false;
    for (const ContributorSummary* c : ranked) {
        cumulative += c->commitPercentage;
        data.cumulativeContributors.push_back(CumulativeShare{c->login, cumulative});
        if (!crossed) {
            ++data.busFactor;
            crossed = cumulative >= Constants::BUS_FACTOR_THRESHOLD;
        }
    }

    for (const auto& c : contributors) {
        double share = c.commitPercentage / 100.0;
        data.herfindahlIndex += share * share;
    }
    return data;
}

}
