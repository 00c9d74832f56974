#include "stats/FileStats.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "core/Constants.hpp"

namespace gitpulse::stats {

namespace {
    const std::string& loginOf(const CommitDetail& detail) {
        return detail.authorLogin.empty() ? detail.author.name : detail.authorLogin;
    }

    template <typename T, typename Compare>
    void rankAndTruncate(std::vector<T>& items, size_t limit, Compare greater) {
        std::stable_sort(items.begin(), items.end(), greater);
        if (items.size() > limit) {
            items.resize(limit);
        }
    }
}

std::vector<FileChurnEntry> buildFileChurn(const RawDataBundle& raw) {
    std::vector<FileChurnEntry> entries;
    std::unordered_map<std::string, size_t> index;

    for (const auto& detail : raw.commitDetails) {
        const std::string& login = loginOf(detail);
        for (const auto& file : detail.files) {
            auto [it, inserted] = index.emplace(file.filename, entries.size());
            if (inserted) {
                FileChurnEntry entry;
                entry.filename = file.filename;
                entries.push_back(entry);
            }
            FileChurnEntry& entry = entries[it->second];
            ++entry.changeCount;
            entry.totalAdditions += file.additions;
            entry.totalDeletions += file.deletions;
            if (std::find(entry.contributors.begin(), entry.contributors.end(), login) == entry.contributors.end()) {
                entry.contributors.push_back(login);
            }
        }
    }

    rankAndTruncate(entries, Constants::FILE_CHURN_LIMIT, [](const FileChurnEntry& a, const FileChurnEntry& b) {
        return a.changeCount > b.changeCount;
    });
    return entries;
}

std::vector<FileCouplingPair> buildFileCoupling(const RawDataBundle& raw) {
    std::vector<FileCouplingPair> pairs;
    std::map<std::pair<std::string, std::string>, size_t> index;

    for (const auto& detail : raw.commitDetails) {
        size_t touched = detail.files.size();
        if (touched < Constants::COUPLING_MIN_FILES || touched > Constants::COUPLING_MAX_FILES) {
            continue;
        }

        std::set<std::string> distinct;
        for (const auto& file : detail.files) distinct.insert(file.filename);
        std::vector<std::string> names(distinct.begin(), distinct.end());
        if (names.size() > Constants::COUPLING_FILES_PER_COMMIT) {
            names.resize(Constants::COUPLING_FILES_PER_COMMIT);
        }

        for (size_t i = 0; i < names.size(); ++i) {
            for (size_t j = i + 1; j < names.size(); ++j) {
                auto [it, inserted] = index.emplace(std::make_pair(names[i], names[j]), pairs.size());
                if (inserted) {
                    pairs.push_back(FileCouplingPair{names[i], names[j], 0});
                }
                ++pairs[it->second].cochanges;
            }
        }
    }

    pairs.erase(std::remove_if(pairs.begin(), pairs.end(),
                               [](const FileCouplingPair& p) {
                                   return p.cochanges < static_cast<int64_t>(Constants::COUPLING_MIN_COCHANGES);
                               }),
                pairs.end());
    rankAndTruncate(pairs, Constants::COUPLING_LIMIT, [](const FileCouplingPair& a, const FileCouplingPair& b) {
        return a.cochanges > b.cochanges;
    });
    return pairs;
}

CommitSizeDistribution buildCommitSizeDistribution(const RawDataBundle& raw) {
    CommitSizeDistribution dist;
    dist.buckets = {
        {"0", 0, 0, 0},
        {"1-10", 1, 10, 0},
        {"11-50", 11, 50, 0},
        {"51-100", 51, 100, 0},
        {"101-500", 101, 500, 0},
        {"501-1000", 501, 1000, 0},
        {"1000+", 1001, std::nullopt, 0},
    };

    for (const auto& detail : raw.commitDetails) {
        int64_t size = detail.stats.additions + detail.stats.deletions;
        for (auto& bucket : dist.buckets) {
            if (size >= bucket.min && (!bucket.max || size <= *bucket.max)) {
                ++bucket.count;
                break;
            }
        }
    }
    return dist;
}

std::vector<LanguageEntry> buildLanguageBreakdown(const RawDataBundle& raw) {
    std::vector<LanguageEntry> entries;
    int64_t total = 0;
    for (const auto& [name, bytes] : raw.languages) total += bytes;
    if (total == 0) return entries;

    for (const auto& [name, bytes] : raw.languages) {
        double share = static_cast<double>(bytes) / static_cast<double>(total);
        entries.push_back(LanguageEntry{name, bytes, std::floor(share * 1000.0 + 0.5) / 10.0});
    }
    std::stable_sort(entries.begin(), entries.end(),
                     [](const LanguageEntry& a, const LanguageEntry& b) { return a.bytes > b.bytes; });
    return entries;
}

std::string extensionOf(const std::string& filename) {
    size_t slash = filename.rfind('/');
    std::string base = slash == std::string::npos ? filename : filename.substr(slash + 1);
    size_t dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "(no ext)";
    }
    std::string ext = base.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::vector<ExtensionCount> buildCommitsByExtension(const RawDataBundle& raw) {
    std::vector<ExtensionCount> counts;
    std::unordered_map<std::string, size_t> index;

    for (const auto& detail : raw.commitDetails) {
        std::unordered_set<std::string> seen;
        for (const auto& file : detail.files) {
            std::string ext = extensionOf(file.filename);
            if (!seen.insert(ext).second) continue;
            auto [it, inserted] = index.emplace(ext, counts.size());
            if (inserted) counts.push_back(ExtensionCount{ext, 0});
            ++counts[it->second].count;
        }
    }

    rankAndTruncate(counts, Constants::EXTENSION_LIMIT,
                    [](const ExtensionCount& a, const ExtensionCount& b) { return a.count > b.count; });
    return counts;
}

std::vector<ExtensionLines> buildLinesByExtension(const RawDataBundle& raw) {
    std::vector<ExtensionLines> lines;
    std::unordered_map<std::string, size_t> index;

    for (const auto& detail : raw.commitDetails) {
        for (const auto& file : detail.files) {
            std::string ext = extensionOf(file.filename);
            auto [it, inserted] = index.emplace(ext, lines.size());
            if (inserted) lines.push_back(ExtensionLines{ext, 0, 0});
            lines[it->second].additions += file.additions;
            lines[it->second].deletions += file.deletions;
        }
    }

    rankAndTruncate(lines, Constants::EXTENSION_LIMIT, [](const ExtensionLines& a, const ExtensionLines& b) {
        return a.additions + a.deletions > b.additions + b.deletions;
    });
    return lines;
}

}
