#include "stats/MessageStats.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "core/Constants.hpp"

namespace gitpulse::stats {

namespace {
    bool isWordChar(char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    }

    struct ConventionalPrefix {
        std::string type;
        size_t length{0};   // through the ':'
    };

    /**
     * @brief Matches `type(scope)!:` at the start of @p text, on its first line
     *
     * Word characters, then an optional parenthesised scope closed by the
     * first ')' that is followed by an optional '!' and a ':'. One pass over
     * the line, so arbitrarily long subjects are safe.
     */
    std::optional<ConventionalPrefix> matchConventionalPrefix(const std::string& text) {
        const size_t end = std::min(text.find('\n'), text.size());
        size_t pos = 0;
        while (pos < end && isWordChar(text[pos])) ++pos;
        if (pos == 0) return std::nullopt;

        auto colonAfter = [&text, end](size_t at) -> size_t {
            if (at < end && text[at] == '!') ++at;
            return at < end && text[at] == ':' ? at + 1 : std::string::npos;
        };

        size_t matched = colonAfter(pos);
        if (matched == std::string::npos && pos < end && text[pos] == '(') {
            for (size_t close = text.find(')', pos + 1); close < end; close = text.find(')', close + 1)) {
                matched = colonAfter(close + 1);
                if (matched != std::string::npos) break;
            }
        }
        if (matched == std::string::npos) return std::nullopt;
        return ConventionalPrefix{text.substr(0, pos), matched};
    }

    int64_t* conventionalSlot(ConventionalCommitCounts& counts, const std::string& type) {
        static const std::unordered_map<std::string, int64_t ConventionalCommitCounts::*> slots = {
            {"feat", &ConventionalCommitCounts::feat},
            {"fix", &ConventionalCommitCounts::fix},
            {"docs", &ConventionalCommitCounts::docs},
            {"style", &ConventionalCommitCounts::style},
            {"refactor", &ConventionalCommitCounts::refactor},
            {"test", &ConventionalCommitCounts::test},
            {"chore", &ConventionalCommitCounts::chore},
            {"ci", &ConventionalCommitCounts::ci},
            {"perf", &ConventionalCommitCounts::perf},
            {"build", &ConventionalCommitCounts::build},
        };
        auto it = slots.find(type);
        return it == slots.end() ? &counts.other : &(counts.*(it->second));
    }

    std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    int64_t roundHalfUp(double value) {
        return static_cast<int64_t>(std::floor(value + 0.5));
    }
}

bool isStopword(const std::string& word) {
    static const std::unordered_set<std::string> stopwords = {
        "the", "a", "an", "and", "or", "but", "in", "on", "at", "to", "for",
        "of", "with", "by", "from", "is", "it", "that", "this", "was", "are",
        "be", "has", "had", "have", "not", "as", "we", "do", "if", "so",
        "no", "up", "out", "all", "can", "will", "just", "into", "when",
        "been", "some", "than", "its", "also", "more", "use", "new", "get",
        "set", "only", "should", "would", "could", "about", "which", "each",
        "make", "like", "them", "then", "now", "any", "my", "our", "their",
        "other", "these", "those", "may", "using",
    };
    return stopwords.count(word) > 0;
}

size_t utf16Length(const std::string& text) {
    size_t units = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) == 0x80) continue;   // continuation byte
        units += c >= 0xF0 ? 2 : 1;         // 4-byte sequences need a surrogate pair
    }
    return units;
}

std::vector<std::string> messageWords(const std::string& firstLine) {
    size_t start = 0;
    if (auto prefix = matchConventionalPrefix(firstLine)) {
        start = prefix->length;
        while (start < firstLine.size() && std::isspace(static_cast<unsigned char>(firstLine[start]))) ++start;
    }
    std::string cleaned = toLower(firstLine.substr(start));
    std::vector<std::string> words;
    std::string current;
    auto flush = [&]() {
        if (current.size() >= Constants::WORD_MIN_LENGTH && !isStopword(current)) {
            words.push_back(current);
        }
        current.clear();
    };
    for (char c : cleaned) {
        if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
            current += c;
        } else {
            flush();
        }
    }
    flush();
    return words;
}

CommitMessageStats analyzeCommitMessages(const RawDataBundle& raw) {
    CommitMessageStats stats;
    stats.totalCommits = static_cast<int64_t>(raw.commits.size());
    if (raw.commits.empty()) {
        return stats;
    }

    std::vector<size_t> lengths;
    lengths.reserve(raw.commits.size());
    int64_t conventionalCount = 0;
    std::vector<WordCount> words;
    std::unordered_map<std::string, size_t> wordIndex;

    for (const auto& commit : raw.commits) {
        const std::string& message = commit.message;
        lengths.push_back(utf16Length(message));

        if (message.rfind("Merge ", 0) == 0) {
            ++stats.mergeCommitCount;
        }

        if (auto prefix = matchConventionalPrefix(message)) {
            ++*conventionalSlot(stats.conventionalCommits, toLower(prefix->type));
            ++conventionalCount;
        }

        for (auto& word : messageWords(message.substr(0, message.find('\n')))) {
            auto [it, inserted] = wordIndex.emplace(word, words.size());
            if (inserted) words.push_back(WordCount{word, 0});
            ++words[it->second].count;
        }
    }

    double total = static_cast<double>(stats.totalCommits);
    size_t sum = 0;
    for (size_t length : lengths) sum += length;
    stats.averageLength = roundHalfUp(static_cast<double>(sum) / total);

    std::vector<size_t> sorted = lengths;
    std::sort(sorted.begin(), sorted.end());
    stats.medianLength = static_cast<int64_t>(sorted[sorted.size() / 2]);

    stats.conventionalPercentage = roundHalfUp(static_cast<double>(conventionalCount) / total * 100.0);

    std::stable_sort(words.begin(), words.end(),
                     [](const WordCount& a, const WordCount& b) { return a.count > b.count; });
    if (words.size() > Constants::WORD_FREQUENCY_LIMIT) {
        words.resize(Constants::WORD_FREQUENCY_LIMIT);
    }
    stats.wordFrequency = std::move(words);
    return stats;
}

}
