#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gitpulse {

/**
 * @brief Parsed git commit object
 *
 * Git commit format:
 *   tree <hash>
 *   parent <hash>            (zero or more)
 *   author Name <email> <timestamp> <timezone>
 *   committer Name <email> <timestamp> <timezone>
 *   (optional extra headers: gpgsig, encoding, mergetag ...)
 *
 *   <commit message>
 */
struct CommitObject {
    std::string hash;
    std::string treeHash;
    std::vector<std::string> parentHashes;  // 0 for root, 2+ for merges
    std::string authorName;
    std::string authorEmail;
    int64_t authorTimestamp{0};             // Unix seconds
    std::string authorTimezone;             // +0000, -0800, ...
    std::string committerName;
    std::string committerEmail;
    int64_t committerTimestamp{0};
    std::string committerTimezone;
    std::string message;

    /// First line of the message
    std::string shortMessage() const {
        size_t newlinePos = message.find('\n');
        if (newlinePos != std::string::npos) {
            return message.substr(0, newlinePos);
        }
        return message;
    }

    std::string shortHash() const {
        return hash.length() >= 7 ? hash.substr(0, 7) : hash;
    }

    /// Parent followed by first-parent history, empty for a root commit
    const std::string* firstParent() const {
        return parentHashes.empty() ? nullptr : &parentHashes.front();
    }
};

}
