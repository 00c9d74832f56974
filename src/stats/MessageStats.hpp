#pragma once

#include <string>
#include <vector>

#include "model/GitStats.hpp"

namespace gitpulse::stats {

/**
 * @brief Length, merge, conventional-commit and word statistics over raw.commits
 *
 * A message is conventional when it starts with `type(scope)!:` (scope and
 * `!` optional). Known types are counted by name, anything else as other.
 * Word frequency uses the first line with that prefix stripped.
 */
CommitMessageStats analyzeCommitMessages(const RawDataBundle& raw);

/// Length of a UTF-8 string in UTF-16 code units
size_t utf16Length(const std::string& text);

/// Lowercased [a-z0-9] runs of at least three characters, stopwords removed
std::vector<std::string> messageWords(const std::string& firstLine);

bool isStopword(const std::string& word);

}
