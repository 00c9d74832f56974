#include "engine/BinaryClassifier.hpp"

#include <algorithm>
#include <cstddef>

namespace gitpulse {

bool BinaryClassifier::isBinary(const std::string& content, size_t sniffBytes) {
    auto end = content.begin() + static_cast<std::ptrdiff_t>(std::min(content.size(), sniffBytes));
    return std::find(content.begin(), end, '\0') != end;
}

int64_t BinaryClassifier::countLines(const std::string& content) {
    int64_t count = std::count(content.begin(), content.end(), '\n');
    if (!content.empty() && content.back() != '\n') {
        ++count;
    }
    return count;
}

int64_t BinaryClassifier::countTextLines(const std::string& content) {
    return isBinary(content) ? 0 : countLines(content);
}

}
