#pragma once

#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace gitpulse::cli {

/// Value following the flag at @p i; advances @p i past it
inline Expected<std::string> takeValue(const std::vector<std::string>& args, size_t& i) {
    if (i + 1 >= args.size()) {
        return Error{ErrorCode::InvalidArgs, args[i] + " requires a value"};
    }
    return args[++i];
}

/// Strictly positive decimal integer; 0, signs and trailing junk are rejected
inline Expected<size_t> parsePositive(const std::string& flag, const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return Error{ErrorCode::InvalidArgs, flag + ": expected a positive integer, got '" + text + "'"};
    }
    errno = 0;
    unsigned long long value = std::strtoull(text.c_str(), nullptr, 10);
    if (errno == ERANGE || value == 0) {
        return Error{ErrorCode::InvalidArgs, flag + ": expected a positive integer, got '" + text + "'"};
    }
    return static_cast<size_t>(value);
}

}
