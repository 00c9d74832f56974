#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace gitpulse {

/// Runs a command and logs its error, if any, with the error code name
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
