#include "cli/CommandFactory.hpp"

#include <algorithm>

namespace gitpulse {

CommandFactory& CommandFactory::instance() {
    static CommandFactory factory;
    return factory;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

std::vector<std::string> CommandFactory::names() const {
    std::vector<std::string> result;
    result.reserve(creators.size());
    for (const auto& [name, creator] : creators) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    for (const auto& name : names()) {
        out.push_back(creators.at(name)());
    }
}

}
