#include "gitadd/action_engine.hpp"

#include "gitadd/logger.hpp"
#include "gitadd/repository.hpp"

namespace gitadd {

ActionEngine::ActionEngine(Repository& repository)
    : repository_(repository) {}

void ActionEngine::stage(const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return;
    }
    Logger::instance().info("staging {} path(s)", paths.size());
    repository_.add(paths);
}

void ActionEngine::unstage(const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return;
    }
    Logger::instance().info("unstaging {} path(s)", paths.size());
    repository_.reset(paths);
}

} // namespace gitadd
