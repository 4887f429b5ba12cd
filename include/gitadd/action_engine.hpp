#pragma once

#include <string>
#include <vector>

namespace gitadd {

class Repository;

// Staging mutations. The engine never touches a displayed model; callers
// reload through load_file_changes() afterwards.
class ActionEngine {
public:
    explicit ActionEngine(Repository& repository);

    // Both are no-ops for an empty path set and throw ExternalToolError on failure.
    void stage(const std::vector<std::string>& paths);
    void unstage(const std::vector<std::string>& paths);

private:
    Repository& repository_;
};

} // namespace gitadd
