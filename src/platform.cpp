#include "gitadd/platform.hpp"

#include <clocale>
#include <cstdlib>
#include <string_view>

#include <unistd.h>

namespace gitadd::platform {

bool stdin_is_tty() {
    return ::isatty(STDIN_FILENO) != 0;
}

bool stdout_is_tty() {
    return ::isatty(STDOUT_FILENO) != 0;
}

bool supports_color(ColorPolicy policy) {
    switch (policy) {
    case ColorPolicy::Always:
        return true;
    case ColorPolicy::Never:
        return false;
    case ColorPolicy::Auto:
        break;
    }
    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
    if (const char* term = std::getenv("TERM"); term == nullptr || std::string_view{term} == "dumb") {
        return false;
    }
    return stdout_is_tty();
}

void use_system_locale() {
    std::setlocale(LC_ALL, "");
}

} // namespace gitadd::platform
