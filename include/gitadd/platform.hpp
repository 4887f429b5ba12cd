#pragma once

#include "gitadd/options.hpp"

namespace gitadd::platform {

[[nodiscard]] bool stdin_is_tty();
[[nodiscard]] bool stdout_is_tty();
[[nodiscard]] bool supports_color(ColorPolicy policy);

// Applies the user's locale so wide glyphs render in the terminal.
void use_system_locale();

} // namespace gitadd::platform
