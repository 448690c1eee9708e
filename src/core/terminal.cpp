#include <azmcp/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace azmcp {

bool IsTerminal(int fd) {
    if (fd < 0) return false;
#ifdef _WIN32
    return _isatty(fd) != 0;
#else
    return isatty(fd) != 0;
#endif
}

ColorPolicy DetectColorPolicy(bool requested) {
    ColorPolicy policy;
    policy.requested = requested;
    policy.no_color_env = std::getenv("NO_COLOR") != nullptr;

    const char* term = std::getenv("TERM");
    policy.dumb_terminal = term != nullptr && std::strcmp(term, "dumb") == 0;

#ifdef _WIN32
    policy.stderr_tty = IsTerminal(_fileno(stderr));
#else
    policy.stderr_tty = IsTerminal(STDERR_FILENO);
#endif
    return policy;
}

} // namespace azmcp
