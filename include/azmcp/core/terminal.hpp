#pragma once

namespace azmcp {

// ---------------------------------------------------------------------------
// ColorPolicy — inputs deciding whether stderr log lines carry ANSI colors.
// Colors need all of: requested by config, NO_COLOR unset, TERM not "dumb",
// stderr attached to a terminal.
// ---------------------------------------------------------------------------
struct ColorPolicy {
    bool requested = true;       // log.color / --no-color
    bool no_color_env = false;   // NO_COLOR present (https://no-color.org/)
    bool dumb_terminal = false;  // TERM=dumb
    bool stderr_tty = false;

    [[nodiscard]] bool UseColor() const noexcept {
        return requested && !no_color_env && !dumb_terminal && stderr_tty;
    }
};

/// Fill a ColorPolicy from the process environment and stderr.
ColorPolicy DetectColorPolicy(bool requested);

/// True if fd is connected to a terminal.
bool IsTerminal(int fd);

} // namespace azmcp
