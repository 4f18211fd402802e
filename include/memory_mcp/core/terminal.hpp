#pragma once

namespace memory_mcp {

/// Returns true if stderr is a terminal. Decides whether log lines get color.
bool IsStderrTty();

/// Returns true if stdin is a terminal. An interactive stdin usually means the
/// server was started by hand rather than by a peer.
bool IsStdinTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Color is used only when stderr is a TTY and NO_COLOR is unset; an explicit
/// preference from the config overrides the TTY check but not NO_COLOR.
bool ResolveLogColor(bool prefer_color, bool prefer_plain);

} // namespace memory_mcp
